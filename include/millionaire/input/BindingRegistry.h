#pragma once
// =============================================================================
// Millionaire: BindingRegistry
// Owns the single active hot-key registration and swaps it on rebind.
//
// At most one trigger is registered at any time. A failed rebind leaves no
// trigger registered; the previous binding is not restored.
// =============================================================================

#include "millionaire/common/Types.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Millionaire
{

class TriggerHost;
class ConfigStore;
struct PreferenceRecord;

enum class BindingError
{
    None,
    InvalidKey,          // key name not recognized; nothing changed
    RegistrationFailed,  // platform refused; no trigger active
};

// Value-or-error result of a rebind. `message` is ready for display.
struct BindingOutcome
{
    BindingError error = BindingError::None;
    std::string  display;
    std::string  message;

    bool ok() const { return error == BindingError::None; }

    static BindingOutcome success(std::string display);
    static BindingOutcome failure(BindingError error, std::string message);
};

class BindingRegistry
{
public:
    BindingRegistry(TriggerHost& host, ConfigStore& config);

    // Startup: register the loaded binding if its key is recognized and the
    // platform accepts it. Otherwise log and stay without a hot-key.
    // Returns true if a trigger is active afterwards.
    bool initialize(const PreferenceRecord& record);

    // Unregister the current trigger (ignoring failure), register the new one,
    // persist on success. Returns the display string or the error.
    BindingOutcome replaceBinding(const std::vector<std::string>& modifiers,
                                  const std::string& key);

    // Active binding as authored, or the compiled-in default (Alt+M) when
    // nothing is active.
    BindingNames currentBinding() const;

    std::optional<TriggerDescriptor> activeTrigger() const;
    bool hasActiveBinding() const;

    // Shutdown: release the active trigger.
    void releaseAll();

private:
    struct ActiveBinding
    {
        BindingNames      names;
        TriggerDescriptor trigger;
    };

    std::optional<ActiveBinding> takeActive();
    void unregisterStale(const ActiveBinding& stale);

    TriggerHost& host_;
    ConfigStore& config_;

    mutable std::mutex activeMutex_;
    std::optional<ActiveBinding> active_;
};

} // namespace Millionaire
