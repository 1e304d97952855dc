// =============================================================================
// Millionaire: BindingRegistry
// Atomic replace of the global hot-key registration.
//
// Locking: activeMutex_ guards only the read/write of active_. It is never
// held across a TriggerHost call, which may dispatch back into the app.
// =============================================================================

#include "millionaire/input/BindingRegistry.h"
#include "millionaire/input/KeyBindingCodec.h"
#include "millionaire/input/TriggerHost.h"
#include "millionaire/common/DebugLog.h"
#include "millionaire/support/ConfigStore.h"

#include <utility>

namespace Millionaire
{

BindingOutcome BindingOutcome::success(std::string display)
{
    BindingOutcome out;
    out.display = std::move(display);
    return out;
}

BindingOutcome BindingOutcome::failure(BindingError error, std::string message)
{
    BindingOutcome out;
    out.error = error;
    out.message = std::move(message);
    return out;
}

BindingRegistry::BindingRegistry(TriggerHost& host, ConfigStore& config)
    : host_(host), config_(config)
{
}

// ─── Startup ─────────────────────────────────────────────────────────────────

bool BindingRegistry::initialize(const PreferenceRecord& record)
{
    auto code = KeyBindingCodec::decodeKey(record.shortcutKey);
    if (!code)
    {
        debugLog("stored shortcut key '" + record.shortcutKey +
                 "' is not recognized, starting without a hot-key");
        return false;
    }

    TriggerDescriptor trigger;
    trigger.modifiers = KeyBindingCodec::decodeModifiers(record.shortcutModifiers)
                            .value_or(ModifierSet{});
    trigger.key = *code;

    std::string error;
    if (!host_.registerTrigger(trigger, error))
    {
        debugLog("could not register stored shortcut " +
                 KeyBindingCodec::formatDisplay(trigger.modifiers, record.shortcutKey) +
                 ": " + error);
        return false;
    }

    std::lock_guard<std::mutex> lock(activeMutex_);
    active_ = ActiveBinding{{record.shortcutModifiers, record.shortcutKey}, trigger};
    return true;
}

// ─── Replace ─────────────────────────────────────────────────────────────────

BindingOutcome BindingRegistry::replaceBinding(const std::vector<std::string>& modifiers,
                                               const std::string& key)
{
    // 1. Validate before touching anything
    auto code = KeyBindingCodec::decodeKey(key);
    if (!code)
        return BindingOutcome::failure(BindingError::InvalidKey, "Invalid key: " + key);

    TriggerDescriptor trigger;
    trigger.modifiers = KeyBindingCodec::decodeModifiers(modifiers).value_or(ModifierSet{});
    trigger.key = *code;

    // 2. Release the old registration
    if (auto stale = takeActive())
        unregisterStale(*stale);

    // 3. Claim the new one. On rejection no trigger stays active.
    std::string error;
    if (!host_.registerTrigger(trigger, error))
    {
        debugLog("shortcut registration rejected: " + error);
        return BindingOutcome::failure(BindingError::RegistrationFailed,
                                       "Failed to register shortcut: " + error);
    }

    // 4. Commit in memory, then persist
    {
        std::lock_guard<std::mutex> lock(activeMutex_);
        active_ = ActiveBinding{{modifiers, key}, trigger};
    }

    PreferenceRecord record = config_.load();
    record.shortcutModifiers = modifiers;
    record.shortcutKey = key;
    config_.save(record);

    return BindingOutcome::success(KeyBindingCodec::formatDisplay(trigger.modifiers, key));
}

std::optional<BindingRegistry::ActiveBinding> BindingRegistry::takeActive()
{
    std::lock_guard<std::mutex> lock(activeMutex_);
    std::optional<ActiveBinding> taken = std::move(active_);
    active_.reset();
    return taken;
}

void BindingRegistry::unregisterStale(const ActiveBinding& stale)
{
    if (!host_.unregisterTrigger(stale.trigger))
    {
        debugLog("could not unregister previous shortcut " +
                 KeyBindingCodec::formatDisplay(stale.trigger.modifiers, stale.names.key) +
                 ", superseding it");
    }
}

// ─── Queries ─────────────────────────────────────────────────────────────────

BindingNames BindingRegistry::currentBinding() const
{
    std::lock_guard<std::mutex> lock(activeMutex_);
    if (active_)
        return active_->names;
    return BindingNames{{"Alt"}, "M"};
}

std::optional<TriggerDescriptor> BindingRegistry::activeTrigger() const
{
    std::lock_guard<std::mutex> lock(activeMutex_);
    if (active_)
        return active_->trigger;
    return std::nullopt;
}

bool BindingRegistry::hasActiveBinding() const
{
    std::lock_guard<std::mutex> lock(activeMutex_);
    return active_.has_value();
}

void BindingRegistry::releaseAll()
{
    if (auto stale = takeActive())
        unregisterStale(*stale);
}

} // namespace Millionaire
