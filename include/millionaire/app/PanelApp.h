#pragma once
// =============================================================================
// Millionaire: PanelApp
// Application state object. Built once at startup, handed by reference to
// every event handler. Owns the config store, the binding registry, the
// visibility controller and the geometry tracker; borrows the platform
// trigger host and panel window.
//
// Exposes the front-end command surface (pin, shortcut, window size) and the
// host event entry points (trigger fired, focus, resize, tray command).
// =============================================================================

#include "millionaire/common/Types.h"
#include "millionaire/input/BindingRegistry.h"
#include "millionaire/logic/GeometryTracker.h"
#include "millionaire/logic/VisibilityController.h"
#include "millionaire/support/ConfigStore.h"

#include <string>
#include <vector>

namespace Millionaire
{

class TriggerHost;
class PanelWindow;

enum class TrayCommand
{
    ShowPanel,
    TogglePin,
    Quit,
};

class PanelApp
{
public:
    PanelApp(TriggerHost& triggers, PanelWindow& window);

    // Fix the config path, load preferences, register the stored hot-key.
    // Returns the loaded record so the host can size the window.
    // An unrecognized or rejected stored key leaves the app without a hot-key.
    PreferenceRecord startup(const std::string& configPath);

    // Release the hot-key.
    void shutdown();

    // ── Front-end commands ──
    void setPinned(bool pinned);
    bool getPinned() const;
    BindingOutcome updateShortcut(const std::vector<std::string>& modifiers,
                                  const std::string& key);
    BindingNames getShortcut() const;
    void saveWindowSize(double width, double height);

    // ── Host events ──
    void onTriggerFired();
    void onFocusChanged(bool focused);
    void onResized(PixelSize size);

    // Returns false when the command asks the process to quit.
    bool onTrayCommand(TrayCommand command);

    // "Show Panel (⌥M)", built from the current binding. UTF-8.
    std::string showPanelLabel() const;

    const ConfigStore& config() const { return config_; }
    const BindingRegistry& bindings() const { return bindings_; }
    VisibilityController& visibility() { return visibility_; }

private:
    PanelWindow& window_;
    ConfigStore config_;
    BindingRegistry bindings_;
    GeometryTracker geometry_;
    VisibilityController visibility_;
};

} // namespace Millionaire
