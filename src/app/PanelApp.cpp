// =============================================================================
// Millionaire: PanelApp
// Wiring between host events, front-end commands and the core components.
// =============================================================================

#include "millionaire/app/PanelApp.h"
#include "millionaire/input/KeyBindingCodec.h"
#include "millionaire/output/PanelWindow.h"

namespace Millionaire
{

PanelApp::PanelApp(TriggerHost& triggers, PanelWindow& window)
    : window_(window),
      bindings_(triggers, config_),
      geometry_(config_),
      visibility_(window)
{
}

PreferenceRecord PanelApp::startup(const std::string& configPath)
{
    if (!configPath.empty())
        config_.setPath(configPath);

    PreferenceRecord record = config_.load();
    bindings_.initialize(record);
    return record;
}

void PanelApp::shutdown()
{
    bindings_.releaseAll();
}

// ─── Front-end commands ──────────────────────────────────────────────────────

void PanelApp::setPinned(bool pinned)
{
    visibility_.setPinned(pinned);
}

bool PanelApp::getPinned() const
{
    return visibility_.isPinned();
}

BindingOutcome PanelApp::updateShortcut(const std::vector<std::string>& modifiers,
                                        const std::string& key)
{
    return bindings_.replaceBinding(modifiers, key);
}

BindingNames PanelApp::getShortcut() const
{
    return bindings_.currentBinding();
}

void PanelApp::saveWindowSize(double width, double height)
{
    geometry_.saveWindowSize(width, height);
}

// ─── Host events ─────────────────────────────────────────────────────────────

void PanelApp::onTriggerFired()
{
    visibility_.onTriggerFired();
}

void PanelApp::onFocusChanged(bool focused)
{
    visibility_.onFocusChanged(focused);
}

void PanelApp::onResized(PixelSize size)
{
    geometry_.onResized(size, window_.scaleFactor());
}

bool PanelApp::onTrayCommand(TrayCommand command)
{
    switch (command)
    {
    case TrayCommand::ShowPanel:
        visibility_.show();
        return true;
    case TrayCommand::TogglePin:
        visibility_.setPinned(!visibility_.isPinned());
        return true;
    case TrayCommand::Quit:
        return false;
    }
    return true;
}

std::string PanelApp::showPanelLabel() const
{
    return "Show Panel (" + KeyBindingCodec::formatDisplay(bindings_.currentBinding()) + ")";
}

} // namespace Millionaire
