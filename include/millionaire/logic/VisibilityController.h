#pragma once
// =============================================================================
// Millionaire: VisibilityController
// Show/hide/toggle state of the panel and the pinned flag.
//
// Pinned suppresses auto-hide on focus loss. The flag has no other effect;
// the focus handler reads it when the event arrives.
// =============================================================================

#include <mutex>

namespace Millionaire
{

class PanelWindow;

class VisibilityController
{
public:
    enum class State
    {
        Hidden,
        Visible,
    };

    explicit VisibilityController(PanelWindow& window);

    // Visible -> hide; Hidden -> show()
    void toggle();

    // Anchor top-right of the primary display, show, focus.
    // Repositions again if already visible.
    void show();
    void hide();

    // Window focus changed. Hides on focus loss unless pinned.
    void onFocusChanged(bool focused);

    // Hot-key fired. Always toggles, whichever binding it was.
    void onTriggerFired() { toggle(); }

    void setPinned(bool pinned);
    bool isPinned() const;

    State state() const;

private:
    PanelWindow& window_;

    mutable std::mutex pinnedMutex_;
    bool pinned_ = false;
};

} // namespace Millionaire
