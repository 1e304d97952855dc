// =============================================================================
// Millionaire: VisibilityController
// Panel visibility state machine.
// =============================================================================

#include "millionaire/logic/VisibilityController.h"
#include "millionaire/logic/GeometryTracker.h"
#include "millionaire/output/PanelWindow.h"

namespace Millionaire
{

VisibilityController::VisibilityController(PanelWindow& window)
    : window_(window)
{
}

VisibilityController::State VisibilityController::state() const
{
    return window_.isVisible() ? State::Visible : State::Hidden;
}

void VisibilityController::toggle()
{
    if (state() == State::Visible)
        hide();
    else
        show();
}

void VisibilityController::show()
{
    // No display info: show where the window already is
    if (auto display = window_.primaryDisplay())
    {
        PixelSize size = window_.outerSize().value_or(
            GeometryTracker::fallbackPixelSize(display->scaleFactor));
        window_.setPosition(GeometryTracker::anchorPosition(size, *display));
    }
    window_.show();
    window_.setFocus();
}

void VisibilityController::hide()
{
    window_.hide();
}

void VisibilityController::onFocusChanged(bool focused)
{
    if (focused)
        return;
    if (isPinned())
        return;
    hide();
}

void VisibilityController::setPinned(bool pinned)
{
    std::lock_guard<std::mutex> lock(pinnedMutex_);
    pinned_ = pinned;
}

bool VisibilityController::isPinned() const
{
    std::lock_guard<std::mutex> lock(pinnedMutex_);
    return pinned_;
}

} // namespace Millionaire
