#pragma once
// =============================================================================
// Millionaire: PanelWindow
// The managed floating panel as seen by the core. Implemented by
// Win32PanelWindow; faked in unit tests.
// =============================================================================

#include "millionaire/common/Types.h"

#include <optional>

namespace Millionaire
{

class PanelWindow
{
public:
    virtual ~PanelWindow() = default;

    virtual bool isVisible() const = 0;
    virtual void show() = 0;
    virtual void hide() = 0;
    virtual void setFocus() = 0;
    virtual void setPosition(ScreenPoint topLeft) = 0;

    // Outer size in physical pixels; nullopt if the window cannot be queried.
    virtual std::optional<PixelSize> outerSize() const = 0;

    // Primary monitor geometry; nullopt if unavailable.
    virtual std::optional<DisplayInfo> primaryDisplay() const = 0;

    // Scale factor of the monitor the window is on.
    virtual double scaleFactor() const = 0;
};

} // namespace Millionaire
