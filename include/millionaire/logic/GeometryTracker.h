#pragma once
// =============================================================================
// Millionaire: GeometryTracker
// Persists panel size on resize and computes the show-time anchor position.
// No debouncing: resize events are human-rate.
// =============================================================================

#include "millionaire/common/Types.h"

namespace Millionaire
{

class ConfigStore;
struct PreferenceRecord;

// Offsets from the top-right corner of the primary display, logical pixels
inline constexpr double kAnchorSideMargin = 10.0;
inline constexpr double kAnchorTopMargin  = 30.0;

class GeometryTracker
{
public:
    explicit GeometryTracker(ConfigStore& config);

    // Native resize: pixels / scaleFactor, then load-modify-save.
    void onResized(PixelSize size, double scaleFactor);

    // Explicit save from the UI layer, already in logical units.
    void saveWindowSize(double width, double height);

    // Top-right anchor for a window of the given outer size.
    static ScreenPoint anchorPosition(PixelSize windowSize, const DisplayInfo& display);

    // Outer size to assume when the window cannot report one.
    static PixelSize fallbackPixelSize(double scaleFactor);

    // Persisted size clamped to the minimum panel size.
    static LogicalSize restoredSize(const PreferenceRecord& record);

private:
    ConfigStore& config_;
};

} // namespace Millionaire
