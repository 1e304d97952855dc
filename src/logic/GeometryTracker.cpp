// =============================================================================
// Millionaire: GeometryTracker
// Size persistence and top-right anchoring.
// =============================================================================

#include "millionaire/logic/GeometryTracker.h"
#include "millionaire/support/ConfigStore.h"

#include <algorithm>
#include <cmath>

namespace Millionaire
{

// Guards against a zero/negative scale from a misbehaving display query
static double sanitizeScale(double scaleFactor)
{
    return (scaleFactor > 0.0 && std::isfinite(scaleFactor)) ? scaleFactor : 1.0;
}

GeometryTracker::GeometryTracker(ConfigStore& config)
    : config_(config)
{
}

void GeometryTracker::onResized(PixelSize size, double scaleFactor)
{
    const double scale = sanitizeScale(scaleFactor);
    saveWindowSize(static_cast<double>(size.width) / scale,
                   static_cast<double>(size.height) / scale);
}

void GeometryTracker::saveWindowSize(double width, double height)
{
    PreferenceRecord record = config_.load();
    record.windowWidth = width;
    record.windowHeight = height;
    config_.save(record);
}

ScreenPoint GeometryTracker::anchorPosition(PixelSize windowSize, const DisplayInfo& display)
{
    const double scale = sanitizeScale(display.scaleFactor);
    const auto margin = static_cast<int32_t>(kAnchorSideMargin * scale);
    const auto topMargin = static_cast<int32_t>(kAnchorTopMargin * scale);

    ScreenPoint pt;
    pt.x = static_cast<int32_t>(display.size.width) - static_cast<int32_t>(windowSize.width) - margin;
    pt.y = topMargin;
    return pt;
}

PixelSize GeometryTracker::fallbackPixelSize(double scaleFactor)
{
    const double scale = sanitizeScale(scaleFactor);
    return PixelSize{static_cast<uint32_t>(kDefaultWindowWidth * scale),
                     static_cast<uint32_t>(kDefaultWindowHeight * scale)};
}

LogicalSize GeometryTracker::restoredSize(const PreferenceRecord& record)
{
    auto clampDim = [](double v, double minimum) {
        return std::isfinite(v) ? std::max(v, minimum) : minimum;
    };

    LogicalSize size;
    size.width = clampDim(record.windowWidth, kDefaultWindowWidth);
    size.height = clampDim(record.windowHeight, kDefaultWindowHeight);
    return size;
}

} // namespace Millionaire
