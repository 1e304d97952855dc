// =============================================================================
// Unit tests for GeometryTracker
// Logical size persistence, anchor math, restored-size clamp.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "millionaire/logic/GeometryTracker.h"
#include "millionaire/support/ConfigStore.h"
#include "TestDoubles.h"

#include <limits>

using namespace Millionaire;
using namespace MillionaireTest;
using Catch::Approx;

TEST_CASE("onResized stores logical size", "[GeometryTracker]")
{
    ConfigStore config(tempConfigPath("geo_resize"));
    GeometryTracker geo(config);

    geo.onResized(PixelSize{600, 800}, 2.0);

    auto stored = config.load();
    REQUIRE(stored.windowWidth == Approx(300.0));
    REQUIRE(stored.windowHeight == Approx(400.0));
}

TEST_CASE("onResized with a fractional scale", "[GeometryTracker]")
{
    ConfigStore config(tempConfigPath("geo_frac"));
    GeometryTracker geo(config);

    geo.onResized(PixelSize{450, 375}, 1.5);

    auto stored = config.load();
    REQUIRE(stored.windowWidth == Approx(300.0));
    REQUIRE(stored.windowHeight == Approx(250.0));
}

TEST_CASE("onResized treats a zero scale as 1.0", "[GeometryTracker]")
{
    ConfigStore config(tempConfigPath("geo_zero"));
    GeometryTracker geo(config);

    geo.onResized(PixelSize{350, 360}, 0.0);
    REQUIRE(config.load().windowWidth == Approx(350.0));
}

TEST_CASE("saveWindowSize keeps the binding fields", "[GeometryTracker]")
{
    ConfigStore config(tempConfigPath("geo_keep"));
    PreferenceRecord existing;
    existing.shortcutModifiers = {"Ctrl", "Shift"};
    existing.shortcutKey = "K";
    REQUIRE(config.trySave(existing));

    GeometryTracker geo(config);
    geo.saveWindowSize(512.0, 384.0);

    auto stored = config.load();
    REQUIRE(stored.shortcutModifiers == std::vector<std::string>{"Ctrl", "Shift"});
    REQUIRE(stored.shortcutKey == "K");
    REQUIRE(stored.windowWidth == Approx(512.0));
    REQUIRE(stored.windowHeight == Approx(384.0));
}

TEST_CASE("saveWindowSize without a path is harmless", "[GeometryTracker]")
{
    ConfigStore config;
    GeometryTracker geo(config);
    geo.saveWindowSize(400.0, 400.0);
    REQUIRE(config.load() == PreferenceRecord{});
}

TEST_CASE("anchorPosition at scale 1", "[GeometryTracker]")
{
    auto pt = GeometryTracker::anchorPosition(PixelSize{280, 300},
                                              DisplayInfo{PixelSize{1920, 1080}, 1.0});
    REQUIRE(pt.x == 1630);
    REQUIRE(pt.y == 30);
}

TEST_CASE("anchorPosition at scale 2", "[GeometryTracker]")
{
    auto pt = GeometryTracker::anchorPosition(PixelSize{560, 600},
                                              DisplayInfo{PixelSize{2560, 1440}, 2.0});
    REQUIRE(pt.x == 2560 - 560 - 20);
    REQUIRE(pt.y == 60);
}

TEST_CASE("anchorPosition truncates fractional margins", "[GeometryTracker]")
{
    auto pt = GeometryTracker::anchorPosition(PixelSize{350, 375},
                                              DisplayInfo{PixelSize{1920, 1080}, 1.25});
    // 10 * 1.25 = 12.5 -> 12, 30 * 1.25 = 37.5 -> 37
    REQUIRE(pt.x == 1920 - 350 - 12);
    REQUIRE(pt.y == 37);
}

TEST_CASE("anchorPosition may go negative for an oversized window", "[GeometryTracker]")
{
    auto pt = GeometryTracker::anchorPosition(PixelSize{2000, 300},
                                              DisplayInfo{PixelSize{1920, 1080}, 1.0});
    REQUIRE(pt.x == -90);
}

TEST_CASE("fallbackPixelSize scales the default", "[GeometryTracker]")
{
    auto size = GeometryTracker::fallbackPixelSize(2.0);
    REQUIRE(size.width == 560);
    REQUIRE(size.height == 600);
}

TEST_CASE("restoredSize clamps to the minimum", "[GeometryTracker]")
{
    PreferenceRecord r;
    r.windowWidth = 100.0;
    r.windowHeight = 900.0;
    auto size = GeometryTracker::restoredSize(r);
    REQUIRE(size.width == Approx(280.0));
    REQUIRE(size.height == Approx(900.0));

    r.windowWidth = std::numeric_limits<double>::quiet_NaN();
    r.windowHeight = -5.0;
    size = GeometryTracker::restoredSize(r);
    REQUIRE(size.width == Approx(280.0));
    REQUIRE(size.height == Approx(300.0));
}
