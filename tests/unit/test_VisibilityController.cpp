// =============================================================================
// Unit tests for VisibilityController
// Toggle, anchoring on show, pinned auto-hide suppression.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include "millionaire/logic/VisibilityController.h"
#include "TestDoubles.h"

using namespace Millionaire;
using namespace MillionaireTest;

using State = VisibilityController::State;

TEST_CASE("Initial state follows the window", "[VisibilityController]")
{
    FakePanelWindow window;
    VisibilityController vc(window);
    REQUIRE(vc.state() == State::Hidden);

    window.visible = true;
    REQUIRE(vc.state() == State::Visible);
}

TEST_CASE("toggle alternates hidden and visible", "[VisibilityController]")
{
    FakePanelWindow window;
    VisibilityController vc(window);

    vc.toggle();
    REQUIRE(vc.state() == State::Visible);
    REQUIRE(window.focusCalls == 1);

    vc.toggle();
    REQUIRE(vc.state() == State::Hidden);
    REQUIRE(window.hideCalls == 1);
}

TEST_CASE("onTriggerFired toggles", "[VisibilityController]")
{
    FakePanelWindow window;
    VisibilityController vc(window);

    vc.onTriggerFired();
    REQUIRE(window.visible);
    vc.onTriggerFired();
    REQUIRE_FALSE(window.visible);
}

TEST_CASE("show anchors top-right of the primary display", "[VisibilityController]")
{
    FakePanelWindow window;
    VisibilityController vc(window);

    vc.show();
    REQUIRE(window.position.x == 1920 - 280 - 10);
    REQUIRE(window.position.y == 30);
    REQUIRE(window.visible);
    REQUIRE(window.focusCalls == 1);
}

TEST_CASE("show scales margins with the display", "[VisibilityController]")
{
    FakePanelWindow window;
    window.display = DisplayInfo{PixelSize{3840, 2160}, 2.0};
    window.size = PixelSize{560, 600};
    VisibilityController vc(window);

    vc.show();
    REQUIRE(window.position.x == 3840 - 560 - 20);
    REQUIRE(window.position.y == 60);
}

TEST_CASE("show when already visible repositions again", "[VisibilityController]")
{
    FakePanelWindow window;
    VisibilityController vc(window);

    vc.show();
    window.position = ScreenPoint{0, 0};
    vc.show();

    REQUIRE(window.positionCalls == 2);
    REQUIRE(window.position.x == 1630);
    REQUIRE(window.visible);
}

TEST_CASE("show without display info skips positioning", "[VisibilityController]")
{
    FakePanelWindow window;
    window.display.reset();
    VisibilityController vc(window);

    vc.show();
    REQUIRE(window.positionCalls == 0);
    REQUIRE(window.visible);
    REQUIRE(window.focusCalls == 1);
}

TEST_CASE("show without an outer size uses the default size", "[VisibilityController]")
{
    FakePanelWindow window;
    window.size.reset();
    window.display = DisplayInfo{PixelSize{1920, 1080}, 1.5};
    VisibilityController vc(window);

    vc.show();
    // 280 * 1.5 = 420 wide, margin 15
    REQUIRE(window.position.x == 1920 - 420 - 15);
    REQUIRE(window.position.y == 45);
}

TEST_CASE("Focus loss hides when not pinned", "[VisibilityController]")
{
    FakePanelWindow window;
    VisibilityController vc(window);
    vc.show();

    vc.onFocusChanged(false);
    REQUIRE(vc.state() == State::Hidden);
}

TEST_CASE("Focus loss keeps the panel when pinned", "[VisibilityController]")
{
    FakePanelWindow window;
    VisibilityController vc(window);
    vc.setPinned(true);
    vc.show();

    vc.onFocusChanged(false);
    REQUIRE(vc.state() == State::Visible);
    REQUIRE(window.hideCalls == 0);
}

TEST_CASE("Focus gain never changes visibility", "[VisibilityController]")
{
    FakePanelWindow window;
    VisibilityController vc(window);

    vc.onFocusChanged(true);
    REQUIRE(vc.state() == State::Hidden);
    REQUIRE(window.showCalls == 0);
}

TEST_CASE("Pinned does not block explicit hide or toggle", "[VisibilityController]")
{
    FakePanelWindow window;
    VisibilityController vc(window);
    vc.setPinned(true);
    vc.show();

    vc.toggle();
    REQUIRE(vc.state() == State::Hidden);
}

TEST_CASE("Unpinning restores auto-hide on the next focus loss", "[VisibilityController]")
{
    FakePanelWindow window;
    VisibilityController vc(window);
    vc.setPinned(true);
    vc.show();
    vc.onFocusChanged(false);
    REQUIRE(window.visible);

    vc.setPinned(false);
    REQUIRE_FALSE(vc.isPinned());
    vc.onFocusChanged(false);
    REQUIRE_FALSE(window.visible);
}
