// =============================================================================
// Unit tests for BindingRegistry
// Single active registration, rebind ordering, failure outcomes.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include "millionaire/input/BindingRegistry.h"
#include "millionaire/support/ConfigStore.h"
#include "TestDoubles.h"

#include <filesystem>
#include <initializer_list>

using namespace Millionaire;
using namespace MillionaireTest;

namespace
{

TriggerDescriptor trigger(std::initializer_list<Modifier> mods, KeyCode key)
{
    TriggerDescriptor t;
    for (Modifier m : mods)
        t.modifiers.add(m);
    t.key = key;
    return t;
}

PreferenceRecord recordWith(std::vector<std::string> mods, std::string key)
{
    PreferenceRecord r;
    r.shortcutModifiers = std::move(mods);
    r.shortcutKey = std::move(key);
    return r;
}

} // namespace

// ─── Startup ─────────────────────────────────────────────────────────────────

TEST_CASE("initialize registers the stored binding", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_init"));
    BindingRegistry registry(host, config);

    REQUIRE(registry.initialize(PreferenceRecord{}));
    REQUIRE(host.active.size() == 1);
    REQUIRE(host.active[0] == trigger({Modifier::Alt}, KeyCode::M));
    REQUIRE(registry.hasActiveBinding());
}

TEST_CASE("initialize with an unrecognized key starts without a hot-key", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_bogus"));
    BindingRegistry registry(host, config);

    REQUIRE_FALSE(registry.initialize(recordWith({"Alt"}, "NotAKey")));
    REQUIRE(host.registerCalls == 0);
    REQUIRE_FALSE(registry.hasActiveBinding());
}

TEST_CASE("initialize tolerates a platform rejection", "[BindingRegistry]")
{
    FakeTriggerHost host;
    host.rejectAll = true;
    ConfigStore config(tempConfigPath("br_init_reject"));
    BindingRegistry registry(host, config);

    REQUIRE_FALSE(registry.initialize(PreferenceRecord{}));
    REQUIRE(host.registerCalls == 1);
    REQUIRE_FALSE(registry.hasActiveBinding());
}

TEST_CASE("initialize with no modifiers registers a bare key", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_bare"));
    BindingRegistry registry(host, config);

    REQUIRE(registry.initialize(recordWith({}, "F9")));
    REQUIRE(registry.activeTrigger() == trigger({}, KeyCode::F9));
}

// ─── Replace ─────────────────────────────────────────────────────────────────

TEST_CASE("replaceBinding swaps to the new trigger only", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_swap"));
    BindingRegistry registry(host, config);
    registry.initialize(PreferenceRecord{});

    auto first = registry.replaceBinding({"Ctrl"}, "J");
    REQUIRE(first.ok());
    auto second = registry.replaceBinding({"Shift"}, "K");
    REQUIRE(second.ok());

    REQUIRE(host.active.size() == 1);
    REQUIRE(host.active[0] == trigger({Modifier::Shift}, KeyCode::K));
    REQUIRE(host.unregisterCalls == 2);
}

TEST_CASE("replaceBinding returns the glyph display string", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_display"));
    BindingRegistry registry(host, config);

    auto outcome = registry.replaceBinding({"Shift", "Cmd"}, "k");
    REQUIRE(outcome.ok());
    REQUIRE(outcome.display == "\xE2\x87\xA7\xE2\x8C\x98k");
    REQUIRE(outcome.message.empty());
}

TEST_CASE("replaceBinding persists the names as given", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_persist"));
    BindingRegistry registry(host, config);

    PreferenceRecord sized;
    sized.windowWidth = 450.0;
    sized.windowHeight = 520.0;
    REQUIRE(config.trySave(sized));

    REQUIRE(registry.replaceBinding({"ctrl", "Option"}, "F2").ok());

    auto stored = config.load();
    REQUIRE(stored.shortcutModifiers == std::vector<std::string>{"ctrl", "Option"});
    REQUIRE(stored.shortcutKey == "F2");
    REQUIRE(stored.windowWidth == 450.0);
    REQUIRE(stored.windowHeight == 520.0);

    BindingNames names = registry.currentBinding();
    REQUIRE(names.modifiers == std::vector<std::string>{"ctrl", "Option"});
    REQUIRE(names.key == "F2");
}

TEST_CASE("replaceBinding with an invalid key changes nothing", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_invalid"));
    BindingRegistry registry(host, config);
    registry.initialize(PreferenceRecord{});
    const int registersBefore = host.registerCalls;

    auto outcome = registry.replaceBinding({"Ctrl"}, "Banana");

    REQUIRE(outcome.error == BindingError::InvalidKey);
    REQUIRE(outcome.message == "Invalid key: Banana");
    REQUIRE(host.registerCalls == registersBefore);
    REQUIRE(host.unregisterCalls == 0);
    REQUIRE(registry.activeTrigger() == trigger({Modifier::Alt}, KeyCode::M));
    REQUIRE_FALSE(std::filesystem::exists(config.path()));
}

TEST_CASE("replaceBinding rejected by the platform leaves no trigger", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_reject"));
    BindingRegistry registry(host, config);
    registry.initialize(PreferenceRecord{});

    host.rejected.push_back(trigger({Modifier::Control}, KeyCode::Space));
    auto outcome = registry.replaceBinding({"Ctrl"}, "Space");

    REQUIRE(outcome.error == BindingError::RegistrationFailed);
    REQUIRE(outcome.message.rfind("Failed to register shortcut: ", 0) == 0);
    REQUIRE(host.active.empty());
    REQUIRE_FALSE(registry.hasActiveBinding());

    // Nothing persisted, and queries fall back to the default
    REQUIRE_FALSE(std::filesystem::exists(config.path()));
    REQUIRE(registry.currentBinding() == BindingNames{{"Alt"}, "M"});
}

TEST_CASE("replaceBinding recovers after a rejected rebind", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_recover"));
    BindingRegistry registry(host, config);

    host.rejectAll = true;
    REQUIRE_FALSE(registry.replaceBinding({"Alt"}, "Q").ok());
    host.rejectAll = false;

    REQUIRE(registry.replaceBinding({"Alt"}, "Q").ok());
    REQUIRE(host.active.size() == 1);
    REQUIRE(config.load().shortcutKey == "Q");
}

TEST_CASE("replaceBinding tolerates a failed unregister", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_unreg_fail"));
    BindingRegistry registry(host, config);
    registry.initialize(PreferenceRecord{});

    host.failUnregister = true;
    auto outcome = registry.replaceBinding({"Ctrl"}, "P");

    REQUIRE(outcome.ok());
    REQUIRE(registry.activeTrigger() == trigger({Modifier::Control}, KeyCode::P));
}

TEST_CASE("replaceBinding with the same combination re-registers it", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_same"));
    BindingRegistry registry(host, config);
    registry.initialize(PreferenceRecord{});

    REQUIRE(registry.replaceBinding({"Alt"}, "M").ok());
    REQUIRE(host.active.size() == 1);
    REQUIRE(host.unregisterCalls == 1);
}

// ─── Queries and shutdown ────────────────────────────────────────────────────

TEST_CASE("currentBinding defaults to Alt+M when nothing is active", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config;
    BindingRegistry registry(host, config);

    REQUIRE(registry.currentBinding() == BindingNames{{"Alt"}, "M"});
    REQUIRE_FALSE(registry.activeTrigger().has_value());
}

TEST_CASE("releaseAll unregisters the active trigger", "[BindingRegistry]")
{
    FakeTriggerHost host;
    ConfigStore config(tempConfigPath("br_release"));
    BindingRegistry registry(host, config);
    registry.initialize(PreferenceRecord{});

    registry.releaseAll();
    REQUIRE(host.active.empty());
    REQUIRE_FALSE(registry.hasActiveBinding());

    // Second release is a no-op
    registry.releaseAll();
    REQUIRE(host.unregisterCalls == 1);
}
