#pragma once
// =============================================================================
// Millionaire: KeyBindingCodec
// Translates user-authored modifier/key names into a TriggerDescriptor and
// renders bindings for menu labels. Pure, stateless.
// =============================================================================

#include "millionaire/common/Types.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Millionaire
{

namespace KeyBindingCodec
{

// Case-insensitive modifier lookup. Accepts Alt/Option, Ctrl/Control, Shift,
// Meta/Cmd/Command/Super. Returns nullopt for anything else.
std::optional<Modifier> parseModifierName(std::string_view token);

// nullopt means "no modifiers" (empty input), not "invalid".
// Unrecognized tokens are skipped.
std::optional<ModifierSet> decodeModifiers(const std::vector<std::string>& names);

// The only validation gate for key names.
std::optional<KeyCode> decodeKey(std::string_view name);

// Canonical spelling of a key ("M", "5", "F10", "Space", ...)
const char* keyName(KeyCode key);

// Canonical modifier names in fixed order: Alt, Control, Shift, Meta
std::vector<std::string> modifierNames(ModifierSet modifiers);

// Glyphs for present modifiers (⌥ ⌃ ⇧ ⌘, in that order) followed by the raw
// key name. UTF-8.
std::string formatDisplay(ModifierSet modifiers, const std::string& key);

// Convenience: decode names, then formatDisplay. Unknown modifier tokens are
// dropped, the key is rendered as given.
std::string formatDisplay(const BindingNames& binding);

// Every recognized key, in table order. Used to populate pickers.
const std::vector<KeyCode>& allKeys();

} // namespace KeyBindingCodec

} // namespace Millionaire
