// =============================================================================
// Millionaire: KeyBindingCodec
// Name <-> enum normalization for modifiers and keys.
// =============================================================================

#include "millionaire/input/KeyBindingCodec.h"

#include <algorithm>
#include <cctype>

namespace Millionaire
{

namespace KeyBindingCodec
{

namespace
{

std::string toUpper(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

struct KeyEntry
{
    KeyCode code;
    const char* name;   // canonical, upper-case form used for matching
    const char* alias;  // optional second spelling
};

// Table order defines allKeys() order.
const KeyEntry kKeyTable[] = {
    {KeyCode::A, "A", nullptr}, {KeyCode::B, "B", nullptr}, {KeyCode::C, "C", nullptr},
    {KeyCode::D, "D", nullptr}, {KeyCode::E, "E", nullptr}, {KeyCode::F, "F", nullptr},
    {KeyCode::G, "G", nullptr}, {KeyCode::H, "H", nullptr}, {KeyCode::I, "I", nullptr},
    {KeyCode::J, "J", nullptr}, {KeyCode::K, "K", nullptr}, {KeyCode::L, "L", nullptr},
    {KeyCode::M, "M", nullptr}, {KeyCode::N, "N", nullptr}, {KeyCode::O, "O", nullptr},
    {KeyCode::P, "P", nullptr}, {KeyCode::Q, "Q", nullptr}, {KeyCode::R, "R", nullptr},
    {KeyCode::S, "S", nullptr}, {KeyCode::T, "T", nullptr}, {KeyCode::U, "U", nullptr},
    {KeyCode::V, "V", nullptr}, {KeyCode::W, "W", nullptr}, {KeyCode::X, "X", nullptr},
    {KeyCode::Y, "Y", nullptr}, {KeyCode::Z, "Z", nullptr},

    {KeyCode::Digit0, "0", "DIGIT0"}, {KeyCode::Digit1, "1", "DIGIT1"},
    {KeyCode::Digit2, "2", "DIGIT2"}, {KeyCode::Digit3, "3", "DIGIT3"},
    {KeyCode::Digit4, "4", "DIGIT4"}, {KeyCode::Digit5, "5", "DIGIT5"},
    {KeyCode::Digit6, "6", "DIGIT6"}, {KeyCode::Digit7, "7", "DIGIT7"},
    {KeyCode::Digit8, "8", "DIGIT8"}, {KeyCode::Digit9, "9", "DIGIT9"},

    {KeyCode::F1, "F1", nullptr},   {KeyCode::F2, "F2", nullptr},
    {KeyCode::F3, "F3", nullptr},   {KeyCode::F4, "F4", nullptr},
    {KeyCode::F5, "F5", nullptr},   {KeyCode::F6, "F6", nullptr},
    {KeyCode::F7, "F7", nullptr},   {KeyCode::F8, "F8", nullptr},
    {KeyCode::F9, "F9", nullptr},   {KeyCode::F10, "F10", nullptr},
    {KeyCode::F11, "F11", nullptr}, {KeyCode::F12, "F12", nullptr},

    {KeyCode::Space, "SPACE", nullptr},
    {KeyCode::Enter, "ENTER", nullptr},
    {KeyCode::Escape, "ESCAPE", "ESC"},
    {KeyCode::Tab, "TAB", nullptr},
};

// Display spellings for the named (non-alphanumeric) keys
const char* namedKeySpelling(KeyCode key)
{
    switch (key)
    {
    case KeyCode::Space:  return "Space";
    case KeyCode::Enter:  return "Enter";
    case KeyCode::Escape: return "Escape";
    case KeyCode::Tab:    return "Tab";
    default:              return nullptr;
    }
}

} // namespace

std::optional<Modifier> parseModifierName(std::string_view token)
{
    const std::string upper = toUpper(token);

    if (upper == "ALT" || upper == "OPTION")
        return Modifier::Alt;
    if (upper == "CTRL" || upper == "CONTROL")
        return Modifier::Control;
    if (upper == "SHIFT")
        return Modifier::Shift;
    if (upper == "META" || upper == "COMMAND" || upper == "CMD" || upper == "SUPER")
        return Modifier::Meta;
    return std::nullopt;
}

std::optional<ModifierSet> decodeModifiers(const std::vector<std::string>& names)
{
    if (names.empty())
        return std::nullopt;

    ModifierSet set;
    for (const auto& name : names)
    {
        if (auto m = parseModifierName(name))
            set.add(*m);
    }
    return set;
}

std::optional<KeyCode> decodeKey(std::string_view name)
{
    const std::string upper = toUpper(name);
    for (const auto& entry : kKeyTable)
    {
        if (upper == entry.name || (entry.alias && upper == entry.alias))
            return entry.code;
    }
    return std::nullopt;
}

const char* keyName(KeyCode key)
{
    if (const char* named = namedKeySpelling(key))
        return named;
    for (const auto& entry : kKeyTable)
    {
        if (entry.code == key)
            return entry.name;
    }
    return "";
}

std::vector<std::string> modifierNames(ModifierSet modifiers)
{
    std::vector<std::string> names;
    if (modifiers.has(Modifier::Alt))     names.emplace_back("Alt");
    if (modifiers.has(Modifier::Control)) names.emplace_back("Control");
    if (modifiers.has(Modifier::Shift))   names.emplace_back("Shift");
    if (modifiers.has(Modifier::Meta))    names.emplace_back("Meta");
    return names;
}

std::string formatDisplay(ModifierSet modifiers, const std::string& key)
{
    std::string out;
    if (modifiers.has(Modifier::Alt))     out += "\xE2\x8C\xA5"; // ⌥
    if (modifiers.has(Modifier::Control)) out += "\xE2\x8C\x83"; // ⌃
    if (modifiers.has(Modifier::Shift))   out += "\xE2\x87\xA7"; // ⇧
    if (modifiers.has(Modifier::Meta))    out += "\xE2\x8C\x98"; // ⌘
    out += key;
    return out;
}

std::string formatDisplay(const BindingNames& binding)
{
    return formatDisplay(decodeModifiers(binding.modifiers).value_or(ModifierSet{}), binding.key);
}

const std::vector<KeyCode>& allKeys()
{
    static const std::vector<KeyCode> keys = [] {
        std::vector<KeyCode> v;
        for (const auto& entry : kKeyTable)
            v.push_back(entry.code);
        return v;
    }();
    return keys;
}

} // namespace KeyBindingCodec

} // namespace Millionaire
