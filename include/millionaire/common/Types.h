#pragma once
// =============================================================================
// Millionaire: Common Types
// Shared data structures, constants, and type aliases.
// =============================================================================

#include <cstdint>
#include <string>
#include <vector>

namespace Millionaire
{

// Screen coordinate pair (physical pixels)
struct ScreenPoint
{
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const ScreenPoint& o) const { return x == o.x && y == o.y; }
};

// Size in physical pixels, as reported by the window system
struct PixelSize
{
    uint32_t width = 0;
    uint32_t height = 0;
};

// Size in logical (scale-independent) units, as persisted
struct LogicalSize
{
    double width = 0.0;
    double height = 0.0;
};

// Primary display geometry
struct DisplayInfo
{
    PixelSize size;
    double scaleFactor = 1.0;
};

// Modifier keys. Values are bit positions in ModifierSet.
enum class Modifier : uint8_t
{
    Alt     = 1 << 0,
    Control = 1 << 1,
    Shift   = 1 << 2,
    Meta    = 1 << 3,
};

// Order-independent set of modifiers; duplicates collapse.
struct ModifierSet
{
    uint8_t bits = 0;

    void add(Modifier m) { bits |= static_cast<uint8_t>(m); }
    bool has(Modifier m) const { return (bits & static_cast<uint8_t>(m)) != 0; }
    bool empty() const { return bits == 0; }

    bool operator==(const ModifierSet& o) const { return bits == o.bits; }
    bool operator!=(const ModifierSet& o) const { return bits != o.bits; }
};

// Keys accepted for a global binding
enum class KeyCode : uint8_t
{
    A, B, C, D, E, F, G, H, I, J, K, L, M,
    N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
    Digit0, Digit1, Digit2, Digit3, Digit4,
    Digit5, Digit6, Digit7, Digit8, Digit9,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    Space,
    Enter,
    Escape,
    Tab,
};

// Normalized (modifiers, key) pair handed to the platform trigger subsystem
struct TriggerDescriptor
{
    ModifierSet modifiers;
    KeyCode key = KeyCode::M;

    bool operator==(const TriggerDescriptor& o) const
    {
        return modifiers == o.modifiers && key == o.key;
    }
    bool operator!=(const TriggerDescriptor& o) const { return !(*this == o); }
};

// User-facing binding as authored (spellings preserved)
struct BindingNames
{
    std::vector<std::string> modifiers;
    std::string key;

    bool operator==(const BindingNames& o) const
    {
        return modifiers == o.modifiers && key == o.key;
    }
};

} // namespace Millionaire
