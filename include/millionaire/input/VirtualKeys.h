#pragma once
// =============================================================================
// Millionaire: Virtual-Key Mapping
// Converts KeyCode / ModifierSet into the VK_* and MOD_* values taken by
// RegisterHotKey. Used by Win32HotkeyHost.
// =============================================================================

#include "millionaire/common/Types.h"

#include <cstdint>

#ifdef _WIN32
#include <windows.h>
#else
// VK/MOD constants for non-Windows builds (unit testing on Linux)
#ifndef VK_TAB
#define VK_TAB        0x09
#define VK_RETURN     0x0D
#define VK_ESCAPE     0x1B
#define VK_SPACE      0x20
#define VK_F1         0x70
#define MOD_ALT       0x0001
#define MOD_CONTROL   0x0002
#define MOD_SHIFT     0x0004
#define MOD_WIN       0x0008
#define MOD_NOREPEAT  0x4000
#endif
#endif

namespace Millionaire
{

inline uint32_t toVirtualKey(KeyCode key)
{
    const auto k = static_cast<uint32_t>(key);

    if (key >= KeyCode::A && key <= KeyCode::Z)
        return 'A' + (k - static_cast<uint32_t>(KeyCode::A));
    if (key >= KeyCode::Digit0 && key <= KeyCode::Digit9)
        return '0' + (k - static_cast<uint32_t>(KeyCode::Digit0));
    if (key >= KeyCode::F1 && key <= KeyCode::F12)
        return VK_F1 + (k - static_cast<uint32_t>(KeyCode::F1));

    switch (key)
    {
    case KeyCode::Space:  return VK_SPACE;
    case KeyCode::Enter:  return VK_RETURN;
    case KeyCode::Escape: return VK_ESCAPE;
    case KeyCode::Tab:    return VK_TAB;
    default:              return 0;
    }
}

// MOD_NOREPEAT keeps a held chord from re-firing the toggle.
inline uint32_t toHotKeyModifiers(ModifierSet modifiers)
{
    uint32_t mods = MOD_NOREPEAT;
    if (modifiers.has(Modifier::Alt))     mods |= MOD_ALT;
    if (modifiers.has(Modifier::Control)) mods |= MOD_CONTROL;
    if (modifiers.has(Modifier::Shift))   mods |= MOD_SHIFT;
    if (modifiers.has(Modifier::Meta))    mods |= MOD_WIN;
    return mods;
}

} // namespace Millionaire
