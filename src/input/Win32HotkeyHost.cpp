// =============================================================================
// Millionaire: Win32HotkeyHost
// One hot-key id, reused across rebinds. BindingRegistry always unregisters
// before registering, so the id is free when registerTrigger runs.
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include "millionaire/input/Win32HotkeyHost.h"
#include "millionaire/input/VirtualKeys.h"

#include <windows.h>
#include <string>

#pragma comment(lib, "User32.lib")

namespace Millionaire
{

bool Win32HotkeyHost::registerTrigger(const TriggerDescriptor& trigger, std::string& error)
{
    if (registered_)
    {
        error = "another shortcut is still registered";
        return false;
    }

    const UINT vk = toVirtualKey(trigger.key);
    const UINT mods = toHotKeyModifiers(trigger.modifiers);

    if (!RegisterHotKey(static_cast<HWND>(msgWindow_), kHotkeyId, mods, vk))
    {
        DWORD code = GetLastError();
        if (code == ERROR_HOTKEY_ALREADY_REGISTERED)
            error = "the combination is already registered by another application";
        else
            error = "RegisterHotKey failed (error " + std::to_string(code) + ")";
        return false;
    }

    registered_ = trigger;
    return true;
}

bool Win32HotkeyHost::unregisterTrigger(const TriggerDescriptor& trigger)
{
    if (!registered_ || *registered_ != trigger)
        return false;

    registered_.reset();
    return UnregisterHotKey(static_cast<HWND>(msgWindow_), kHotkeyId) != FALSE;
}

} // namespace Millionaire
