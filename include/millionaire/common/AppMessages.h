#pragma once
// =============================================================================
// Millionaire: Application-Defined Messages & Command IDs
// Shared between main.cpp and TrayUI.cpp.
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>

namespace Millionaire
{

// Application-defined window messages
static constexpr UINT WM_TRAYICON = WM_APP + 1;

// Tray menu command IDs
static constexpr UINT IDM_SHOW_PANEL      = 40001;
static constexpr UINT IDM_PIN_PANEL       = 40002;
static constexpr UINT IDM_CHANGE_SHORTCUT = 40003;
static constexpr UINT IDM_EXIT            = 40004;

} // namespace Millionaire
