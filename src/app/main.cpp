// =============================================================================
// Millionaire: Application Entry Point
// WinMain, message pump, component wiring, lifecycle.
//
// Single thread: the message pump delivers hot-key, tray, focus and resize
// events one at a time to PanelApp.
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>

#include "millionaire/app/PanelApp.h"
#include "millionaire/common/AppMessages.h"
#include "millionaire/common/DebugLog.h"
#include "millionaire/input/Win32HotkeyHost.h"
#include "millionaire/logic/GeometryTracker.h"
#include "millionaire/output/Win32PanelWindow.h"
#include "millionaire/support/ConfigStore.h"
#include "millionaire/support/TrayUI.h"

#include <string>

// Components. PanelApp borrows the hot-key host and the panel window.
static Millionaire::Win32HotkeyHost g_hotkeys;
static Millionaire::Win32PanelWindow g_panelWindow;
static Millionaire::PanelApp g_app(g_hotkeys, g_panelWindow);
static Millionaire::TrayUI g_trayUI;

using Millionaire::WM_TRAYICON;
using Millionaire::IDM_SHOW_PANEL;
using Millionaire::IDM_PIN_PANEL;
using Millionaire::IDM_CHANGE_SHORTCUT;
using Millionaire::IDM_EXIT;

// Explorer restart detection
static UINT WM_TASKBAR_CREATED = 0;

// Hidden window that owns the hot-key and the tray icon
static HWND g_msgWindow = nullptr;

static bool s_shutdownDone = false;

// ── Panel Callbacks ─────────────────────────────────────────────────────────

static void onPanelFocus(bool focused, void* ud)
{
    static_cast<Millionaire::PanelApp*>(ud)->onFocusChanged(focused);
}

static void onPanelResized(Millionaire::PixelSize size, void* ud)
{
    static_cast<Millionaire::PanelApp*>(ud)->onResized(size);
}

// ── Shutdown ────────────────────────────────────────────────────────────────

// Persist the final size through the explicit save path, drop the hot-key.
static void shutdownComponents()
{
    if (s_shutdownDone)
        return;
    s_shutdownDone = true;

    if (g_panelWindow.hwnd())
    {
        Millionaire::LogicalSize size = g_panelWindow.logicalClientSize();
        g_app.saveWindowSize(size.width, size.height);
    }

    g_trayUI.destroy();
    g_app.shutdown();
}

// ── Message Window ──────────────────────────────────────────────────────────

static LRESULT CALLBACK msgWndProc(HWND hWnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    switch (msg)
    {
    case WM_HOTKEY:
        if (wParam == Millionaire::Win32HotkeyHost::kHotkeyId)
            g_app.onTriggerFired();
        return 0;

    case WM_TRAYICON:
        g_trayUI.onTrayMessage(lParam);
        return 0;

    case WM_COMMAND:
        switch (LOWORD(wParam))
        {
        case IDM_SHOW_PANEL:
            g_app.onTrayCommand(Millionaire::TrayCommand::ShowPanel);
            return 0;
        case IDM_PIN_PANEL:
            g_app.onTrayCommand(Millionaire::TrayCommand::TogglePin);
            return 0;
        case IDM_CHANGE_SHORTCUT:
            g_trayUI.showShortcutWindow();
            return 0;
        case IDM_EXIT:
            if (!g_app.onTrayCommand(Millionaire::TrayCommand::Quit))
                PostQuitMessage(0);
            return 0;
        }
        break;

    case WM_ENDSESSION:
        if (wParam)
            shutdownComponents();
        return 0;

    default:
        // Explorer restart: re-add tray icon
        if (WM_TASKBAR_CREATED && msg == WM_TASKBAR_CREATED)
        {
            g_trayUI.recreateTrayIcon();
            return 0;
        }
        break;
    }
    return DefWindowProcW(hWnd, msg, wParam, lParam);
}

static HWND createMessageWindow(HINSTANCE hInstance)
{
    WNDCLASSEXW wc = {};
    wc.cbSize = sizeof(WNDCLASSEXW);
    wc.lpfnWndProc = msgWndProc;
    wc.hInstance = hInstance;
    wc.lpszClassName = L"MillionaireMsgWindow";

    RegisterClassExW(&wc);

    // Hidden top-level window (not HWND_MESSAGE) so it receives broadcast
    // messages like WM_ENDSESSION and TaskbarCreated.
    return CreateWindowExW(
        0, L"MillionaireMsgWindow", nullptr,
        0, 0, 0, 0, 0,
        nullptr,
        nullptr, hInstance, nullptr);
}

// Per-monitor v2 where available so sizes and positions are physical pixels
static void enableDpiAwareness()
{
    HMODULE hUser32 = GetModuleHandleW(L"user32.dll");
    if (hUser32)
    {
        using SetContextFn = BOOL(WINAPI*)(HANDLE);
        auto fn = reinterpret_cast<SetContextFn>(
            GetProcAddress(hUser32, "SetProcessDpiAwarenessContext"));
        if (fn && fn(reinterpret_cast<HANDLE>(-4))) // DPI_AWARENESS_CONTEXT_PER_MONITOR_AWARE_V2
            return;
    }
    SetProcessDPIAware();
}

int WINAPI wWinMain(
    _In_ HINSTANCE hInstance,
    _In_opt_ HINSTANCE /*hPrevInstance*/,
    _In_ LPWSTR /*lpCmdLine*/,
    _In_ int /*nCmdShow*/)
{
    enableDpiAwareness();

    // ── 1. Message window (hot-key target, tray owner) ──────────────────────
    g_msgWindow = createMessageWindow(hInstance);
    if (!g_msgWindow)
    {
        MessageBoxW(nullptr, L"Failed to create the application window.",
                    L"Millionaire \u2014 Startup Error", MB_OK | MB_ICONERROR);
        return 1;
    }
    g_hotkeys.setMessageWindow(g_msgWindow);

    // ── 2. Preferences + stored hot-key ─────────────────────────────────────
    // A missing hot-key is not fatal: the tray still works and the user can
    // rebind from "Change Shortcut...".
    std::string configPath = Millionaire::ConfigStore::getDefaultConfigPath();
    if (configPath.empty())
        Millionaire::debugLog("no per-user data directory, preferences will not persist");
    Millionaire::PreferenceRecord prefs = g_app.startup(configPath);

    // ── 3. Panel window, hidden until shown ─────────────────────────────────
    if (!g_panelWindow.create(hInstance, Millionaire::GeometryTracker::restoredSize(prefs)))
    {
        MessageBoxW(nullptr, L"Failed to create the panel window.",
                    L"Millionaire \u2014 Startup Error", MB_OK | MB_ICONERROR);
        g_app.shutdown();
        DestroyWindow(g_msgWindow);
        return 1;
    }
    g_panelWindow.setCallbacks(onPanelFocus, onPanelResized, &g_app);

    // ── 4. Tray ─────────────────────────────────────────────────────────────
    WM_TASKBAR_CREATED = RegisterWindowMessageW(L"TaskbarCreated");
    if (!g_trayUI.create(hInstance, g_msgWindow, g_app))
        Millionaire::debugLog("tray icon unavailable, hot-key only");

    // ── 5. Message pump ─────────────────────────────────────────────────────
    MSG msg;
    while (GetMessageW(&msg, nullptr, 0, 0) > 0)
    {
        // Tab navigation in the shortcut window
        HWND hShortcut = g_trayUI.shortcutHwnd();
        if (hShortcut && IsDialogMessage(hShortcut, &msg))
            continue;

        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }

    // ── 6. Shutdown ─────────────────────────────────────────────────────────
    shutdownComponents();
    g_panelWindow.destroy();
    DestroyWindow(g_msgWindow);
    g_msgWindow = nullptr;

    return 0;
}
