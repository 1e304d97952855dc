#pragma once
// =============================================================================
// Millionaire: TrayUI
// System tray icon, context menu, shortcut editor window.
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>
#include <string>

namespace Millionaire
{

// Forward declarations to minimize header deps
class PanelApp;

class TrayUI
{
public:
    bool create(HINSTANCE hInstance, HWND msgWindow, PanelApp& app);
    void destroy();

    void onTrayMessage(LPARAM lParam);  // Route WM_TRAYICON notifications
    void showShortcutWindow();          // Create or bring to foreground
    HWND shortcutHwnd() const;          // For IsDialogMessage in message pump
    void recreateTrayIcon();            // Re-add after Explorer restart

private:
    HINSTANCE hInstance_ = nullptr;
    HWND msgWindow_ = nullptr;
    PanelApp* app_ = nullptr;

    HWND shortcutHwnd_ = nullptr;

    bool addTrayIcon();
    void removeTrayIcon();
    void showContextMenu();
    void createShortcutWindow();
    void populateFromBinding();
    void applyShortcut();
    void setStatus(const std::wstring& text);

    friend LRESULT CALLBACK shortcutWndProc(HWND, UINT, WPARAM, LPARAM);
};

} // namespace Millionaire
