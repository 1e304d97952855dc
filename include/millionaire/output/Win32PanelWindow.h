#pragma once
// =============================================================================
// Millionaire: Win32PanelWindow
// Undecorated, resizable, topmost popup hidden from the taskbar. Starts
// hidden. Forwards activation and resize to the app through callbacks.
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>

#include "millionaire/output/PanelWindow.h"

namespace Millionaire
{

class Win32PanelWindow : public PanelWindow
{
public:
    using FocusCallback  = void (*)(bool focused, void* userData);
    using ResizeCallback = void (*)(PixelSize clientSize, void* userData);

    // Create at the given logical client size (scaled by system DPI).
    bool create(HINSTANCE hInstance, LogicalSize clientSize);
    void destroy();

    // Installed after create() so the initial WM_SIZE is not persisted.
    void setCallbacks(FocusCallback onFocus, ResizeCallback onResize, void* userData);

    HWND hwnd() const { return hwnd_; }

    // Client area in logical units, for the exit-time size save.
    LogicalSize logicalClientSize() const;

    bool isVisible() const override;
    void show() override;
    void hide() override;
    void setFocus() override;
    void setPosition(ScreenPoint topLeft) override;
    std::optional<PixelSize> outerSize() const override;
    std::optional<DisplayInfo> primaryDisplay() const override;
    double scaleFactor() const override;

private:
    static LRESULT CALLBACK wndProc(HWND hWnd, UINT msg, WPARAM wParam, LPARAM lParam);
    LRESULT handleMessage(UINT msg, WPARAM wParam, LPARAM lParam);

    HWND hwnd_ = nullptr;
    FocusCallback onFocus_ = nullptr;
    ResizeCallback onResize_ = nullptr;
    void* userData_ = nullptr;
};

} // namespace Millionaire
