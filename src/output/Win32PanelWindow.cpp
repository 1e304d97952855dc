// =============================================================================
// Millionaire: Win32PanelWindow
// Host window for the floating panel.
// =============================================================================

#include "millionaire/output/Win32PanelWindow.h"
#include "millionaire/support/ConfigStore.h"

#include <cmath>

#pragma comment(lib, "User32.lib")

namespace Millionaire
{

static constexpr const wchar_t* kPanelClassName = L"MillionairePanel";
static constexpr DWORD kPanelStyle   = WS_POPUP | WS_THICKFRAME;
static constexpr DWORD kPanelExStyle = WS_EX_TOPMOST | WS_EX_TOOLWINDOW;

// GetDpiForWindow / GetDpiForSystem are Windows 10 1607+. Resolve at runtime.
static UINT dpiForWindow(HWND hWnd)
{
    HMODULE hUser32 = GetModuleHandleW(L"user32.dll");
    if (hUser32 && hWnd)
    {
        using GetDpiForWindowFn = UINT(WINAPI*)(HWND);
        auto fn = reinterpret_cast<GetDpiForWindowFn>(GetProcAddress(hUser32, "GetDpiForWindow"));
        if (fn)
        {
            UINT dpi = fn(hWnd);
            if (dpi != 0)
                return dpi;
        }
    }
    return 96;
}

static UINT dpiForSystem()
{
    HMODULE hUser32 = GetModuleHandleW(L"user32.dll");
    if (hUser32)
    {
        using GetDpiForSystemFn = UINT(WINAPI*)();
        auto fn = reinterpret_cast<GetDpiForSystemFn>(GetProcAddress(hUser32, "GetDpiForSystem"));
        if (fn)
            return fn();
    }
    return 96;
}

static int scaleToDpi(double logical, UINT dpi)
{
    return static_cast<int>(std::lround(logical * static_cast<double>(dpi) / 96.0));
}

// ── Lifecycle ───────────────────────────────────────────────────────────────

bool Win32PanelWindow::create(HINSTANCE hInstance, LogicalSize clientSize)
{
    WNDCLASSEXW wc = {};
    wc.cbSize = sizeof(WNDCLASSEXW);
    wc.lpfnWndProc = wndProc;
    wc.hInstance = hInstance;
    wc.hCursor = LoadCursorW(nullptr, IDC_ARROW);
    wc.hbrBackground = reinterpret_cast<HBRUSH>(COLOR_WINDOW + 1);
    wc.lpszClassName = kPanelClassName;
    RegisterClassExW(&wc);

    const UINT dpi = dpiForSystem();
    RECT rc = {0, 0, scaleToDpi(clientSize.width, dpi), scaleToDpi(clientSize.height, dpi)};
    AdjustWindowRectEx(&rc, kPanelStyle, FALSE, kPanelExStyle);

    hwnd_ = CreateWindowExW(
        kPanelExStyle, kPanelClassName, L"Millionaire",
        kPanelStyle,
        CW_USEDEFAULT, CW_USEDEFAULT, rc.right - rc.left, rc.bottom - rc.top,
        nullptr, nullptr, hInstance, this);

    return hwnd_ != nullptr;
}

void Win32PanelWindow::destroy()
{
    onFocus_ = nullptr;
    onResize_ = nullptr;
    if (hwnd_)
    {
        DestroyWindow(hwnd_);
        hwnd_ = nullptr;
    }
}

void Win32PanelWindow::setCallbacks(FocusCallback onFocus, ResizeCallback onResize, void* userData)
{
    onFocus_ = onFocus;
    onResize_ = onResize;
    userData_ = userData;
}

// ── PanelWindow ─────────────────────────────────────────────────────────────

bool Win32PanelWindow::isVisible() const
{
    return hwnd_ && IsWindowVisible(hwnd_) != FALSE;
}

void Win32PanelWindow::show()
{
    if (hwnd_)
        ShowWindow(hwnd_, SW_SHOW);
}

void Win32PanelWindow::hide()
{
    if (hwnd_)
        ShowWindow(hwnd_, SW_HIDE);
}

void Win32PanelWindow::setFocus()
{
    if (!hwnd_)
        return;
    SetForegroundWindow(hwnd_);
    SetFocus(hwnd_);
}

void Win32PanelWindow::setPosition(ScreenPoint topLeft)
{
    if (hwnd_)
        SetWindowPos(hwnd_, HWND_TOPMOST, topLeft.x, topLeft.y, 0, 0,
                     SWP_NOSIZE | SWP_NOACTIVATE);
}

std::optional<PixelSize> Win32PanelWindow::outerSize() const
{
    RECT rc;
    if (!hwnd_ || !GetWindowRect(hwnd_, &rc))
        return std::nullopt;
    return PixelSize{static_cast<uint32_t>(rc.right - rc.left),
                     static_cast<uint32_t>(rc.bottom - rc.top)};
}

std::optional<DisplayInfo> Win32PanelWindow::primaryDisplay() const
{
    // Physical pixels under per-monitor DPI awareness
    int w = GetSystemMetrics(SM_CXSCREEN);
    int h = GetSystemMetrics(SM_CYSCREEN);
    if (w <= 0 || h <= 0)
        return std::nullopt;

    DisplayInfo info;
    info.size = PixelSize{static_cast<uint32_t>(w), static_cast<uint32_t>(h)};
    info.scaleFactor = static_cast<double>(dpiForSystem()) / 96.0;
    return info;
}

double Win32PanelWindow::scaleFactor() const
{
    return static_cast<double>(dpiForWindow(hwnd_)) / 96.0;
}

LogicalSize Win32PanelWindow::logicalClientSize() const
{
    RECT rc;
    if (!hwnd_ || !GetClientRect(hwnd_, &rc))
        return LogicalSize{kDefaultWindowWidth, kDefaultWindowHeight};
    const double scale = scaleFactor();
    return LogicalSize{static_cast<double>(rc.right - rc.left) / scale,
                       static_cast<double>(rc.bottom - rc.top) / scale};
}

// ── Message handling ────────────────────────────────────────────────────────

LRESULT CALLBACK Win32PanelWindow::wndProc(HWND hWnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    if (msg == WM_NCCREATE)
    {
        auto* cs = reinterpret_cast<CREATESTRUCTW*>(lParam);
        auto* self = static_cast<Win32PanelWindow*>(cs->lpCreateParams);
        self->hwnd_ = hWnd;
        SetWindowLongPtrW(hWnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(self));
    }

    auto* self = reinterpret_cast<Win32PanelWindow*>(GetWindowLongPtrW(hWnd, GWLP_USERDATA));
    if (self)
        return self->handleMessage(msg, wParam, lParam);
    return DefWindowProcW(hWnd, msg, wParam, lParam);
}

LRESULT Win32PanelWindow::handleMessage(UINT msg, WPARAM wParam, LPARAM lParam)
{
    switch (msg)
    {
    case WM_ACTIVATE:
        if (onFocus_)
            onFocus_(LOWORD(wParam) != WA_INACTIVE, userData_);
        return 0;

    case WM_SIZE:
        if (wParam != SIZE_MINIMIZED && onResize_)
            onResize_(PixelSize{LOWORD(lParam), HIWORD(lParam)}, userData_);
        return 0;

    case WM_GETMINMAXINFO:
    {
        // Minimum client size: the default panel size
        const UINT dpi = dpiForWindow(hwnd_);
        RECT rc = {0, 0, scaleToDpi(kDefaultWindowWidth, dpi), scaleToDpi(kDefaultWindowHeight, dpi)};
        AdjustWindowRectEx(&rc, kPanelStyle, FALSE, kPanelExStyle);
        auto* mmi = reinterpret_cast<MINMAXINFO*>(lParam);
        mmi->ptMinTrackSize.x = rc.right - rc.left;
        mmi->ptMinTrackSize.y = rc.bottom - rc.top;
        return 0;
    }

    case WM_DPICHANGED:
    {
        auto* suggested = reinterpret_cast<RECT*>(lParam);
        SetWindowPos(hwnd_, nullptr, suggested->left, suggested->top,
                     suggested->right - suggested->left, suggested->bottom - suggested->top,
                     SWP_NOZORDER | SWP_NOACTIVATE);
        return 0;
    }

    case WM_NCHITTEST:
    {
        // No title bar: drag the panel by its body, resize by the frame
        LRESULT hit = DefWindowProcW(hwnd_, msg, wParam, lParam);
        return hit == HTCLIENT ? HTCAPTION : hit;
    }

    case WM_CLOSE:
        // Alt+F4 hides; quitting goes through the tray
        ShowWindow(hwnd_, SW_HIDE);
        return 0;

    case WM_NCDESTROY:
        SetWindowLongPtrW(hwnd_, GWLP_USERDATA, 0);
        break;

    default:
        break;
    }

    return DefWindowProcW(hwnd_, msg, wParam, lParam);
}

} // namespace Millionaire
