// =============================================================================
// Millionaire: TrayUI
// System tray icon, context menu, shortcut editor window.
// =============================================================================

#include "millionaire/support/TrayUI.h"
#include "millionaire/app/PanelApp.h"
#include "millionaire/common/AppMessages.h"
#include "millionaire/common/DebugLog.h"
#include "millionaire/input/KeyBindingCodec.h"

#include <shellapi.h>
#include <string>
#include <vector>

#pragma comment(lib, "Shell32.lib")
#pragma comment(lib, "User32.lib")

namespace Millionaire
{

// ── Constants ───────────────────────────────────────────────────────────────
// WM_TRAYICON and the IDM_* command IDs are defined in common/AppMessages.h.

// Shortcut window control IDs
static constexpr int IDC_ALT_CHECK     = 1001;
static constexpr int IDC_CTRL_CHECK    = 1002;
static constexpr int IDC_SHIFT_CHECK   = 1003;
static constexpr int IDC_WIN_CHECK     = 1004;
static constexpr int IDC_KEY_COMBO     = 1005;
static constexpr int IDC_STATUS_TEXT   = 1006;
static constexpr int IDC_APPLY_BUTTON  = 1007;
static constexpr int IDC_CLOSE_BUTTON  = 1008;

// Tray icon ID
static constexpr UINT kTrayIconId = 1;

// Check box -> modifier, in display order
struct ModifierControl
{
    int id;
    const wchar_t* label;
    Modifier modifier;
    const char* name;  // spelling handed to updateShortcut
};

static const ModifierControl kModifierControls[] = {
    {IDC_ALT_CHECK,   L"Alt",   Modifier::Alt,     "Alt"},
    {IDC_CTRL_CHECK,  L"Ctrl",  Modifier::Control, "Ctrl"},
    {IDC_SHIFT_CHECK, L"Shift", Modifier::Shift,   "Shift"},
    {IDC_WIN_CHECK,   L"Win",   Modifier::Meta,    "Super"},
};

// Static instance pointer for WndProc routing (only one TrayUI exists)
static TrayUI* s_instance = nullptr;

// ── UTF-8 Helpers ───────────────────────────────────────────────────────────

static std::wstring widen(const std::string& utf8)
{
    if (utf8.empty())
        return {};
    int len = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
    if (len <= 0)
        return {};
    std::wstring out(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), &out[0], len);
    return out;
}

// ── Shortcut Window WndProc ─────────────────────────────────────────────────

LRESULT CALLBACK shortcutWndProc(HWND hWnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    switch (msg)
    {
    case WM_COMMAND:
    {
        int id = LOWORD(wParam);
        int notif = HIWORD(wParam);

        if (id == IDC_APPLY_BUTTON && notif == BN_CLICKED)
        {
            if (s_instance)
                s_instance->applyShortcut();
            return 0;
        }
        if (id == IDC_CLOSE_BUTTON && notif == BN_CLICKED)
        {
            DestroyWindow(hWnd);
            return 0;
        }
        break;
    }

    case WM_CLOSE:
        DestroyWindow(hWnd);
        return 0;

    case WM_DESTROY:
        if (s_instance)
            s_instance->shortcutHwnd_ = nullptr;
        return 0;

    default:
        break;
    }

    return DefWindowProcW(hWnd, msg, wParam, lParam);
}

// ── TrayUI Implementation ───────────────────────────────────────────────────

bool TrayUI::create(HINSTANCE hInstance, HWND msgWindow, PanelApp& app)
{
    hInstance_ = hInstance;
    msgWindow_ = msgWindow;
    app_ = &app;
    s_instance = this;

    // Register shortcut window class
    WNDCLASSEXW wc = {};
    wc.cbSize = sizeof(WNDCLASSEXW);
    wc.lpfnWndProc = shortcutWndProc;
    wc.hInstance = hInstance_;
    wc.hCursor = LoadCursorW(nullptr, IDC_ARROW);
    wc.hbrBackground = reinterpret_cast<HBRUSH>(COLOR_WINDOW + 1);
    wc.lpszClassName = L"MillionaireShortcut";
    wc.hIcon = LoadIconW(nullptr, IDI_APPLICATION);
    RegisterClassExW(&wc);

    return addTrayIcon();
}

void TrayUI::destroy()
{
    if (shortcutHwnd_)
    {
        DestroyWindow(shortcutHwnd_);
        shortcutHwnd_ = nullptr;
    }
    removeTrayIcon();
    s_instance = nullptr;
}

bool TrayUI::addTrayIcon()
{
    NOTIFYICONDATAW nid = {};
    nid.cbSize = sizeof(NOTIFYICONDATAW);
    nid.hWnd = msgWindow_;
    nid.uID = kTrayIconId;
    nid.uFlags = NIF_ICON | NIF_MESSAGE | NIF_TIP;
    nid.uCallbackMessage = WM_TRAYICON;
    nid.hIcon = LoadIconW(nullptr, IDI_APPLICATION);
    wcscpy_s(nid.szTip, L"Millionaire");
    if (!Shell_NotifyIconW(NIM_ADD, &nid))
        return false;

    nid.uVersion = NOTIFYICON_VERSION_4;
    Shell_NotifyIconW(NIM_SETVERSION, &nid);
    return true;
}

void TrayUI::removeTrayIcon()
{
    NOTIFYICONDATAW nid = {};
    nid.cbSize = sizeof(NOTIFYICONDATAW);
    nid.hWnd = msgWindow_;
    nid.uID = kTrayIconId;
    Shell_NotifyIconW(NIM_DELETE, &nid);
}

void TrayUI::recreateTrayIcon()
{
    if (!addTrayIcon())
        debugLog("could not re-add tray icon after Explorer restart");
}

void TrayUI::onTrayMessage(LPARAM lParam)
{
    UINT event = LOWORD(lParam);

    // Menu opens on either button
    switch (event)
    {
    case WM_LBUTTONUP:
    case WM_CONTEXTMENU:
        showContextMenu();
        break;

    default:
        break;
    }
}

void TrayUI::showContextMenu()
{
    if (!app_)
        return;

    HMENU hMenu = CreatePopupMenu();
    if (!hMenu)
        return;

    // Label tracks the live binding, not the one loaded at startup
    const std::wstring showLabel = widen(app_->showPanelLabel());
    const UINT pinFlags = MF_STRING | (app_->getPinned() ? MF_CHECKED : MF_UNCHECKED);

    AppendMenuW(hMenu, MF_STRING, IDM_SHOW_PANEL, showLabel.c_str());
    AppendMenuW(hMenu, pinFlags, IDM_PIN_PANEL, L"Pin Panel");
    AppendMenuW(hMenu, MF_STRING, IDM_CHANGE_SHORTCUT, L"Change Shortcut...");
    AppendMenuW(hMenu, MF_SEPARATOR, 0, nullptr);
    AppendMenuW(hMenu, MF_STRING, IDM_EXIT, L"Quit");

    // Required for tray menu to dismiss when clicking elsewhere
    SetForegroundWindow(msgWindow_);

    POINT pt;
    GetCursorPos(&pt);
    TrackPopupMenu(hMenu, TPM_RIGHTBUTTON, pt.x, pt.y, 0, msgWindow_, nullptr);

    // Required after TrackPopupMenu per MSDN
    PostMessageW(msgWindow_, WM_NULL, 0, 0);

    DestroyMenu(hMenu);
}

// ── Shortcut Window ─────────────────────────────────────────────────────────

void TrayUI::showShortcutWindow()
{
    if (shortcutHwnd_)
    {
        SetForegroundWindow(shortcutHwnd_);
        return;
    }

    createShortcutWindow();
}

void TrayUI::createShortcutWindow()
{
    // DPI-aware sizing
    int dpi = 96;
    HMODULE hUser32 = GetModuleHandleW(L"user32.dll");
    if (hUser32)
    {
        using GetDpiForSystemFn = UINT(WINAPI*)();
        auto fn = reinterpret_cast<GetDpiForSystemFn>(
            GetProcAddress(hUser32, "GetDpiForSystem"));
        if (fn)
            dpi = static_cast<int>(fn());
    }

    auto scale = [dpi](int v) { return MulDiv(v, dpi, 96); };

    int wndW = scale(360);
    int wndH = scale(230);

    // Center on screen
    int screenW = GetSystemMetrics(SM_CXSCREEN);
    int screenH = GetSystemMetrics(SM_CYSCREEN);
    int x = (screenW - wndW) / 2;
    int y = (screenH - wndH) / 2;

    shortcutHwnd_ = CreateWindowExW(
        WS_EX_TOPMOST, L"MillionaireShortcut", L"Millionaire Shortcut",
        WS_OVERLAPPED | WS_CAPTION | WS_SYSMENU,
        x, y, wndW, wndH,
        nullptr, nullptr, hInstance_, nullptr);

    if (!shortcutHwnd_)
        return;

    int labelX = scale(20);
    int rowH   = scale(24);
    int curY   = scale(20);

    HFONT hFont = reinterpret_cast<HFONT>(GetStockObject(DEFAULT_GUI_FONT));

    auto setFont = [&](HWND h) {
        SendMessageW(h, WM_SETFONT, reinterpret_cast<WPARAM>(hFont), TRUE);
        return h;
    };

    // Row 1: modifier check boxes
    int checkW = scale(70);
    int checkX = labelX;
    for (const auto& mc : kModifierControls)
    {
        setFont(CreateWindowExW(0, L"BUTTON", mc.label,
            WS_CHILD | WS_VISIBLE | BS_AUTOCHECKBOX | WS_TABSTOP,
            checkX, curY, checkW, rowH,
            shortcutHwnd_, reinterpret_cast<HMENU>(static_cast<INT_PTR>(mc.id)),
            hInstance_, nullptr));
        checkX += checkW + scale(10);
    }
    curY += scale(40);

    // Row 2: key picker
    setFont(CreateWindowExW(0, L"STATIC", L"Key",
        WS_CHILD | WS_VISIBLE,
        labelX, curY + scale(3), scale(60), rowH,
        shortcutHwnd_, nullptr, hInstance_, nullptr));

    HWND hKeyCombo = setFont(CreateWindowExW(0, L"COMBOBOX", nullptr,
        WS_CHILD | WS_VISIBLE | CBS_DROPDOWNLIST | WS_VSCROLL | WS_TABSTOP,
        labelX + scale(70), curY, scale(150), scale(240),
        shortcutHwnd_, reinterpret_cast<HMENU>(static_cast<INT_PTR>(IDC_KEY_COMBO)),
        hInstance_, nullptr));
    for (KeyCode key : KeyBindingCodec::allKeys())
    {
        std::wstring name = widen(KeyBindingCodec::keyName(key));
        SendMessageW(hKeyCombo, CB_ADDSTRING, 0, reinterpret_cast<LPARAM>(name.c_str()));
    }
    curY += scale(40);

    // Row 3: status (current binding, result or error)
    setFont(CreateWindowExW(0, L"STATIC", L"",
        WS_CHILD | WS_VISIBLE,
        labelX, curY, scale(310), scale(36),
        shortcutHwnd_, reinterpret_cast<HMENU>(static_cast<INT_PTR>(IDC_STATUS_TEXT)),
        hInstance_, nullptr));
    curY += scale(44);

    // Apply + Close buttons
    int btnW = scale(90);
    int btnH = scale(28);
    int btnGap = scale(12);
    int btnX = scale(330) - btnW * 2 - btnGap;

    setFont(CreateWindowExW(0, L"BUTTON", L"Apply",
        WS_CHILD | WS_VISIBLE | BS_DEFPUSHBUTTON | WS_TABSTOP,
        btnX, curY, btnW, btnH,
        shortcutHwnd_, reinterpret_cast<HMENU>(static_cast<INT_PTR>(IDC_APPLY_BUTTON)),
        hInstance_, nullptr));

    setFont(CreateWindowExW(0, L"BUTTON", L"Close",
        WS_CHILD | WS_VISIBLE | BS_PUSHBUTTON | WS_TABSTOP,
        btnX + btnW + btnGap, curY, btnW, btnH,
        shortcutHwnd_, reinterpret_cast<HMENU>(static_cast<INT_PTR>(IDC_CLOSE_BUTTON)),
        hInstance_, nullptr));

    populateFromBinding();

    ShowWindow(shortcutHwnd_, SW_SHOW);
    UpdateWindow(shortcutHwnd_);
    SetForegroundWindow(shortcutHwnd_);
}

void TrayUI::populateFromBinding()
{
    if (!shortcutHwnd_ || !app_)
        return;

    BindingNames current = app_->getShortcut();
    ModifierSet mods = KeyBindingCodec::decodeModifiers(current.modifiers).value_or(ModifierSet{});

    for (const auto& mc : kModifierControls)
    {
        SendDlgItemMessageW(shortcutHwnd_, mc.id, BM_SETCHECK,
                            mods.has(mc.modifier) ? BST_CHECKED : BST_UNCHECKED, 0);
    }

    // Key combo: index into allKeys()
    const auto& keys = KeyBindingCodec::allKeys();
    int sel = 0;
    if (auto code = KeyBindingCodec::decodeKey(current.key))
    {
        for (size_t i = 0; i < keys.size(); ++i)
        {
            if (keys[i] == *code)
            {
                sel = static_cast<int>(i);
                break;
            }
        }
    }
    SendDlgItemMessageW(shortcutHwnd_, IDC_KEY_COMBO, CB_SETCURSEL, sel, 0);

    if (app_->bindings().hasActiveBinding())
        setStatus(L"Current shortcut: " + widen(KeyBindingCodec::formatDisplay(current)));
    else
        setStatus(L"No shortcut is active. Choose one and press Apply.");
}

void TrayUI::applyShortcut()
{
    if (!shortcutHwnd_ || !app_)
        return;

    std::vector<std::string> modifiers;
    for (const auto& mc : kModifierControls)
    {
        if (SendDlgItemMessageW(shortcutHwnd_, mc.id, BM_GETCHECK, 0, 0) == BST_CHECKED)
            modifiers.emplace_back(mc.name);
    }

    const auto& keys = KeyBindingCodec::allKeys();
    LRESULT sel = SendDlgItemMessageW(shortcutHwnd_, IDC_KEY_COMBO, CB_GETCURSEL, 0, 0);
    if (sel == CB_ERR || static_cast<size_t>(sel) >= keys.size())
    {
        setStatus(L"Select a key.");
        return;
    }
    std::string key = KeyBindingCodec::keyName(keys[static_cast<size_t>(sel)]);

    BindingOutcome outcome = app_->updateShortcut(modifiers, key);
    if (outcome.ok())
        setStatus(L"Shortcut set to " + widen(outcome.display));
    else
        setStatus(widen(outcome.message));
}

void TrayUI::setStatus(const std::wstring& text)
{
    if (shortcutHwnd_)
        SetDlgItemTextW(shortcutHwnd_, IDC_STATUS_TEXT, text.c_str());
}

HWND TrayUI::shortcutHwnd() const
{
    return shortcutHwnd_;
}

} // namespace Millionaire
