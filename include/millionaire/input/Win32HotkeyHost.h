#pragma once
// =============================================================================
// Millionaire: Win32HotkeyHost
// TriggerHost over RegisterHotKey/UnregisterHotKey. WM_HOTKEY with
// kHotkeyId arrives on the message window.
// =============================================================================

#include "millionaire/input/TriggerHost.h"

#include <optional>

namespace Millionaire
{

class Win32HotkeyHost : public TriggerHost
{
public:
    static constexpr int kHotkeyId = 1;

    // Window that receives WM_HOTKEY. Uses void* to keep windows.h out of
    // the header.
    void setMessageWindow(void* hWnd) { msgWindow_ = hWnd; }

    bool registerTrigger(const TriggerDescriptor& trigger, std::string& error) override;
    bool unregisterTrigger(const TriggerDescriptor& trigger) override;

private:
    void* msgWindow_ = nullptr;
    std::optional<TriggerDescriptor> registered_;
};

} // namespace Millionaire
