#pragma once
// =============================================================================
// Millionaire: TriggerHost
// Platform global hot-key subsystem as seen by BindingRegistry.
// Implemented by Win32HotkeyHost; faked in unit tests.
// =============================================================================

#include "millionaire/common/Types.h"

#include <string>

namespace Millionaire
{

class TriggerHost
{
public:
    virtual ~TriggerHost() = default;

    // Claim a system-wide trigger. On failure writes a readable reason
    // (e.g. "already registered by another application") and returns false.
    virtual bool registerTrigger(const TriggerDescriptor& trigger, std::string& error) = 0;

    // Release a trigger previously claimed. Returns false if the platform
    // refused or the trigger was not held.
    virtual bool unregisterTrigger(const TriggerDescriptor& trigger) = 0;
};

} // namespace Millionaire
