#pragma once
// =============================================================================
// Millionaire: Debug Log
// One-line diagnostics. OutputDebugString on Windows, stderr elsewhere.
// =============================================================================

#include <string>

namespace Millionaire
{

void debugLog(const std::string& message);

} // namespace Millionaire
