// =============================================================================
// Millionaire: Debug Log
// =============================================================================

#include "millionaire/common/DebugLog.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <cstdio>
#endif

namespace Millionaire
{

void debugLog(const std::string& message)
{
    const std::string line = "Millionaire: " + message + "\n";
#ifdef _WIN32
    OutputDebugStringA(line.c_str());
#else
    std::fputs(line.c_str(), stderr);
#endif
}

} // namespace Millionaire
