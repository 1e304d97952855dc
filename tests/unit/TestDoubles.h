#pragma once
// =============================================================================
// Fakes for the platform collaborators: TriggerHost and PanelWindow.
// =============================================================================

#include "millionaire/input/TriggerHost.h"
#include "millionaire/output/PanelWindow.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace MillionaireTest
{

using namespace Millionaire;

// Records registrations. Rejects anything in `rejected`, or everything when
// rejectAll is set. Claims are exclusive per descriptor.
class FakeTriggerHost : public TriggerHost
{
public:
    bool registerTrigger(const TriggerDescriptor& trigger, std::string& error) override
    {
        ++registerCalls;
        if (rejectAll || std::find(rejected.begin(), rejected.end(), trigger) != rejected.end())
        {
            error = "already registered by another application";
            return false;
        }
        active.push_back(trigger);
        return true;
    }

    bool unregisterTrigger(const TriggerDescriptor& trigger) override
    {
        ++unregisterCalls;
        if (failUnregister)
            return false;
        auto it = std::find(active.begin(), active.end(), trigger);
        if (it == active.end())
            return false;
        active.erase(it);
        return true;
    }

    std::vector<TriggerDescriptor> active;
    std::vector<TriggerDescriptor> rejected;
    bool rejectAll = false;
    bool failUnregister = false;
    int registerCalls = 0;
    int unregisterCalls = 0;
};

class FakePanelWindow : public PanelWindow
{
public:
    bool isVisible() const override { return visible; }
    void show() override { visible = true; ++showCalls; }
    void hide() override { visible = false; ++hideCalls; }
    void setFocus() override { ++focusCalls; }
    void setPosition(ScreenPoint topLeft) override
    {
        position = topLeft;
        ++positionCalls;
    }
    std::optional<PixelSize> outerSize() const override { return size; }
    std::optional<DisplayInfo> primaryDisplay() const override { return display; }
    double scaleFactor() const override { return display ? display->scaleFactor : 1.0; }

    bool visible = false;
    std::optional<PixelSize> size = PixelSize{280, 300};
    std::optional<DisplayInfo> display = DisplayInfo{PixelSize{1920, 1080}, 1.0};
    ScreenPoint position;
    int showCalls = 0;
    int hideCalls = 0;
    int focusCalls = 0;
    int positionCalls = 0;
};

// Fresh per-test path under the temp directory; removes leftovers.
inline std::string tempConfigPath(const char* name)
{
    auto dir = std::filesystem::temp_directory_path() / "millionaire_test" / name;
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return (dir / "config.json").string();
}

inline void writeFile(const std::string& path, const std::string& content)
{
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream f(path);
    f << content;
}

inline std::string readFileContents(const std::string& path)
{
    std::ifstream f(path);
    return std::string((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
}

} // namespace MillionaireTest
