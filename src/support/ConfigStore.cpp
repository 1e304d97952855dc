// =============================================================================
// Millionaire: ConfigStore
// JSON persistence for the preference record.
// =============================================================================

#include "millionaire/support/ConfigStore.h"
#include "millionaire/common/DebugLog.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace Millionaire
{

using json = nlohmann::json;

static constexpr const char* kConfigFileName = "config.json";

ConfigStore::ConfigStore(std::string path)
    : path_(std::move(path))
{
}

// ─── Path ────────────────────────────────────────────────────────────────────

bool ConfigStore::setPath(const std::string& path)
{
    std::lock_guard<std::mutex> lock(pathMutex_);
    if (!path_.empty())
        return false;
    path_ = path;
    return true;
}

std::string ConfigStore::path() const
{
    std::lock_guard<std::mutex> lock(pathMutex_);
    return path_;
}

std::string ConfigStore::getDefaultConfigPath()
{
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (!appdata || appdata[0] == '\0')
        return {};
    return std::string(appdata) + "\\Millionaire\\" + kConfigFileName;
#else
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0')
        return std::string(xdg) + "/millionaire/" + kConfigFileName;

    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0')
        return {};
    return std::string(home) + "/.local/share/millionaire/" + kConfigFileName;
#endif
}

// ─── Load ────────────────────────────────────────────────────────────────────

std::optional<PreferenceRecord> ConfigStore::tryLoad() const
{
    const std::string p = path();
    if (p.empty())
        return std::nullopt;

    std::ifstream file(p);
    if (!file.is_open())
        return std::nullopt;

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        debugLog("config at " + p + " is not valid JSON, using defaults");
        return std::nullopt;
    }

    // All four fields are required with the right types; extra keys are ignored.
    auto mods = j.find("shortcut_modifiers");
    auto key = j.find("shortcut_key");
    auto width = j.find("window_width");
    auto height = j.find("window_height");

    if (mods == j.end() || !mods->is_array() ||
        key == j.end() || !key->is_string() ||
        width == j.end() || !width->is_number() ||
        height == j.end() || !height->is_number())
    {
        debugLog("config at " + p + " has an unexpected shape, using defaults");
        return std::nullopt;
    }

    PreferenceRecord record;
    record.shortcutModifiers.clear();
    for (const auto& m : *mods)
    {
        if (!m.is_string())
        {
            debugLog("config at " + p + " has a non-string modifier, using defaults");
            return std::nullopt;
        }
        record.shortcutModifiers.push_back(m.get<std::string>());
    }
    record.shortcutKey = key->get<std::string>();
    record.windowWidth = width->get<double>();
    record.windowHeight = height->get<double>();
    return record;
}

PreferenceRecord ConfigStore::orDefaults(const std::optional<PreferenceRecord>& loaded)
{
    return loaded.value_or(PreferenceRecord{});
}

PreferenceRecord ConfigStore::load() const
{
    return orDefaults(tryLoad());
}

// ─── Save ────────────────────────────────────────────────────────────────────

bool ConfigStore::trySave(const PreferenceRecord& record) const
{
    const std::string p = path();
    if (p.empty())
        return false;

    json j;
    j["shortcut_modifiers"] = record.shortcutModifiers;
    j["shortcut_key"]       = record.shortcutKey;
    j["window_width"]       = record.windowWidth;
    j["window_height"]      = record.windowHeight;

    std::error_code ec;
    std::filesystem::path target(p);
    if (target.has_parent_path())
    {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec)
            return false;
    }

    // Readers see either the old file or the new one, never a partial write.
    std::filesystem::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open())
            return false;
        file << j.dump(2);
        file.flush();
        if (!file.good())
        {
            file.close();
            std::filesystem::remove(temp, ec);
            return false;
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return false;
    }
    return true;
}

void ConfigStore::save(const PreferenceRecord& record) const
{
    if (!trySave(record))
        debugLog("could not write config to '" + path() + "', keeping in-memory state");
}

} // namespace Millionaire
