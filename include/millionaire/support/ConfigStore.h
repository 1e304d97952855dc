#pragma once
// =============================================================================
// Millionaire: ConfigStore
// Loads and saves the preference record (config.json). Missing or corrupt
// files fall back to defaults; write failures are logged and swallowed.
//
// Callers own read-modify-write: load(), change only the fields they own,
// save() the whole record.
// =============================================================================

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Millionaire
{

inline constexpr double kDefaultWindowWidth  = 280.0;
inline constexpr double kDefaultWindowHeight = 300.0;

struct PreferenceRecord
{
    std::vector<std::string> shortcutModifiers{"Alt"};
    std::string              shortcutKey = "M";
    double                   windowWidth  = kDefaultWindowWidth;
    double                   windowHeight = kDefaultWindowHeight;

    bool operator==(const PreferenceRecord& o) const
    {
        return shortcutModifiers == o.shortcutModifiers && shortcutKey == o.shortcutKey &&
               windowWidth == o.windowWidth && windowHeight == o.windowHeight;
    }
    bool operator!=(const PreferenceRecord& o) const { return !(*this == o); }
};

class ConfigStore
{
public:
    ConfigStore() = default;
    explicit ConfigStore(std::string path);

    // Set-once: the first non-empty path wins. Returns false if a path was
    // already set.
    bool setPath(const std::string& path);
    std::string path() const;

    // nullopt when the path is unset, the file is missing or unreadable, or
    // its content does not parse as a preference record.
    std::optional<PreferenceRecord> tryLoad() const;

    // The single fallback point: absent config is the first-run steady state.
    static PreferenceRecord orDefaults(const std::optional<PreferenceRecord>& loaded);

    // tryLoad() collapsed to defaults. Never fails.
    PreferenceRecord load() const;

    // Write the full record via temp file + rename. Returns false on any
    // failure (path unset, directory not creatable, write error).
    bool trySave(const PreferenceRecord& record) const;

    // trySave() with the failure logged and dropped.
    void save(const PreferenceRecord& record) const;

    // Per-app data location: %APPDATA%\Millionaire\config.json on Windows,
    // $XDG_DATA_HOME/millionaire/config.json (or ~/.local/share/...) elsewhere.
    // Empty if the environment gives no base directory.
    static std::string getDefaultConfigPath();

private:
    mutable std::mutex pathMutex_;
    std::string path_;
};

} // namespace Millionaire
