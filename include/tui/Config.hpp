#ifndef TUI_CONFIG_HPP
#define TUI_CONFIG_HPP

#include <filesystem>
#include <string>
#include <unordered_map>

// Run configuration for the importer, read from a YAML-like file.
// Parses simple "key: value" lines, ignoring comments (#) and blank lines.
class SchemerConfig {
public:
    static constexpr const char* kIncludeBooleans = "include_boolean_preferences";
    static constexpr const char* kPreferenceFile = "preference_file";
    static constexpr const char* kStartDirectory = "start_directory";

    bool LoadFromFile(const std::filesystem::path& path);

    // Accessors with defaults.
    std::string GetString(const std::string& key, const std::string& fallback) const;
    int GetInt(const std::string& key, int fallback) const;
    bool GetBool(const std::string& key, bool fallback) const;

    void SetString(const std::string& key, const std::string& value);
    void SetInt(const std::string& key, int value);
    void SetBool(const std::string& key, bool value);

    // Typed views of the keys the importer understands.
    bool IncludeBooleans() const { return GetBool(kIncludeBooleans, false); }
    std::filesystem::path PreferenceFile() const { return GetString(kPreferenceFile, "matlab.prf"); }
    std::filesystem::path StartDirectory() const;

    // Persist the current values (sorted by key) in the same format.
    bool SaveToFile(const std::filesystem::path& path) const;

private:
    std::unordered_map<std::string, std::string> values_;
};

#endif // TUI_CONFIG_HPP
