#ifndef SCHEMER_PRF_PREFERENCE_STORE_HPP
#define SCHEMER_PRF_PREFERENCE_STORE_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "schemer/PreferenceStore.hpp"

// Preference store kept in memory and persisted as a prf file, one
// "name=value" line per preference using the B/I/C value encodings.
// Preferences the importer does not recognize survive a load/save cycle.
class PrfPreferenceStore : public PreferenceStore {
public:
    using ColorListener = std::function<void(const std::string&)>;

    explicit PrfPreferenceStore(const Rgb& default_color = Rgb{0, 0, 0});

    bool LoadFromFile(const std::filesystem::path& path);
    bool SaveToFile(const std::filesystem::path& path) const;

    void SetBooleanPreference(const std::string& name, bool value) override;
    void SetIntegerPreference(const std::string& name, int value) override;
    Rgb GetColorPreference(const std::string& name) const override;
    void SetColorPreference(const std::string& name, const Rgb& color) override;
    void NotifyColorListeners(const std::string& name) override;

    bool GetBooleanPreference(const std::string& name, bool fallback) const;
    int GetIntegerPreference(const std::string& name, int fallback) const;
    bool HasPreference(const std::string& name) const;
    std::size_t Size() const { return values_.size(); }

    void AddColorListener(ColorListener listener);

private:
    std::map<std::string, std::string> values_;
    std::vector<ColorListener> listeners_;
    Rgb default_color_;
};

#endif // SCHEMER_PRF_PREFERENCE_STORE_HPP
