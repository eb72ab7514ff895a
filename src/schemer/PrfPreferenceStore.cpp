#include "schemer/PrfPreferenceStore.hpp"

#include <fstream>
#include <utility>

#include "schemer/ValueDecoder.hpp"

PrfPreferenceStore::PrfPreferenceStore(const Rgb& default_color)
    : default_color_(default_color) {}

bool PrfPreferenceStore::LoadFromFile(const std::filesystem::path& path) {
    values_.clear();
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    // Unlike a scheme file, a stored value may contain '#' or be empty, so a
    // line is split at its first '=' and the value kept as written.
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const std::size_t equals = line.find('=');
        if (equals == std::string::npos || equals == 0) {
            continue;
        }
        values_[line.substr(0, equals)] = line.substr(equals + 1);
    }
    return true;
}

bool PrfPreferenceStore::SaveToFile(const std::filesystem::path& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        return false;
    }
    out << "#MATLAB Preferences\n";
    for (const auto& kv : values_) {
        out << kv.first << "=" << kv.second << "\n";
    }
    return static_cast<bool>(out);
}

void PrfPreferenceStore::SetBooleanPreference(const std::string& name, bool value) {
    values_[name] = value ? "Btrue" : "Bfalse";
}

void PrfPreferenceStore::SetIntegerPreference(const std::string& name, int value) {
    values_[name] = "I" + std::to_string(value);
}

Rgb PrfPreferenceStore::GetColorPreference(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return default_color_;
    }
    const DecodeResult decoded = DecodeValue(PreferenceCategory::Color, it->second);
    if (!decoded.ok) {
        return default_color_;
    }
    return RgbFromPacked(decoded.value.packed_color);
}

void PrfPreferenceStore::SetColorPreference(const std::string& name, const Rgb& color) {
    values_[name] = "C" + std::to_string(RgbToPacked(color));
}

void PrfPreferenceStore::NotifyColorListeners(const std::string& name) {
    for (const ColorListener& listener : listeners_) {
        listener(name);
    }
}

bool PrfPreferenceStore::GetBooleanPreference(const std::string& name, bool fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return fallback;
    }
    const DecodeResult decoded = DecodeValue(PreferenceCategory::Boolean, it->second);
    return decoded.ok ? decoded.value.boolean_value : fallback;
}

int PrfPreferenceStore::GetIntegerPreference(const std::string& name, int fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return fallback;
    }
    const DecodeResult decoded = DecodeValue(PreferenceCategory::Integer, it->second);
    return decoded.ok ? decoded.value.integer_value : fallback;
}

bool PrfPreferenceStore::HasPreference(const std::string& name) const {
    return values_.find(name) != values_.end();
}

void PrfPreferenceStore::AddColorListener(ColorListener listener) {
    listeners_.push_back(std::move(listener));
}
