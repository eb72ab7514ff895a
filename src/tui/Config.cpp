#include "tui/Config.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <fstream>
#include <map>

#include "schemer/LineParser.hpp"
#include "schemer/ValueDecoder.hpp"

bool SchemerConfig::LoadFromFile(const std::filesystem::path& path) {
    values_.clear();
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        const std::string trimmed = TrimWhitespace(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        const std::size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = TrimWhitespace(trimmed.substr(0, colon));
        std::string value = TrimWhitespace(trimmed.substr(colon + 1));
        // Allow quoted paths.
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        values_[key] = value;
    }

    return true;
}

std::string SchemerConfig::GetString(const std::string& key, const std::string& fallback) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

int SchemerConfig::GetInt(const std::string& key, int fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    long long parsed = 0;
    if (!ParseDecimal(it->second, INT_MIN, INT_MAX, parsed)) {
        return fallback;
    }
    return static_cast<int>(parsed);
}

bool SchemerConfig::GetBool(const std::string& key, bool fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "1" || v == "on") {
        return true;
    }
    if (v == "false" || v == "no" || v == "0" || v == "off") {
        return false;
    }
    return fallback;
}

void SchemerConfig::SetString(const std::string& key, const std::string& value) {
    values_[key] = value;
}

void SchemerConfig::SetInt(const std::string& key, int value) {
    values_[key] = std::to_string(value);
}

void SchemerConfig::SetBool(const std::string& key, bool value) {
    values_[key] = value ? "true" : "false";
}

std::filesystem::path SchemerConfig::StartDirectory() const {
    const std::string configured = GetString(kStartDirectory, "");
    if (configured.empty()) {
        return std::filesystem::current_path();
    }
    return configured;
}

bool SchemerConfig::SaveToFile(const std::filesystem::path& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        return false;
    }
    const std::map<std::string, std::string> sorted(values_.begin(), values_.end());
    for (const auto& kv : sorted) {
        out << kv.first << ": " << kv.second << "\n";
    }
    return static_cast<bool>(out);
}
