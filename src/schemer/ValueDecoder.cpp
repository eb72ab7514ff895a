#include "schemer/ValueDecoder.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace {
std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool HasPrefix(const std::string& raw_value, char prefix) {
    if (raw_value.empty()) {
        return false;
    }
    return std::tolower(static_cast<unsigned char>(raw_value[0])) == std::tolower(static_cast<unsigned char>(prefix));
}

DecodeResult Failure(PreferenceCategory category, WarningKind warning) {
    DecodeResult result{};
    result.ok = false;
    result.value.category = category;
    result.warning = warning;
    return result;
}
}

bool ParseDecimal(const std::string& text, long long min_value, long long max_value, long long& out) {
    if (text.empty()) {
        return false;
    }
    // strtoll would quietly skip leading whitespace; the payload must start
    // with a sign or a digit.
    const unsigned char first = static_cast<unsigned char>(text[0]);
    if (first != '-' && first != '+' && std::isdigit(first) == 0) {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        return false;
    }
    if (parsed < min_value || parsed > max_value) {
        return false;
    }
    out = parsed;
    return true;
}

DecodeResult DecodeValue(PreferenceCategory category, const std::string& raw_value) {
    DecodeResult result{};
    result.ok = true;
    result.value.category = category;

    switch (category) {
        case PreferenceCategory::Boolean: {
            const std::string lowered = ToLower(raw_value);
            if (lowered == "btrue") {
                result.value.boolean_value = true;
            } else if (lowered == "bfalse") {
                result.value.boolean_value = false;
            } else {
                return Failure(category, WarningKind::BadBoolean);
            }
            return result;
        }
        case PreferenceCategory::Integer: {
            long long parsed = 0;
            if (!HasPrefix(raw_value, 'I') || !ParseDecimal(raw_value.substr(1), INT_MIN, INT_MAX, parsed)) {
                return Failure(category, WarningKind::BadInteger);
            }
            result.value.integer_value = static_cast<int>(parsed);
            return result;
        }
        case PreferenceCategory::Color: {
            long long parsed = 0;
            if (!HasPrefix(raw_value, 'C') || !ParseDecimal(raw_value.substr(1), INT32_MIN, INT32_MAX, parsed)) {
                return Failure(category, WarningKind::BadColor);
            }
            result.value.packed_color = static_cast<int32_t>(parsed);
            return result;
        }
    }
    return Failure(category, WarningKind::BadColor);
}
