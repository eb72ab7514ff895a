#ifndef SCHEMER_VALUE_DECODER_HPP
#define SCHEMER_VALUE_DECODER_HPP

#include <cstdint>
#include <string>

#include "schemer/ImportError.hpp"

enum class PreferenceCategory {
    Boolean,
    Integer,
    Color
};

// Decoded preference value; only the field matching category is meaningful.
struct TypedValue {
    PreferenceCategory category;
    bool boolean_value;
    int integer_value;
    int32_t packed_color;
};

struct DecodeResult {
    bool ok;
    TypedValue value;
    WarningKind warning;  // valid when ok is false
};

// Turns a raw value string ("Btrue", "I3", "C-65536") into a typed value.
// A malformed value yields ok == false and the matching warning kind; this
// function never throws.
DecodeResult DecodeValue(PreferenceCategory category, const std::string& raw_value);

// Parses an optionally signed decimal integer that must span the whole string
// and fit in [min_value, max_value].
bool ParseDecimal(const std::string& text, long long min_value, long long max_value, long long& out);

#endif // SCHEMER_VALUE_DECODER_HPP
