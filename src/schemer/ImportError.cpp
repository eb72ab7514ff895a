#include "schemer/ImportError.hpp"

const char* ImportErrorKindName(ImportErrorKind kind) {
    switch (kind) {
        case ImportErrorKind::MissingColorKey:
            return "MissingColorKey";
        case ImportErrorKind::DuplicateColorKey:
            return "DuplicateColorKey";
        case ImportErrorKind::IdenticalTextBackground:
            return "IdenticalTextBackground";
        case ImportErrorKind::FileOpen:
            return "FileOpen";
        case ImportErrorKind::NoColorsFound:
            return "NoColorsFound";
        case ImportErrorKind::BadFallbackShape:
            return "BadFallbackShape";
    }
    return "Unknown";
}

std::string FormatWarning(const ImportWarning& warning) {
    std::string label;
    switch (warning.kind) {
        case WarningKind::BadBoolean:
            label = "Bad boolean";
            break;
        case WarningKind::BadInteger:
            label = "Bad integer pref";
            break;
        case WarningKind::BadColor:
            label = "Bad color";
            break;
    }
    return label + " for " + warning.name + ": " + warning.raw_value;
}
