#ifndef SCHEMER_IMPORT_ERROR_HPP
#define SCHEMER_IMPORT_ERROR_HPP

#include <stdexcept>
#include <string>

enum class ImportErrorKind {
    MissingColorKey,
    DuplicateColorKey,
    IdenticalTextBackground,
    FileOpen,
    NoColorsFound,
    BadFallbackShape
};

// Fatal import failure. Everything except BadFallbackShape is raised before
// phase 2 starts; precondition and FileOpen errors happen before any write.
class ImportError : public std::runtime_error {
public:
    ImportError(ImportErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ImportErrorKind kind() const { return kind_; }

private:
    ImportErrorKind kind_;
};

// Stable identifier for logs and test output, e.g. "MissingColorKey".
const char* ImportErrorKindName(ImportErrorKind kind);

enum class WarningKind {
    BadBoolean,
    BadInteger,
    BadColor
};

// A single malformed entry that was skipped. Never fatal.
struct ImportWarning {
    WarningKind kind;
    std::string name;
    std::string raw_value;
};

std::string FormatWarning(const ImportWarning& warning);

#endif // SCHEMER_IMPORT_ERROR_HPP
