#ifndef TUI_EXITSTATUS_HPP
#define TUI_EXITSTATUS_HPP

#include "schemer/ImportError.hpp"

// Process exit codes for schemer_import.
namespace exit_status {
constexpr int kImported = 0;
constexpr int kCancelled = 1;
constexpr int kFileError = 2;
constexpr int kImportFailed = 3;
constexpr int kUsage = 64;

inline int ForError(ImportErrorKind kind) {
    return kind == ImportErrorKind::FileOpen ? kFileError : kImportFailed;
}
} // namespace exit_status

#endif // TUI_EXITSTATUS_HPP
