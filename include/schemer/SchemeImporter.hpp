#ifndef SCHEMER_SCHEME_IMPORTER_HPP
#define SCHEMER_SCHEME_IMPORTER_HPP

#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <vector>

#include "schemer/ColorRegistry.hpp"
#include "schemer/ImportError.hpp"
#include "schemer/LineParser.hpp"
#include "schemer/PreferenceStore.hpp"

struct ImportOptions {
    // Off by default: boolean names are then not recognized at all.
    bool include_boolean_preferences = false;
};

// What one successful import wrote.
struct ImportReport {
    std::string source;
    bool included_booleans = false;
    std::size_t booleans_set = 0;
    std::size_t integers_set = 0;
    std::vector<std::string> direct_colors;    // first-write order in the file
    std::vector<std::string> fallback_colors;  // registry order
    std::vector<ImportWarning> warnings;
};

// Copies a color scheme into a PreferenceStore in two passes:
//  1. every recognized "name=value" line is decoded and written directly;
//  2. every registered color the file left out is derived from its fallback,
//     walking the registry once in declaration order. A fallback that points
//     at a color not yet resolved reads whatever the store holds right now.
// Fatal problems throw ImportError. Writes already made are not rolled back.
class SchemeImporter {
public:
    using WarningCallback = std::function<void(const ImportWarning&)>;

    explicit SchemeImporter(PreferenceStore& store, PreferenceTables tables = PreferenceTables::Default());

    // Called for every skipped malformed entry, in file order.
    void SetWarningCallback(WarningCallback callback);

    // Import from text already in memory; source names it in error messages.
    ImportReport Import(const std::string& contents, const ImportOptions& options, const std::string& source = "<memory>");

    // Reads the whole file first; an unreadable file throws FileOpen.
    ImportReport ImportFile(const std::filesystem::path& path, const ImportOptions& options);

    const PreferenceTables& Tables() const { return tables_; }

private:
    void ApplyEntries(std::istream& in, const ImportOptions& options, ColorRegistry& registry, ImportReport& report);
    void ResolveFallbacks(const ColorRegistry& registry, ImportReport& report);
    Rgb ComputeFallback(const ColorEntry& entry) const;
    void Warn(ImportReport& report, WarningKind kind, const RawEntry& entry);

    PreferenceStore& store_;
    PreferenceTables tables_;
    WarningCallback warning_cb_;
};

#endif // SCHEMER_SCHEME_IMPORTER_HPP
