#include "schemer/SchemeImporter.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "schemer/LineParser.hpp"
#include "schemer/ValueDecoder.hpp"

namespace {
ImportError BadShape(const ColorEntry& entry) {
    return ImportError(ImportErrorKind::BadFallbackShape, "Bad fallback value for " + entry.name);
}
}

SchemeImporter::SchemeImporter(PreferenceStore& store, PreferenceTables tables)
    : store_(store),
      tables_(std::move(tables)) {}

void SchemeImporter::SetWarningCallback(WarningCallback callback) {
    warning_cb_ = std::move(callback);
}

ImportReport SchemeImporter::ImportFile(const std::filesystem::path& path, const ImportOptions& options) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw ImportError(ImportErrorKind::FileOpen, "Could not open colorscheme file: " + path.string());
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw ImportError(ImportErrorKind::FileOpen, "Could not read colorscheme file: " + path.string());
    }
    return Import(contents.str(), options, path.string());
}

ImportReport SchemeImporter::Import(const std::string& contents, const ImportOptions& options, const std::string& source) {
    // Nothing may be written before the two mandatory keys check out.
    CheckColorKeys(contents, source);

    ImportReport report;
    report.source = source;
    report.included_booleans = options.include_boolean_preferences;

    ColorRegistry registry = tables_.Colors();
    registry.ResetSetFlags();

    std::istringstream in(contents);
    ApplyEntries(in, options, registry, report);

    if (registry.SetCount() == 0) {
        throw ImportError(ImportErrorKind::NoColorsFound, "Did not find any colour settings in file: " + source);
    }

    ResolveFallbacks(registry, report);
    return report;
}

void SchemeImporter::ApplyEntries(std::istream& in,
                                  const ImportOptions& options,
                                  ColorRegistry& registry,
                                  ImportReport& report) {
    LineParser parser(in);
    RawEntry entry;
    while (parser.Next(entry)) {
        PreferenceCategory category = PreferenceCategory::Color;
        if (!tables_.Classify(entry.name, options.include_boolean_preferences, category)) {
            // Irrelevant preference, e.g. from a full matlab.prf dump.
            continue;
        }

        const DecodeResult decoded = DecodeValue(category, entry.raw_value);
        if (!decoded.ok) {
            Warn(report, decoded.warning, entry);
            continue;
        }

        switch (category) {
            case PreferenceCategory::Boolean:
                store_.SetBooleanPreference(entry.name, decoded.value.boolean_value);
                ++report.booleans_set;
                break;
            case PreferenceCategory::Integer:
                store_.SetIntegerPreference(entry.name, decoded.value.integer_value);
                ++report.integers_set;
                break;
            case PreferenceCategory::Color:
                store_.SetColorPreference(entry.name, RgbFromPacked(decoded.value.packed_color));
                store_.NotifyColorListeners(entry.name);
                if (!registry.IsSet(entry.name)) {
                    report.direct_colors.push_back(entry.name);
                }
                registry.MarkSet(entry.name);
                break;
        }
    }
}

void SchemeImporter::ResolveFallbacks(const ColorRegistry& registry, ImportReport& report) {
    for (const ColorEntry& entry : registry.Entries()) {
        if (entry.is_set || entry.fallback.kind == FallbackSpec::Kind::None) {
            continue;
        }
        const Rgb color = ComputeFallback(entry);
        store_.SetColorPreference(entry.name, color);
        store_.NotifyColorListeners(entry.name);
        report.fallback_colors.push_back(entry.name);
    }
}

Rgb SchemeImporter::ComputeFallback(const ColorEntry& entry) const {
    const FallbackSpec& fallback = entry.fallback;
    switch (fallback.kind) {
        case FallbackSpec::Kind::Reference:
            if (fallback.names.size() != 1 || fallback.names.front().empty()) {
                throw BadShape(entry);
            }
            return store_.GetColorPreference(fallback.names.front());

        case FallbackSpec::Kind::Average: {
            if (fallback.names.empty()) {
                throw BadShape(entry);
            }
            std::vector<Rgb> samples;
            samples.reserve(fallback.names.size());
            for (const std::string& name : fallback.names) {
                if (name.empty()) {
                    throw BadShape(entry);
                }
                samples.push_back(store_.GetColorPreference(name));
            }
            return AverageColors(samples);
        }

        case FallbackSpec::Kind::Scaled:
            if (fallback.names.size() != 1 || fallback.names.front().empty()) {
                throw BadShape(entry);
            }
            return ScaleColor(store_.GetColorPreference(fallback.names.front()), fallback.factor);

        case FallbackSpec::Kind::Literal:
            return RgbFromPacked(fallback.literal);

        case FallbackSpec::Kind::None:
            break;
    }
    throw BadShape(entry);
}

void SchemeImporter::Warn(ImportReport& report, WarningKind kind, const RawEntry& entry) {
    const ImportWarning warning{kind, entry.name, entry.raw_value};
    report.warnings.push_back(warning);
    if (warning_cb_) {
        warning_cb_(warning);
    }
}
