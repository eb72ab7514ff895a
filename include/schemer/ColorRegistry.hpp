#ifndef SCHEMER_COLOR_REGISTRY_HPP
#define SCHEMER_COLOR_REGISTRY_HPP

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "schemer/ValueDecoder.hpp"

// How a color is derived when the scheme file leaves it out.
struct FallbackSpec {
    enum class Kind {
        None,       // leave the store value alone
        Reference,  // copy names[0]
        Average,    // per-channel mean of names
        Scaled,     // names[0] with each channel multiplied by factor
        Literal     // fixed packed value
    };

    Kind kind;
    std::vector<std::string> names;
    double factor;
    int32_t literal;

    static FallbackSpec None();
    static FallbackSpec Reference(const std::string& name);
    static FallbackSpec Average(const std::vector<std::string>& names);
    static FallbackSpec Scaled(const std::string& name, double factor);
    static FallbackSpec Literal(int32_t packed);
};

struct ColorEntry {
    std::string name;
    FallbackSpec fallback;
    bool is_set;
};

// Ordered table of every recognized color preference. Declaration order is
// the order the fallback pass walks, so it is observable in the results.
class ColorRegistry {
public:
    // Throws std::invalid_argument on duplicate names or when ColorsText or
    // ColorsBackground is not registered exactly once.
    explicit ColorRegistry(std::vector<ColorEntry> entries);

    // The full editor palette, MATLAB naming.
    static ColorRegistry Default();

    bool Contains(const std::string& name) const;

    // Clears every is_set flag; called at the start of each import run.
    void ResetSetFlags();
    // Flags name as written directly from the input. Returns false if unknown.
    bool MarkSet(const std::string& name);
    bool IsSet(const std::string& name) const;
    std::size_t SetCount() const;

    const std::vector<ColorEntry>& Entries() const { return entries_; }

private:
    std::vector<ColorEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

// Static category membership: the boolean, integer and color name tables.
// A name that is in none of them is irrelevant to an import.
class PreferenceTables {
public:
    // Throws std::invalid_argument if a name appears in more than one table.
    PreferenceTables(const std::vector<std::string>& booleans,
                     const std::vector<std::string>& integers,
                     ColorRegistry colors);

    static PreferenceTables Default();

    // When include_booleans is false the boolean table is treated as empty.
    bool Classify(const std::string& name, bool include_booleans, PreferenceCategory& category) const;

    const ColorRegistry& Colors() const { return colors_; }

private:
    std::unordered_set<std::string> booleans_;
    std::unordered_set<std::string> integers_;
    ColorRegistry colors_;
};

#endif // SCHEMER_COLOR_REGISTRY_HPP
