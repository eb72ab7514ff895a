#ifndef SCHEMER_LINE_PARSER_HPP
#define SCHEMER_LINE_PARSER_HPP

#include <istream>
#include <string>

// One "name=value" pair read from a scheme or preference file.
struct RawEntry {
    std::string name;
    std::string raw_value;
};

// Streams RawEntry values out of a line-oriented prf file.
// Blank lines, lines starting with '#', and lines that do not look like
// "name=value" are skipped without comment, so a complete preference dump can
// be fed through and only the recognized names act. Single pass only.
class LineParser {
public:
    explicit LineParser(std::istream& in);

    // Fetch the next entry; returns false once the stream is exhausted.
    bool Next(RawEntry& entry);

    std::size_t LinesRead() const { return lines_read_; }

private:
    std::istream& in_;
    std::size_t lines_read_;
};

// The two mandatory keys, as written in the file.
struct ColorKeyValues {
    std::string text;
    std::string background;
};

// Whole-text scan for exactly one ColorsText and one ColorsBackground with
// different values. Throws ImportError (MissingColorKey, DuplicateColorKey,
// IdenticalTextBackground); source only feeds the error message.
ColorKeyValues CheckColorKeys(const std::string& contents, const std::string& source);

std::string TrimWhitespace(const std::string& s);

#endif // SCHEMER_LINE_PARSER_HPP
