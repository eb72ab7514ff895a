#include "schemer/LineParser.hpp"

#include <cctype>
#include <vector>

#include "schemer/ImportError.hpp"

namespace {
bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Values of every "<key>=<token>" where the key starts the text or follows
// whitespace and the token, free of '#' and whitespace, runs up to whitespace
// or the end of the text.
std::vector<std::string> FindDeclarations(const std::string& contents, const std::string& key) {
    const std::string needle = key + "=";
    std::vector<std::string> values;
    for (std::size_t pos = contents.find(needle); pos != std::string::npos; pos = contents.find(needle, pos + 1)) {
        if (pos > 0 && !IsSpace(contents[pos - 1])) {
            continue;
        }
        const std::size_t start = pos + needle.size();
        std::size_t end = start;
        while (end < contents.size() && contents[end] != '#' && !IsSpace(contents[end])) {
            ++end;
        }
        // An empty token, or one cut short by '#', is not a declaration.
        if (end == start || (end < contents.size() && contents[end] == '#')) {
            continue;
        }
        values.push_back(contents.substr(start, end - start));
    }
    return values;
}

std::string RequireSingle(const std::string& contents,
                          const std::string& key,
                          const std::string& label,
                          const std::string& source) {
    const std::vector<std::string> values = FindDeclarations(contents, key);
    if (values.empty()) {
        throw ImportError(ImportErrorKind::MissingColorKey,
                          label + " colour not present in colorscheme file: " + source);
    }
    if (values.size() > 1) {
        throw ImportError(ImportErrorKind::DuplicateColorKey,
                          label + " colour defined multiple times in colorscheme file: " + source);
    }
    return values.front();
}
}

std::string TrimWhitespace(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

LineParser::LineParser(std::istream& in)
    : in_(in),
      lines_read_(0) {}

bool LineParser::Next(RawEntry& entry) {
    std::string line;
    while (std::getline(in_, line)) {
        ++lines_read_;
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // "name=value": the name holds no '#', the value runs to the next '#'
        // and must not be empty before trimming.
        const std::size_t equals = line.find('=');
        if (equals == std::string::npos || equals == 0) {
            continue;
        }
        if (line.find('#') < equals) {
            continue;
        }
        const std::size_t hash = line.find('#', equals + 1);
        const std::size_t value_end = hash == std::string::npos ? line.size() : hash;
        if (value_end == equals + 1) {
            continue;
        }

        // The name is kept verbatim; only the value is trimmed.
        entry.name = line.substr(0, equals);
        entry.raw_value = TrimWhitespace(line.substr(equals + 1, value_end - equals - 1));
        return true;
    }
    return false;
}

ColorKeyValues CheckColorKeys(const std::string& contents, const std::string& source) {
    ColorKeyValues keys;
    keys.text = RequireSingle(contents, "ColorsText", "Text", source);
    keys.background = RequireSingle(contents, "ColorsBackground", "Background", source);
    if (keys.text == keys.background) {
        throw ImportError(ImportErrorKind::IdenticalTextBackground,
                          "Main text and background colours are the same in this file: " + source);
    }
    return keys;
}
