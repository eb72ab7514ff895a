#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "schemer/ImportError.hpp"
#include "schemer/LineParser.hpp"

namespace {
std::vector<RawEntry> ParseAll(const std::string& text) {
    std::istringstream in(text);
    LineParser parser(in);
    std::vector<RawEntry> entries;
    RawEntry entry;
    while (parser.Next(entry)) {
        entries.push_back(entry);
    }
    return entries;
}

ImportErrorKind KindOf(const std::string& text) {
    try {
        CheckColorKeys(text, "test.prf");
    } catch (const ImportError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "no ImportError for:\n" << text;
    return ImportErrorKind::BadFallbackShape;
}
}

TEST(LineParserTest, SkipsBlankCommentAndMalformedLines) {
    const std::vector<RawEntry> entries = ParseAll(
        "\n"
        "# comment=C1\n"
        "no equals sign here\n"
        "=C5\n"
        "name=#only comment\n"
        "ColorsText=C-1\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "ColorsText");
    EXPECT_EQ(entries[0].raw_value, "C-1");
}

TEST(LineParserTest, TrimsValueAndStopsAtComment) {
    const std::vector<RawEntry> entries = ParseAll("Colors_M_Errors=  C-65536   # red\r\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "Colors_M_Errors");
    EXPECT_EQ(entries[0].raw_value, "C-65536");
}

TEST(LineParserTest, NameIsKeptVerbatim) {
    const std::vector<RawEntry> entries = ParseAll("  ColorsText =C1\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "  ColorsText ");
}

TEST(LineParserTest, ValueMayContainEquals) {
    const std::vector<RawEntry> entries = ParseAll("a=b=c\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "a");
    EXPECT_EQ(entries[0].raw_value, "b=c");
}

TEST(LineParserTest, CountsLinesRead) {
    std::istringstream in("# header\nA=B\n\nC=D");
    LineParser parser(in);
    RawEntry entry;
    ASSERT_TRUE(parser.Next(entry));
    EXPECT_EQ(parser.LinesRead(), 2u);
    ASSERT_TRUE(parser.Next(entry));
    EXPECT_EQ(entry.raw_value, "D");
    EXPECT_FALSE(parser.Next(entry));
    EXPECT_EQ(parser.LinesRead(), 4u);
}

TEST(CheckColorKeysTest, AcceptsDistinctValues) {
    const ColorKeyValues keys = CheckColorKeys("ColorsText=C-1\nColorsBackground=C-16777216\n", "x");
    EXPECT_EQ(keys.text, "C-1");
    EXPECT_EQ(keys.background, "C-16777216");
}

TEST(CheckColorKeysTest, KeyAtEndOfFileWithoutNewline) {
    const ColorKeyValues keys = CheckColorKeys("ColorsBackground=C0\nColorsText=C-1", "x");
    EXPECT_EQ(keys.text, "C-1");
}

TEST(CheckColorKeysTest, MissingKeys) {
    EXPECT_EQ(KindOf("ColorsBackground=C0\n"), ImportErrorKind::MissingColorKey);
    EXPECT_EQ(KindOf("ColorsText=C-1\n"), ImportErrorKind::MissingColorKey);
    // A longer key ending in ColorsText does not count.
    EXPECT_EQ(KindOf("XColorsText=C-1\nColorsBackground=C0\n"), ImportErrorKind::MissingColorKey);
}

TEST(CheckColorKeysTest, DuplicateKeys) {
    EXPECT_EQ(KindOf("ColorsText=C-1\nColorsText=C-2\nColorsBackground=C0\n"), ImportErrorKind::DuplicateColorKey);
    EXPECT_EQ(KindOf("ColorsText=C-1\nColorsBackground=C0\nColorsBackground=C0\n"), ImportErrorKind::DuplicateColorKey);
}

TEST(CheckColorKeysTest, IdenticalValuesCompareAsText) {
    EXPECT_EQ(KindOf("ColorsText=C-1\nColorsBackground=C-1\n"), ImportErrorKind::IdenticalTextBackground);
    // Same number, different spelling: passes the scan.
    EXPECT_NO_THROW(CheckColorKeys("ColorsText=C-1\nColorsBackground=c-1\n", "x"));
}

TEST(CheckColorKeysTest, ValueStopsAtCommentMarker) {
    EXPECT_EQ(KindOf("ColorsText=C-1#a\nColorsBackground=C-1#b\n"), ImportErrorKind::MissingColorKey);
    const ColorKeyValues keys = CheckColorKeys("ColorsText=C-1 #a\nColorsBackground=C-2 #b\n", "x");
    EXPECT_EQ(keys.text, "C-1");
}

TEST(LineParserTest, VeryLongLineDoesNotExhaustTheStack) {
    const std::string layout(200000, 'x');
    const std::vector<RawEntry> entries = ParseAll(
        "Desktop.Layout=S" + layout + "\n"
        "ColorsText=C-1\n");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].raw_value.size(), layout.size() + 1);
    EXPECT_EQ(entries[1].name, "ColorsText");
}

TEST(CheckColorKeysTest, VeryLongTokenIsScannedLinearly) {
    const std::string text = "Desktop.Layout=S" + std::string(200000, 'x') + "\n"
                             "ColorsText=C-1\n"
                             "ColorsBackground=C0\n";
    const ColorKeyValues keys = CheckColorKeys(text, "x");
    EXPECT_EQ(keys.text, "C-1");
    EXPECT_EQ(keys.background, "C0");
}
