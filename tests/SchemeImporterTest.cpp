#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include "FakePreferenceStore.hpp"
#include "schemer/ImportError.hpp"
#include "schemer/SchemeImporter.hpp"

namespace {
const char* const kMinimalScheme =
    "# minimal scheme\n"
    "ColorsText=C-1\n"
    "ColorsBackground=C-16777216\n";

ImportErrorKind ImportKind(SchemeImporter& importer, const std::string& text, const ImportOptions& options = {}) {
    try {
        importer.Import(text, options);
    } catch (const ImportError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "import succeeded unexpectedly";
    return ImportErrorKind::FileOpen;
}

// Registry with only the main colors plus the given extra entries.
PreferenceTables TablesWith(const std::vector<ColorEntry>& extra) {
    std::vector<ColorEntry> entries{
        ColorEntry{"ColorsText", FallbackSpec::None(), false},
        ColorEntry{"ColorsBackground", FallbackSpec::None(), false}};
    entries.insert(entries.end(), extra.begin(), extra.end());
    return PreferenceTables({}, {}, ColorRegistry(entries));
}

bool Contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}
}

TEST(SchemeImporterTest, MinimalSchemeResolvesEveryDerivableColor) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    const ImportReport report = importer.Import(std::string(kMinimalScheme) + "Colors_M_Keywords=C-16776961\n", {});

    EXPECT_EQ(report.direct_colors.size(), 3u);
    EXPECT_EQ(report.fallback_colors.size(), 60u);
    for (const ColorEntry& entry : ColorRegistry::Default().Entries()) {
        EXPECT_TRUE(store.HasColor(entry.name)) << entry.name;
    }
    EXPECT_EQ(store.colors["ColorsText"], (Rgb{255, 255, 255}));
    EXPECT_EQ(store.colors["Colors_M_Keywords"], (Rgb{0, 0, 255}));
    EXPECT_EQ(store.colors["Colors_M_SystemCommands"], (Rgb{0, 0, 255}));
    EXPECT_EQ(store.colors["Colors_M_Warnings"], (Rgb{255, 148, 0}));
    // Every write is followed by a notification for the same name.
    EXPECT_EQ(store.notified.size(), 63u);
}

TEST(SchemeImporterTest, FullPreferenceDumpWithLongLinesImports) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    const std::string dump = "#MATLAB Preferences\n"
                             "Desktop.Layout=S" + std::string(200000, 'x') + "\n"
                             + kMinimalScheme;
    const ImportReport report = importer.Import(dump, {});

    EXPECT_EQ(report.direct_colors.size(), 2u);
    EXPECT_TRUE(report.warnings.empty());
    EXPECT_EQ(store.colors["Colors_M_Comments"], (Rgb{128, 128, 128}));
}

TEST(SchemeImporterTest, ReferenceCopiesCurrentValue) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    importer.Import(std::string(kMinimalScheme) + "Colors_M_Errors=C-65536\n", {});

    EXPECT_EQ(store.colors["Colors_M_UnterminatedStrings"], (Rgb{255, 0, 0}));
}

TEST(SchemeImporterTest, AverageRoundsHalfUp) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    importer.Import(kMinimalScheme, {});

    // (255 + 0) / 2 = 127.5
    EXPECT_EQ(store.colors["Colors_M_Comments"], (Rgb{128, 128, 128}));
}

TEST(SchemeImporterTest, AverageJustBelowHalfRoundsDown) {
    FakePreferenceStore store;
    SchemeImporter importer(store, TablesWith({
        ColorEntry{"Mix", FallbackSpec::Average({"ColorsText", "ColorsBackground", "Third"}), false},
        ColorEntry{"Third", FallbackSpec::None(), false}}));

    // Mean of 255, 0, 127 is 127.33; of 255, 0, 128 is 127.67.
    importer.Import("ColorsText=C-1\nColorsBackground=C-16777216\nThird=C-8421505\n", {});
    EXPECT_EQ(store.colors["Mix"], (Rgb{127, 127, 127}));

    importer.Import("ColorsText=C-1\nColorsBackground=C-16777216\nThird=C-8355712\n", {});
    EXPECT_EQ(store.colors["Mix"], (Rgb{128, 128, 128}));
}

TEST(SchemeImporterTest, ScaledAndLiteralFallbacks) {
    FakePreferenceStore store;
    SchemeImporter importer(store, TablesWith({
        ColorEntry{"Dim", FallbackSpec::Scaled("ColorsText", 0.5), false},
        ColorEntry{"Bright", FallbackSpec::Scaled("ColorsBackground", 3.0), false},
        ColorEntry{"Fixed", FallbackSpec::Literal(-27648), false}}));

    importer.Import("ColorsText=C-1\nColorsBackground=C-10461088\n", {});

    EXPECT_EQ(store.colors["Dim"], (Rgb{128, 128, 128}));
    EXPECT_EQ(store.colors["Bright"], (Rgb{255, 255, 255}));
    EXPECT_EQ(store.colors["Fixed"], (Rgb{255, 148, 0}));
}

TEST(SchemeImporterTest, FallbackChainsFollowDeclarationOrderInOnePass) {
    FakePreferenceStore store;
    store.colors["Late"] = Rgb{1, 2, 3};
    SchemeImporter importer(store, TablesWith({
        // Early reads Late before Late has been resolved in this run.
        ColorEntry{"Early", FallbackSpec::Reference("Late"), false},
        ColorEntry{"Late", FallbackSpec::Reference("ColorsText"), false},
        // Tail reads Late after it was resolved above.
        ColorEntry{"Tail", FallbackSpec::Reference("Late"), false}}));

    const ImportReport report = importer.Import("ColorsText=C-1\nColorsBackground=C-16777216\n", {});

    EXPECT_EQ(store.colors["Early"], (Rgb{1, 2, 3}));
    EXPECT_EQ(store.colors["Late"], (Rgb{255, 255, 255}));
    EXPECT_EQ(store.colors["Tail"], (Rgb{255, 255, 255}));
    EXPECT_EQ(report.fallback_colors, (std::vector<std::string>{"Early", "Late", "Tail"}));
}

TEST(SchemeImporterTest, RerunningAfterPartialStateChangesChainedResult) {
    FakePreferenceStore store;
    SchemeImporter importer(store, TablesWith({
        ColorEntry{"Early", FallbackSpec::Reference("Late"), false},
        ColorEntry{"Late", FallbackSpec::Reference("ColorsText"), false}}));

    importer.Import("ColorsText=C-1\nColorsBackground=C-16777216\n", {});
    EXPECT_EQ(store.colors["Early"], (Rgb{0, 0, 0}));

    importer.Import("ColorsText=C-1\nColorsBackground=C-16777216\n", {});
    EXPECT_EQ(store.colors["Early"], (Rgb{255, 255, 255}));
}

TEST(SchemeImporterTest, MissingTextColorWritesNothing) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    EXPECT_EQ(ImportKind(importer, "ColorsBackground=C0\nColors_M_Errors=C-65536\n"),
              ImportErrorKind::MissingColorKey);
    EXPECT_TRUE(store.writes.empty());
    EXPECT_TRUE(store.notified.empty());
}

TEST(SchemeImporterTest, DuplicateAndIdenticalKeysWriteNothing) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    EXPECT_EQ(ImportKind(importer, "ColorsText=C-1\nColorsText=C-2\nColorsBackground=C0\n"),
              ImportErrorKind::DuplicateColorKey);
    EXPECT_EQ(ImportKind(importer, "ColorsText=C-1\nColorsBackground=C-1\nColors_M_Errors=C-65536\n"),
              ImportErrorKind::IdenticalTextBackground);
    EXPECT_TRUE(store.writes.empty());
}

TEST(SchemeImporterTest, NoRecognizedColorsIsFatalEvenAfterPreconditionPasses) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    // The whitespace scan finds both keys inside the comment line, but no
    // line parses as a recognized color entry.
    const std::string text =
        "# ColorsText=C-1 ColorsBackground=C0 \n"
        "EditorRightTextLimitLineWidth=I2\n"
        "SomethingElse=C5\n";
    EXPECT_EQ(ImportKind(importer, text), ImportErrorKind::NoColorsFound);
    // Phase 1 writes stay; phase 2 never ran.
    EXPECT_EQ(store.writes, std::vector<std::string>{"int:EditorRightTextLimitLineWidth"});
    EXPECT_TRUE(store.colors.empty());
}

TEST(SchemeImporterTest, BooleansIgnoredUnlessEnabled) {
    const std::string text = std::string(kMinimalScheme) + "EditorRightTextLineVisible=Btrue\n";

    FakePreferenceStore off_store;
    SchemeImporter off(off_store);
    const ImportReport off_report = off.Import(text, {});
    EXPECT_TRUE(off_store.booleans.empty());
    EXPECT_EQ(off_report.booleans_set, 0u);
    EXPECT_FALSE(off_report.included_booleans);

    FakePreferenceStore on_store;
    SchemeImporter on(on_store);
    ImportOptions options;
    options.include_boolean_preferences = true;
    const ImportReport on_report = on.Import(text, options);
    ASSERT_EQ(on_store.booleans.count("EditorRightTextLineVisible"), 1u);
    EXPECT_TRUE(on_store.booleans["EditorRightTextLineVisible"]);
    EXPECT_EQ(on_report.booleans_set, 1u);
}

TEST(SchemeImporterTest, IntegersAreWritten) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    const ImportReport report = importer.Import(std::string(kMinimalScheme) + "EditorRightTextLimitLineWidth=I3\n", {});
    EXPECT_EQ(store.integers["EditorRightTextLimitLineWidth"], 3);
    EXPECT_EQ(report.integers_set, 1u);
}

TEST(SchemeImporterTest, MalformedValuesWarnAndSkip) {
    FakePreferenceStore store;
    SchemeImporter importer(store);
    std::vector<ImportWarning> seen;
    importer.SetWarningCallback([&seen](const ImportWarning& warning) { seen.push_back(warning); });

    ImportOptions options;
    options.include_boolean_preferences = true;
    const ImportReport report = importer.Import(std::string(kMinimalScheme)
        + "ColorsUseSystem=yes\n"
        + "EditorRightTextLimitLineWidth=3\n"
        + "Colors_M_Keywords=blue\n", options);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].kind, WarningKind::BadBoolean);
    EXPECT_EQ(seen[1].kind, WarningKind::BadInteger);
    EXPECT_EQ(seen[2].kind, WarningKind::BadColor);
    EXPECT_EQ(seen[2].name, "Colors_M_Keywords");
    EXPECT_EQ(seen[2].raw_value, "blue");
    EXPECT_EQ(report.warnings.size(), 3u);

    EXPECT_TRUE(store.booleans.empty());
    EXPECT_TRUE(store.integers.empty());
    // The bad keyword line was skipped, so the fallback filled it in.
    EXPECT_TRUE(Contains(report.fallback_colors, "Colors_M_Keywords"));
    EXPECT_EQ(store.colors["Colors_M_Keywords"], (Rgb{255, 255, 255}));
}

TEST(SchemeImporterTest, IrrelevantAndMalformedLinesAreSilent) {
    FakePreferenceStore store;
    SchemeImporter importer(store);
    bool warned = false;
    importer.SetWarningCallback([&warned](const ImportWarning&) { warned = true; });

    const ImportReport report = importer.Import(std::string(kMinimalScheme)
        + "\n"
        + "# just a comment\n"
        + "garbage without equals\n"
        + "EditorFontSize=I12\n"
        + "Desktop.Layout=Sblah\n", {});

    EXPECT_FALSE(warned);
    EXPECT_TRUE(report.warnings.empty());
    EXPECT_EQ(store.integers.count("EditorFontSize"), 0u);
    EXPECT_TRUE(store.integers.empty());
}

TEST(SchemeImporterTest, ColorWrittenTwiceCountsOnce) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    const ImportReport report = importer.Import(std::string(kMinimalScheme)
        + "Colors_M_Strings=C-65536\n"
        + "Colors_M_Strings=C-16711936\n", {});

    EXPECT_EQ(std::count(report.direct_colors.begin(), report.direct_colors.end(), "Colors_M_Strings"), 1);
    EXPECT_EQ(store.colors["Colors_M_Strings"], (Rgb{0, 255, 0}));
    EXPECT_FALSE(Contains(report.fallback_colors, "Colors_M_Strings"));
}

TEST(SchemeImporterTest, ExplicitValueIsNotOverwrittenByFallback) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    importer.Import(std::string(kMinimalScheme) + "Colors_M_Errors=C-16711936\n", {});

    EXPECT_EQ(store.colors["Colors_M_Errors"], (Rgb{0, 255, 0}));
    EXPECT_EQ(store.colors["Color_CmdWinErrors"], (Rgb{0, 255, 0}));
}

TEST(SchemeImporterTest, NoneFallbackLeavesStoreValue) {
    FakePreferenceStore store;
    SchemeImporter importer(store, TablesWith({
        ColorEntry{"Keep", FallbackSpec::None(), false}}));
    store.colors["Keep"] = Rgb{9, 9, 9};

    const ImportReport report = importer.Import("ColorsText=C-1\nColorsBackground=C-16777216\n", {});

    EXPECT_EQ(store.colors["Keep"], (Rgb{9, 9, 9}));
    EXPECT_TRUE(report.fallback_colors.empty());
}

TEST(SchemeImporterTest, BadFallbackShapeAbortsButKeepsEarlierWrites) {
    FakePreferenceStore store;
    SchemeImporter importer(store, TablesWith({
        ColorEntry{"First", FallbackSpec::Reference("ColorsText"), false},
        ColorEntry{"Broken", FallbackSpec::Average({}), false},
        ColorEntry{"Never", FallbackSpec::Reference("ColorsText"), false}}));

    EXPECT_EQ(ImportKind(importer, "ColorsText=C-1\nColorsBackground=C-16777216\n"),
              ImportErrorKind::BadFallbackShape);
    EXPECT_TRUE(store.HasColor("ColorsText"));
    EXPECT_TRUE(store.HasColor("First"));
    EXPECT_FALSE(store.HasColor("Broken"));
    EXPECT_FALSE(store.HasColor("Never"));
}

TEST(SchemeImporterTest, EmptyReferenceIsABadShape) {
    FakePreferenceStore store;
    SchemeImporter importer(store, TablesWith({
        ColorEntry{"Broken", FallbackSpec::Reference(""), false}}));

    EXPECT_EQ(ImportKind(importer, "ColorsText=C-1\nColorsBackground=C-16777216\n"),
              ImportErrorKind::BadFallbackShape);
}

TEST(SchemeImporterTest, ImportFileReadsFromDisk) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "schemer_import_test.prf";
    {
        std::ofstream out(path);
        out << kMinimalScheme << "Colors_M_Errors=C-65536\n";
    }

    FakePreferenceStore store;
    SchemeImporter importer(store);
    const ImportReport report = importer.ImportFile(path, {});
    EXPECT_EQ(report.source, path.string());
    EXPECT_EQ(store.colors["Colors_M_UnterminatedStrings"], (Rgb{255, 0, 0}));

    std::filesystem::remove(path);
}

TEST(SchemeImporterTest, MissingFileIsFileOpenError) {
    FakePreferenceStore store;
    SchemeImporter importer(store);

    try {
        importer.ImportFile("/nonexistent/schemer/scheme.prf", {});
        FAIL() << "expected ImportError";
    } catch (const ImportError& e) {
        EXPECT_EQ(e.kind(), ImportErrorKind::FileOpen);
    }
    EXPECT_TRUE(store.writes.empty());
}
