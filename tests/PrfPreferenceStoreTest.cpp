#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "schemer/PrfPreferenceStore.hpp"
#include "schemer/SchemeImporter.hpp"

namespace {
std::filesystem::path TempPath(const std::string& name) {
    return std::filesystem::temp_directory_path() / name;
}

std::string ReadAll(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}
}

TEST(PrfPreferenceStoreTest, EncodesValuesInPrfFormat) {
    PrfPreferenceStore store;
    store.SetBooleanPreference("EditorRightTextLineVisible", true);
    store.SetIntegerPreference("EditorRightTextLimitLineWidth", 2);
    store.SetColorPreference("Colors_M_Errors", Rgb{255, 0, 0});

    const std::filesystem::path path = TempPath("schemer_store_encode.prf");
    ASSERT_TRUE(store.SaveToFile(path));
    const std::string saved = ReadAll(path);
    EXPECT_NE(saved.find("EditorRightTextLineVisible=Btrue\n"), std::string::npos);
    EXPECT_NE(saved.find("EditorRightTextLimitLineWidth=I2\n"), std::string::npos);
    EXPECT_NE(saved.find("Colors_M_Errors=C-65536\n"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(PrfPreferenceStoreTest, LoadKeepsUnrelatedPreferences) {
    const std::filesystem::path path = TempPath("schemer_store_load.prf");
    {
        std::ofstream out(path);
        out << "#MATLAB Preferences\n"
            << "EditorFontSize=I12\n"
            << "ColorsText=C-1\n"
            << "Desktop.Layout=Sdefault\n";
    }

    PrfPreferenceStore store;
    ASSERT_TRUE(store.LoadFromFile(path));
    EXPECT_EQ(store.Size(), 3u);
    EXPECT_EQ(store.GetIntegerPreference("EditorFontSize", 0), 12);
    EXPECT_EQ(store.GetColorPreference("ColorsText"), (Rgb{255, 255, 255}));
    EXPECT_TRUE(store.HasPreference("Desktop.Layout"));

    ASSERT_TRUE(store.SaveToFile(path));
    EXPECT_NE(ReadAll(path).find("Desktop.Layout=Sdefault\n"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(PrfPreferenceStoreTest, UnknownOrMalformedColorsReadAsDefault) {
    PrfPreferenceStore store(Rgb{10, 20, 30});
    EXPECT_EQ(store.GetColorPreference("Missing"), (Rgb{10, 20, 30}));
    store.SetIntegerPreference("NotAColor", 5);
    EXPECT_EQ(store.GetColorPreference("NotAColor"), (Rgb{10, 20, 30}));
    EXPECT_EQ(store.GetBooleanPreference("NotAColor", true), true);
}

TEST(PrfPreferenceStoreTest, MissingFileFailsToLoad) {
    PrfPreferenceStore store;
    EXPECT_FALSE(store.LoadFromFile("/nonexistent/schemer/matlab.prf"));
}

TEST(PrfPreferenceStoreTest, SettersAreIdempotent) {
    PrfPreferenceStore store;
    store.SetColorPreference("ColorsText", Rgb{1, 2, 3});
    store.SetColorPreference("ColorsText", Rgb{1, 2, 3});
    EXPECT_EQ(store.Size(), 1u);
    EXPECT_EQ(store.GetColorPreference("ColorsText"), (Rgb{1, 2, 3}));
}

TEST(PrfPreferenceStoreTest, ListenersHearEveryImportedColor) {
    PrfPreferenceStore store;
    std::vector<std::string> heard;
    store.AddColorListener([&heard](const std::string& name) { heard.push_back(name); });

    SchemeImporter importer(store);
    importer.Import("ColorsText=C-1\nColorsBackground=C-16777216\n", {});

    ASSERT_FALSE(heard.empty());
    EXPECT_EQ(heard[0], "ColorsText");
    EXPECT_EQ(heard[1], "ColorsBackground");
    // Both main colors plus every derived color.
    EXPECT_EQ(heard.size(), 63u);
    EXPECT_EQ(store.GetColorPreference("Colors_M_Comments"), (Rgb{128, 128, 128}));
}

TEST(PrfPreferenceStoreTest, ValuesWithHashOrEmptySurviveLoadAndSave) {
    const std::filesystem::path path = TempPath("schemer_store_verbatim.prf");
    {
        std::ofstream out(path);
        out << "#MATLAB Preferences\n"
            << "CurrentDirectory=S/home/u/proj#1\n"
            << "EmptyString=\n"
            << "ColorsText=C-1\n";
    }

    PrfPreferenceStore store;
    ASSERT_TRUE(store.LoadFromFile(path));
    EXPECT_EQ(store.Size(), 3u);
    EXPECT_TRUE(store.HasPreference("EmptyString"));

    store.SetColorPreference("ColorsBackground", Rgb{0, 0, 0});
    ASSERT_TRUE(store.SaveToFile(path));
    const std::string saved = ReadAll(path);
    EXPECT_NE(saved.find("CurrentDirectory=S/home/u/proj#1\n"), std::string::npos);
    EXPECT_NE(saved.find("EmptyString=\n"), std::string::npos);
    EXPECT_NE(saved.find("ColorsText=C-1\n"), std::string::npos);
    std::filesystem::remove(path);
}
