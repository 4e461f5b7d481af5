#include <gtest/gtest.h>
#include "core/Theme.hpp"
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

TEST(ThemeTest, PresetPalettes) {
    ColorPalette dark = Theme::dark().colors();
    EXPECT_EQ(dark.background, colors::Black);
    EXPECT_EQ(dark.foreground, colors::White);
    EXPECT_EQ(dark.primary, colors::Blue);
    EXPECT_EQ(dark.error, colors::Red);

    ColorPalette light = Theme::light().colors();
    EXPECT_EQ(light.background, colors::White);
    EXPECT_EQ(light.foreground, colors::Black);

    ColorPalette slime = Theme::slime().colors();
    EXPECT_EQ(slime.background, Color::rgb(30, 35, 36));
    EXPECT_EQ(slime.foreground, Color::rgb(224, 224, 224));
    EXPECT_EQ(slime.primary, Color::rgb(168, 223, 90));
    EXPECT_EQ(slime.error, Color::rgb(205, 101, 100));

    EXPECT_EQ(Theme().name(), "Dark");
    EXPECT_EQ(Theme::slime().name(), "Slime");
}

TEST(ThemeTest, NamedStylesFollowPalette) {
    Theme t = Theme::dark();
    EXPECT_EQ(t.style("title"), Style{}.withFg(colors::Blue));
    EXPECT_EQ(t.style("border"), Style{}.withFg(colors::Cyan));
    EXPECT_EQ(t.style("focus"), Style{}.withFg(colors::Blue));
    EXPECT_EQ(t.style("list_selected"), Style{}.withFg(colors::Black).withBg(colors::Blue));
    EXPECT_EQ(t.baseStyle(), Style{}.withFg(colors::White).withBg(colors::Black));
    EXPECT_EQ(t.warningStyle(), Style{}.withFg(colors::Yellow));

    // Unknown names fall back to the foreground colour
    EXPECT_FALSE(t.hasStyle("sidebar"));
    EXPECT_EQ(t.style("sidebar"), Style{}.withFg(colors::White));

    t.setStyle("sidebar", Style{}.withFg(colors::Green).add(Modifier::Italic));
    EXPECT_EQ(t.style("sidebar"), Style{}.withFg(colors::Green).add(Modifier::Italic));
}

TEST(ThemeTest, PresetLookup) {
    ASSERT_TRUE(Theme::preset("slime").has_value());
    EXPECT_EQ(Theme::preset("SLIME")->name(), "Slime");
    EXPECT_EQ(Theme::preset("Light")->colors(), ColorPalette::light());
    EXPECT_FALSE(Theme::preset("neon").has_value());
    EXPECT_EQ(Theme::presetNames(), (std::vector<std::string>{"dark", "light", "slime"}));
}

TEST(ThemeTest, JsonStartsFromBaseAndDerivesStyles) {
    Theme t = Theme::fromJson(json{
        {"name", "Harbor"},
        {"base", "light"},
        {"colors", {{"primary", "#112233"}}},
        {"styles", {{"title", {{"fg", "yellow"}, {"modifiers", json::array({"bold", "underline"})}}}}},
    });

    EXPECT_EQ(t.name(), "Harbor");
    EXPECT_EQ(t.colors().background, colors::White);
    EXPECT_EQ(t.colors().primary, Color::rgb(0x11, 0x22, 0x33));
    EXPECT_EQ(t.style("title"),
              Style{}.withFg(colors::Yellow).add(Modifier::Bold | Modifier::Underline));
    // Not listed: derived from the merged palette
    EXPECT_EQ(t.style("focus"), Style{}.withFg(Color::rgb(0x11, 0x22, 0x33)));

    Theme plain = Theme::fromJson(json::object());
    EXPECT_EQ(plain.name(), "Custom");
    EXPECT_EQ(plain.colors(), ColorPalette::dark());
}

TEST(ThemeTest, JsonErrors) {
    EXPECT_THROW(Theme::fromJson(json::array()), ThemeError);
    EXPECT_THROW(Theme::fromJson(json{{"base", "neon"}}), ThemeError);
    EXPECT_THROW(Theme::fromJson(json{{"colors", {{"primary", "chartreuse"}}}}), ThemeError);
    EXPECT_THROW(Theme::fromJson(json{{"colors", {{"sidebar", "red"}}}}), ThemeError);
    EXPECT_THROW(Theme::fromJson(json{{"colors", {{"primary", 4}}}}), ThemeError);
    EXPECT_THROW(Theme::fromJson(json{{"styles", {{"title", {{"modifiers", json::array({"sparkly"})}}}}}}),
                 ThemeError);
    EXPECT_THROW(Theme::fromJson(json{{"styles", {{"title", "red"}}}}), ThemeError);
    EXPECT_THROW(Theme::fromJson(json{{"name", 7}}), ThemeError);

    try {
        Theme::fromJson(json{{"colors", {{"warning", "#zzzzzz"}}}});
        FAIL() << "expected ThemeError";
    } catch (const ThemeError& e) {
        EXPECT_EQ(std::string(e.what()), "unknown colour '#zzzzzz' for 'warning'");
    }
}

class ThemeFileTest : public ::testing::Test {
protected:
    fs::path tmpDir_;

    void SetUp() override {
        tmpDir_ = fs::temp_directory_path() / "tuidash_theme_test";
        fs::remove_all(tmpDir_);
        fs::create_directories(tmpDir_);
    }

    void TearDown() override {
        fs::remove_all(tmpDir_);
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        fs::path p = tmpDir_ / name;
        std::ofstream f(p, std::ios::trunc);
        f << content;
        return p;
    }
};

TEST_F(ThemeFileTest, SavedThemeLoadsBack) {
    Theme t = Theme::slime();
    t.setStyle("sidebar", Style{}.withBg(colors::DarkGray).remove(Modifier::Bold));
    fs::path p = tmpDir_ / "slime.json";
    t.saveFile(p);

    Theme loaded = Theme::loadFile(p);
    EXPECT_EQ(loaded.name(), "Slime");
    EXPECT_EQ(loaded.colors(), t.colors());
    EXPECT_EQ(loaded.styles(), t.styles());
}

TEST_F(ThemeFileTest, ResolveAcceptsPresetOrFile) {
    auto p = writeFile("mine.json", R"({"name": "Mine", "colors": {"accent": "lightgreen"}})");
    EXPECT_EQ(Theme::resolve("light").name(), "Light");
    Theme mine = Theme::resolve(p.string());
    EXPECT_EQ(mine.name(), "Mine");
    EXPECT_EQ(mine.colors().accent, colors::LightGreen);

    EXPECT_THROW(Theme::resolve((tmpDir_ / "absent.json").string()), ThemeError);
    EXPECT_THROW(Theme::resolve("neon"), ThemeError);
}

TEST_F(ThemeFileTest, BadFilesThrow) {
    EXPECT_THROW(Theme::loadFile(tmpDir_ / "absent.json"), ThemeError);

    auto malformed = writeFile("bad.json", "{ \"name\": ");
    EXPECT_THROW(Theme::loadFile(malformed), ThemeError);

    auto badColour = writeFile("colour.json", R"({"colors": {"primary": "nope"}})");
    try {
        Theme::loadFile(badColour);
        FAIL() << "expected ThemeError";
    } catch (const ThemeError& e) {
        EXPECT_NE(std::string(e.what()).find("colour.json"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("unknown colour 'nope'"), std::string::npos);
    }
}
