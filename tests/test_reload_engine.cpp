#include <gtest/gtest.h>
#include "reload/ReloadEngine.hpp"
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ReloadEngineTest : public ::testing::Test {
protected:
    fs::path tmpDir_;
    ReloadEngine engine_;

    void SetUp() override {
        tmpDir_ = fs::temp_directory_path() / "tuidash_reload_test";
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
        return FileLoader::normalize(p);
    }

    // Drives pollChanges() until `done` holds or two seconds pass.
    template <typename Pred>
    bool pollUntil(Pred done) {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (std::chrono::steady_clock::now() < deadline) {
            engine_.pollChanges();
            if (done()) return true;
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }

    static bool contains(const CellBuffer& buf, const std::string& text) {
        for (uint16_t y = buf.area().top(); y < buf.area().bottom(); y++) {
            std::string row;
            for (uint16_t x = buf.area().left(); x < buf.area().right(); x++)
                row += buf.at(x, y)->glyph();
            if (row.find(text) != std::string::npos) return true;
        }
        return false;
    }

    // a.fsx includes b.fsx
    void writeTwoFileDashboard(const std::string& label = "v1") {
        writeFile("b.fsx", "border rounded\nstate host \"box\"\n");
        writeFile("a.fsx",
                  "#load \"b.fsx\"\n"
                  "title \"Main " + label + "\"\n"
                  "panel info fill \"Info\"\n"
                  "text \"Host: {host}\"\n"
                  "list procs \"init\" \"sshd\" \"bash\"\n");
    }
};

TEST_F(ReloadEngineTest, StartsIdleWithPlaceholder) {
    EXPECT_EQ(engine_.status(), ReloadEngine::Status::Idle);
    EXPECT_EQ(engine_.definition(), nullptr);
    EXPECT_TRUE(contains(engine_.render(Rect(0, 0, 60, 12)), "No dashboard loaded."));
}

TEST_F(ReloadEngineTest, LoadsEntryWithIncludes) {
    writeTwoFileDashboard();
    auto a = FileLoader::normalize(tmpDir_ / "a.fsx");
    auto b = FileLoader::normalize(tmpDir_ / "b.fsx");

    ASSERT_TRUE(engine_.load(tmpDir_ / "a.fsx"));
    EXPECT_EQ(engine_.status(), ReloadEngine::Status::Ready);
    EXPECT_STREQ(toString(engine_.status()), "ready");
    EXPECT_EQ(engine_.entryPath(), a);
    EXPECT_EQ(engine_.lastLoadOrder(), (std::vector<fs::path>{b, a}));
    EXPECT_EQ(engine_.dependencySet(), (std::set<fs::path>{a, b}));
    EXPECT_EQ(engine_.reloadCount(), 1u);
    EXPECT_TRUE(engine_.state().loaded);
    EXPECT_FALSE(engine_.state().lastError.has_value());

    ASSERT_NE(engine_.definition(), nullptr);
    EXPECT_EQ(engine_.definition()->title, "Main v1");
    EXPECT_TRUE(contains(engine_.render(Rect(0, 0, 40, 10)), "Host: box"));
}

TEST_F(ReloadEngineTest, DependencyChangeTriggersReload) {
    writeTwoFileDashboard();
    ASSERT_TRUE(engine_.load(tmpDir_ / "a.fsx"));
    engine_.enableHotReload(20ms, true);
    EXPECT_TRUE(engine_.hotReloadEnabled());

    std::this_thread::sleep_for(20ms);
    writeFile("b.fsx", "border rounded\nstate host \"box\"\nreset status \"edited\"\n");

    auto b = FileLoader::normalize(tmpDir_ / "b.fsx");
    std::optional<std::set<fs::path>> seen;
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!seen && std::chrono::steady_clock::now() < deadline) {
        seen = engine_.pollChanges();
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->count(b), 1u);

    EXPECT_EQ(engine_.reloadCount(), 2u);
    EXPECT_EQ(engine_.state().userState.at("status"), "edited");
    ASSERT_EQ(engine_.lastLoadOrder().size(), 2u);
    EXPECT_EQ(engine_.lastLoadOrder().front(), b);
}

TEST_F(ReloadEngineTest, FailedReloadKeepsWorkingDashboard) {
    writeTwoFileDashboard();
    ASSERT_TRUE(engine_.load(tmpDir_ / "a.fsx"));

    engine_.state().userState["host"] = "edited-at-runtime";
    engine_.state().uiState["procs"].selected = 2;
    DashboardState before = engine_.state();
    CellBuffer frameBefore = engine_.render(Rect(0, 0, 40, 10));

    writeFile("a.fsx", "#load \"b.fsx\"\ntitle \"Broken\"\npanel p fill\nbogus\n");
    EXPECT_FALSE(engine_.reload());

    EXPECT_EQ(engine_.status(), ReloadEngine::Status::Failed);
    ASSERT_TRUE(engine_.state().lastError.has_value());
    const ErrorInfo& err = *engine_.state().lastError;
    EXPECT_EQ(err.title, "Parse Error");
    EXPECT_FALSE(err.message.empty());
    EXPECT_EQ(err.line, 4);
    EXPECT_EQ(err.column, 1);

    // Definition, user state and widget state are untouched
    EXPECT_EQ(engine_.definition()->title, "Main v1");
    EXPECT_EQ(engine_.state().userState, before.userState);
    EXPECT_EQ(engine_.state().uiState.at("procs").selected, before.uiState.at("procs").selected);
    EXPECT_EQ(engine_.state().focusedWidget, before.focusedWidget);
    EXPECT_EQ(engine_.render(Rect(0, 0, 40, 10)), frameBefore);
    EXPECT_EQ(engine_.reloadCount(), 1u);
}

TEST_F(ReloadEngineTest, FixedFileClearsError) {
    writeTwoFileDashboard();
    ASSERT_TRUE(engine_.load(tmpDir_ / "a.fsx"));
    writeFile("a.fsx", "title \"unterminated\n");
    ASSERT_FALSE(engine_.reload());

    writeTwoFileDashboard("v2");
    EXPECT_TRUE(engine_.reload());
    EXPECT_EQ(engine_.status(), ReloadEngine::Status::Ready);
    EXPECT_FALSE(engine_.state().lastError.has_value());
    EXPECT_EQ(engine_.definition()->title, "Main v2");
}

TEST_F(ReloadEngineTest, BrokenDependencyIsStillWatched) {
    writeTwoFileDashboard();
    ASSERT_TRUE(engine_.load(tmpDir_ / "a.fsx"));
    engine_.enableHotReload(20ms, true);

    std::this_thread::sleep_for(20ms);
    writeFile("b.fsx", "border wavy\n");
    ASSERT_TRUE(pollUntil([&] { return engine_.status() == ReloadEngine::Status::Failed; }));
    EXPECT_EQ(engine_.state().lastError->title, "Parse Error");

    std::this_thread::sleep_for(20ms);
    writeFile("b.fsx", "border double\nstate host \"fixed\"\n");
    ASSERT_TRUE(pollUntil([&] { return engine_.status() == ReloadEngine::Status::Ready; }));
    EXPECT_EQ(engine_.definition()->border, BorderType::Double);
    EXPECT_FALSE(engine_.state().lastError.has_value());
}

TEST_F(ReloadEngineTest, DefaultsFillAbsentKeysAndResetsOverwrite) {
    writeFile("a.fsx", "state host \"initial\"\nreset status \"starting\"\n");
    ASSERT_TRUE(engine_.load(tmpDir_ / "a.fsx"));
    EXPECT_EQ(engine_.state().userState.at("host"), "initial");
    EXPECT_EQ(engine_.state().userState.at("status"), "starting");

    engine_.state().userState["host"]   = "changed";
    engine_.state().userState["status"] = "running";
    engine_.state().userState["extra"]  = 7;

    ASSERT_TRUE(engine_.reload());
    EXPECT_EQ(engine_.state().userState.at("host"), "changed");
    EXPECT_EQ(engine_.state().userState.at("status"), "starting");
    EXPECT_EQ(engine_.state().userState.at("extra"), 7);
}

TEST_F(ReloadEngineTest, WidgetStateFollowsNewDefinition) {
    writeFile("a.fsx",
              "list procs \"a\" \"b\" \"c\"\n"
              "list logs \"x\"\n");
    ASSERT_TRUE(engine_.load(tmpDir_ / "a.fsx"));
    EXPECT_EQ(engine_.state().focusedWidget, "procs");
    EXPECT_EQ(engine_.state().uiState.at("procs").selected, 0u);
    EXPECT_TRUE(engine_.state().uiState.at("procs").focused);
    EXPECT_FALSE(engine_.state().uiState.at("logs").focused);

    engine_.state().uiState["procs"].selected = 2;
    engine_.state().focusedWidget = "logs";

    // procs shrinks, logs disappears
    writeFile("a.fsx", "list procs \"a\"\n");
    ASSERT_TRUE(engine_.reload());
    EXPECT_EQ(engine_.state().uiState.at("procs").selected, 0u);
    EXPECT_EQ(engine_.state().focusedWidget, "procs");
    EXPECT_TRUE(engine_.state().uiState.at("procs").focused);
}

TEST_F(ReloadEngineTest, MissingEntryFails) {
    EXPECT_FALSE(engine_.load(tmpDir_ / "nowhere.fsx"));
    EXPECT_EQ(engine_.status(), ReloadEngine::Status::Failed);
    ASSERT_TRUE(engine_.state().lastError.has_value());
    EXPECT_EQ(engine_.state().lastError->title, "File Not Found");
    EXPECT_FALSE(engine_.state().lastError->hints.empty());
    EXPECT_TRUE(contains(engine_.render(Rect(0, 0, 60, 12)), "Waiting for a successful load..."));
}

TEST_F(ReloadEngineTest, CircularIncludeFails) {
    writeFile("a.fsx", "#load \"b.fsx\"\n");
    writeFile("b.fsx", "#load \"a.fsx\"\n");
    EXPECT_FALSE(engine_.load(tmpDir_ / "a.fsx"));
    ASSERT_TRUE(engine_.state().lastError.has_value());
    EXPECT_EQ(engine_.state().lastError->title, "Circular Dependency");
    EXPECT_NE(engine_.state().lastError->message.find("a.fsx -> b.fsx -> a.fsx"), std::string::npos);
}

TEST_F(ReloadEngineTest, ReloadWithoutEntryIsInformational) {
    EXPECT_FALSE(engine_.reload());
    ASSERT_TRUE(engine_.state().lastError.has_value());
    EXPECT_EQ(engine_.state().lastError->severity, Severity::Info);
    EXPECT_EQ(engine_.status(), ReloadEngine::Status::Idle);

    engine_.state().dirty = false;
    engine_.dismissError();
    EXPECT_FALSE(engine_.state().lastError.has_value());
    EXPECT_TRUE(engine_.state().dirty);
}

TEST_F(ReloadEngineTest, ManualReloadRereadsUnchangedFiles) {
    writeTwoFileDashboard();
    ASSERT_TRUE(engine_.load(tmpDir_ / "a.fsx"));
    uint64_t reads = engine_.loader().diskReads();

    ASSERT_TRUE(engine_.reload());
    EXPECT_EQ(engine_.loader().diskReads(), reads + 2);
    EXPECT_EQ(engine_.reloadCount(), 2u);
}

TEST_F(ReloadEngineTest, DisablingHotReloadStopsWatching) {
    writeTwoFileDashboard();
    ASSERT_TRUE(engine_.load(tmpDir_ / "a.fsx"));
    engine_.enableHotReload(20ms, true);
    engine_.disableHotReload();
    EXPECT_FALSE(engine_.hotReloadEnabled());

    writeFile("b.fsx", "border double\n");
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(engine_.pollChanges().has_value());
    EXPECT_EQ(engine_.reloadCount(), 1u);
}

TEST_F(ReloadEngineTest, DefinitionThemeOverridesRuntimeTheme) {
    engine_.state().dirty = false;
    engine_.setTheme(Theme::light());
    EXPECT_EQ(engine_.theme().name(), "Light");
    EXPECT_TRUE(engine_.state().dirty);
    EXPECT_EQ(engine_.render(Rect(0, 0, 40, 10)).at(0, 0)->fg, ColorPalette::light().primary);

    auto p = writeFile("main.fsx", "theme slime\ntitle \"T\"\npanel p fill\n");
    ASSERT_TRUE(engine_.load(p));
    EXPECT_EQ(engine_.theme().name(), "Slime");
    EXPECT_EQ(engine_.render(Rect(0, 0, 30, 6)).at(0, 0)->fg, ColorPalette::slime().secondary);

    // A failed reload keeps the last good dashboard's theme
    writeFile("main.fsx", "theme neon\n");
    EXPECT_FALSE(engine_.reload());
    EXPECT_EQ(engine_.theme().name(), "Slime");

    // Without the statement the runtime theme applies again
    writeFile("main.fsx", "title \"T\"\npanel p fill\n");
    ASSERT_TRUE(engine_.reload());
    EXPECT_EQ(engine_.theme().name(), "Light");
}
