#include <gtest/gtest.h>
#include "dashboard/DashboardRuntime.hpp"
#include "render/TestRenderer.hpp"
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// Throws ConnectionLost from draw() once armed.
class FailingRenderer : public TestRenderer {
public:
    using TestRenderer::TestRenderer;

    void draw(const CellBuffer& buffer) override {
        if (armed) throw RenderError(RenderError::Kind::ConnectionLost, "host went away");
        TestRenderer::draw(buffer);
    }

    bool armed = false;
};

// Grows by one column right after size() is queried, for the first
// `resizesLeft` queries. Models a resize signal landing mid-frame.
class ResizingRenderer : public TestRenderer {
public:
    using TestRenderer::TestRenderer;

    Rect size() override {
        Rect current = TestRenderer::size();
        if (resizesLeft > 0) {
            --resizesLeft;
            resize(current.width + 1, current.height);
        }
        return current;
    }

    int resizesLeft = 1;
};

} // namespace

class DashboardRuntimeTest : public ::testing::Test {
protected:
    fs::path tmpDir_;
    TestRenderer* term_ = nullptr;
    std::unique_ptr<DashboardRuntime> runtime_;

    void SetUp() override {
        tmpDir_ = fs::temp_directory_path() / "tuidash_runtime_test";
        fs::remove_all(tmpDir_);
        fs::create_directories(tmpDir_);
        makeRuntime({});
    }

    void TearDown() override {
        runtime_.reset();
        fs::remove_all(tmpDir_);
    }

    void makeRuntime(RuntimeOptions opts) {
        auto term = std::make_unique<TestRenderer>(60, 20);
        term_ = term.get();
        runtime_ = std::make_unique<DashboardRuntime>(std::move(term), opts);
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        fs::path p = tmpDir_ / name;
        std::ofstream f(p, std::ios::trunc);
        f << content;
        return p;
    }

    void loadTwoLists() {
        auto p = writeFile("main.fsx",
                           "title \"Lists\"\n"
                           "layout horizontal\n"
                           "panel a fill \"A\"\n"
                           "list first \"one\" \"two\" \"three\"\n"
                           "panel b fill \"B\"\n"
                           "list second \"x\" \"y\"\n");
        ASSERT_TRUE(runtime_->engine().load(p));
    }

    DashboardState& state() { return runtime_->engine().state(); }

    DashboardRuntime::Action press(KeyEvent key) { return runtime_->handleEvent(key); }

    bool screenContains(const std::string& text) const {
        return term_->debugOutput().find(text) != std::string::npos;
    }
};

TEST_F(DashboardRuntimeTest, PlaceholderBeforeAnythingLoads) {
    runtime_->renderFrame();
    EXPECT_EQ(term_->drawCount(), 1);
    EXPECT_EQ(term_->flushCount(), 1);
    EXPECT_EQ(runtime_->frameCount(), 1u);
    EXPECT_TRUE(screenContains("tuidash"));
    EXPECT_TRUE(screenContains("No dashboard loaded."));
}

TEST_F(DashboardRuntimeTest, QuitKeys) {
    using Action = DashboardRuntime::Action;
    EXPECT_EQ(press(KeyEvent::ctrl('c')), Action::Quit);
    EXPECT_EQ(press(KeyEvent::character('q')), Action::Quit);
    EXPECT_EQ(press(KeyEvent::character('q', {false, false, true})), Action::None);
    EXPECT_EQ(press(KeyEvent::character('x')), Action::None);
    EXPECT_EQ(runtime_->handleEvent(PasteEvent{"q"}), Action::None);
}

TEST_F(DashboardRuntimeTest, RunProcessesEventsUntilQuit) {
    loadTwoLists();
    term_->pushEvent(KeyEvent::key(KeyCode::Down));
    term_->pushEvent(KeyEvent::key(KeyCode::Down));
    term_->pushEvent(KeyEvent::ctrl('c'));

    runtime_->run();

    EXPECT_FALSE(runtime_->isRunning());
    EXPECT_EQ(term_->pendingEvents(), 0u);
    EXPECT_EQ(state().uiState.at("first").selected, 2u);
    EXPECT_TRUE(term_->cleanedUp());
    // Initial frame plus one per handled navigation key
    EXPECT_EQ(runtime_->frameCount(), 3u);
    EXPECT_TRUE(screenContains("three"));
}

TEST_F(DashboardRuntimeTest, TabCyclesFocusThroughLists) {
    loadTwoLists();
    EXPECT_EQ(state().focusedWidget, "first");

    EXPECT_EQ(press(KeyEvent::key(KeyCode::Tab)), DashboardRuntime::Action::Render);
    EXPECT_EQ(state().focusedWidget, "second");
    EXPECT_TRUE(state().uiState.at("second").focused);
    EXPECT_FALSE(state().uiState.at("first").focused);

    press(KeyEvent::key(KeyCode::Tab));
    EXPECT_EQ(state().focusedWidget, "first");

    press(KeyEvent::key(KeyCode::BackTab));
    EXPECT_EQ(state().focusedWidget, "second");
}

TEST_F(DashboardRuntimeTest, NavigationClampsToList) {
    loadTwoLists();
    auto selected = [&] { return state().uiState.at("first").selected; };
    EXPECT_EQ(selected(), 0u);

    press(KeyEvent::key(KeyCode::Up));
    EXPECT_EQ(selected(), 0u);
    press(KeyEvent::key(KeyCode::Down));
    EXPECT_EQ(selected(), 1u);
    press(KeyEvent::key(KeyCode::PageDown));
    EXPECT_EQ(selected(), 2u);
    press(KeyEvent::key(KeyCode::Home));
    EXPECT_EQ(selected(), 0u);
    press(KeyEvent::key(KeyCode::End));
    EXPECT_EQ(selected(), 2u);
    press(KeyEvent::key(KeyCode::PageUp));
    EXPECT_EQ(selected(), 0u);

    runtime_->handleEvent(MouseEvent{MouseEvent::Kind::ScrollDown, MouseEvent::Button::None, 5, 5, {}});
    EXPECT_EQ(selected(), 1u);
    runtime_->handleEvent(MouseEvent{MouseEvent::Kind::ScrollUp, MouseEvent::Button::None, 5, 5, {}});
    EXPECT_EQ(selected(), 0u);

    // Other list untouched
    EXPECT_EQ(state().uiState.at("second").selected, 0u);
}

TEST_F(DashboardRuntimeTest, NavigationWithoutDashboardIsHarmless) {
    EXPECT_EQ(press(KeyEvent::key(KeyCode::Tab)), DashboardRuntime::Action::Render);
    EXPECT_EQ(press(KeyEvent::key(KeyCode::Down)), DashboardRuntime::Action::Render);
    EXPECT_FALSE(state().focusedWidget.has_value());
    EXPECT_TRUE(state().uiState.empty());
}

TEST_F(DashboardRuntimeTest, FailedReloadShowsOverlayOverLastGoodFrame) {
    loadTwoLists();
    runtime_->renderFrame();
    EXPECT_EQ(runtime_->overlay(), nullptr);

    writeFile("main.fsx", "title \"Lists\"\nlist first \"one\"\nlist first \"dup\"\n");
    EXPECT_EQ(press(KeyEvent::ctrl('r')), DashboardRuntime::Action::Render);
    EXPECT_EQ(runtime_->engine().status(), ReloadEngine::Status::Failed);

    runtime_->renderFrame();
    ASSERT_NE(runtime_->overlay(), nullptr);
    EXPECT_TRUE(runtime_->overlay()->visible());
    EXPECT_TRUE(screenContains("ERROR: Parse Error"));
    EXPECT_TRUE(screenContains("duplicate list id 'first'"));
    // Edges of the old dashboard still show around the panel
    EXPECT_TRUE(screenContains("Lists"));

    EXPECT_EQ(press(KeyEvent::ctrl('d')), DashboardRuntime::Action::Render);
    runtime_->renderFrame();
    EXPECT_EQ(runtime_->overlay(), nullptr);
    EXPECT_FALSE(screenContains("Parse Error"));
    EXPECT_TRUE(screenContains("three"));

    EXPECT_EQ(press(KeyEvent::ctrl('d')), DashboardRuntime::Action::None);
}

TEST_F(DashboardRuntimeTest, OverlayAutoDismisses) {
    RuntimeOptions opts;
    opts.overlayDismiss = 30ms;
    makeRuntime(opts);

    EXPECT_FALSE(runtime_->engine().load(tmpDir_ / "missing.fsx"));
    runtime_->renderFrame();
    ASSERT_NE(runtime_->overlay(), nullptr);
    EXPECT_TRUE(screenContains("File Not Found"));

    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(runtime_->tick());
    EXPECT_EQ(runtime_->overlay(), nullptr);
    EXPECT_FALSE(state().lastError.has_value());
    EXPECT_FALSE(screenContains("File Not Found"));
}

TEST_F(DashboardRuntimeTest, NewErrorReplacesOverlay) {
    EXPECT_FALSE(runtime_->engine().load(tmpDir_ / "missing.fsx"));
    runtime_->renderFrame();
    ASSERT_NE(runtime_->overlay(), nullptr);
    EXPECT_EQ(runtime_->overlay()->info().title, "File Not Found");

    writeFile("bad.fsx", "layout diagonal\n");
    EXPECT_FALSE(runtime_->engine().load(tmpDir_ / "bad.fsx"));
    runtime_->renderFrame();
    ASSERT_NE(runtime_->overlay(), nullptr);
    EXPECT_EQ(runtime_->overlay()->info().title, "Parse Error");
}

TEST_F(DashboardRuntimeTest, RedrawsOnlyWhenDirty) {
    loadTwoLists();
    runtime_->renderFrame();
    int draws = term_->drawCount();

    EXPECT_TRUE(runtime_->tick());
    EXPECT_EQ(term_->drawCount(), draws);

    term_->pushEvent(KeyEvent::character('z'));
    EXPECT_TRUE(runtime_->tick());
    EXPECT_EQ(term_->drawCount(), draws);

    term_->pushEvent(FocusGainedEvent{});
    EXPECT_TRUE(runtime_->tick());
    EXPECT_EQ(term_->drawCount(), draws + 1);
}

TEST_F(DashboardRuntimeTest, ResizeRedrawsAtNewSize) {
    loadTwoLists();
    runtime_->renderFrame();

    term_->resize(30, 8);
    EXPECT_TRUE(runtime_->tick());
    EXPECT_EQ(term_->buffer().area(), Rect(0, 0, 30, 8));
}

TEST_F(DashboardRuntimeTest, QuitFromTickStopsLoop) {
    term_->pushEvent(KeyEvent::character('q'));
    EXPECT_FALSE(runtime_->tick());
    EXPECT_FALSE(runtime_->isRunning());
}

TEST(DashboardRuntimeFailureTest, RenderErrorCleansUpAndRethrows) {
    auto term = std::make_unique<FailingRenderer>(40, 10);
    FailingRenderer* raw = term.get();
    DashboardRuntime runtime(std::move(term));

    raw->pushEvent(FocusLostEvent{});
    raw->armed = true;
    try {
        runtime.run();
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.kind(), RenderError::Kind::ConnectionLost);
    }
    EXPECT_TRUE(raw->cleanedUp());
    EXPECT_EQ(raw->cleanupCount(), 1);
    EXPECT_FALSE(runtime.isRunning());
}

TEST(DashboardRuntimeResizeTest, ResizeBetweenSizeAndDrawRetriesAtNewSize) {
    auto term = std::make_unique<ResizingRenderer>(40, 10);
    ResizingRenderer* raw = term.get();
    DashboardRuntime runtime(std::move(term));

    EXPECT_NO_THROW(runtime.renderFrame());
    EXPECT_EQ(raw->drawCount(), 1);
    EXPECT_EQ(raw->buffer().area(), Rect(0, 0, 41, 10));
    EXPECT_EQ(runtime.frameCount(), 1u);
    EXPECT_FALSE(runtime.engine().state().dirty);
}

TEST(DashboardRuntimeResizeTest, ContinuousResizeDefersFrameToNextTick) {
    auto term = std::make_unique<ResizingRenderer>(40, 10);
    ResizingRenderer* raw = term.get();
    raw->resizesLeft = 2;
    DashboardRuntime runtime(std::move(term));

    EXPECT_NO_THROW(runtime.renderFrame());
    EXPECT_EQ(raw->drawCount(), 0);
    EXPECT_EQ(runtime.frameCount(), 0u);
    EXPECT_TRUE(runtime.engine().state().dirty);

    // Size has settled: the next tick draws at 42 columns
    EXPECT_TRUE(runtime.tick());
    EXPECT_EQ(raw->drawCount(), 1);
    EXPECT_EQ(raw->buffer().area(), Rect(0, 0, 42, 10));
}

TEST(DashboardRuntimeResizeTest, ResizeDuringRunDoesNotEndSession) {
    auto term = std::make_unique<ResizingRenderer>(40, 10);
    ResizingRenderer* raw = term.get();
    raw->resizesLeft = 3;
    DashboardRuntime runtime(std::move(term), RuntimeOptions{5ms, {}});

    raw->pushEvent(FocusGainedEvent{});
    raw->pushEvent(FocusGainedEvent{});
    raw->pushEvent(KeyEvent::ctrl('c'));
    EXPECT_NO_THROW(runtime.run());
    EXPECT_FALSE(runtime.isRunning());
    EXPECT_EQ(raw->cleanupCount(), 1);
    EXPECT_EQ(raw->buffer().area(), Rect(0, 0, 43, 10));
}
