#include "gtest/gtest.h"
#include <kgview/core/random_source.h>
#include <kgview/graph/graph_model.h>
#include <kgview/graph/render/scene_renderer.h>
#include <kgview/gui/interaction/input_events.h>
#include <kgview/gui/render/frame_loop.h>
#include <kgview/gui/views/graph_viewport.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kgview;
using gui::GraphViewport;
using gui::ViewportDescriptor;

namespace {

class FakeRenderer : public graph::SceneRenderer {
public:
    void Initialize() override { initialized = true; ++init_calls; }
    void Shutdown() override { initialized = false; }
    bool IsInitialized() const override { return initialized; }

    void InstallPrimitives(std::shared_ptr<const graph::ScenePrimitives> primitives) override {
        ++install_calls;
        installed = std::move(primitives);
    }
    void InstallBackground(std::shared_ptr<const graph::ScenePrimitives> bg) override {
        background = std::move(bg);
    }
    void SetClearColor(const glm::vec3& color) override { clear_color = color; }
    void Render(const graph::PerspectiveCamera&) override { ++render_calls; }

    bool initialized = false;
    int init_calls = 0;
    int install_calls = 0;
    int render_calls = 0;
    glm::vec3 clear_color{0.0f};
    std::shared_ptr<const graph::ScenePrimitives> installed;
    std::shared_ptr<const graph::ScenePrimitives> background;
};

class FakeViewport : public gui::ViewportSizeProvider {
public:
    gui::SurfaceRect GetSurfaceRect() const override { return gui::SurfaceRect{0.0f, 0.0f, 800, 600}; }
};

std::shared_ptr<const graph::GraphModel> MakeChain(int count) {
    std::vector<graph::NodeRecord> nodes;
    std::vector<graph::EdgeRecord> edges;
    for (int i = 0; i < count; ++i) {
        graph::NodeRecord node;
        node.id = "n" + std::to_string(i);
        nodes.push_back(node);
        if (i > 0) {
            graph::EdgeRecord edge;
            edge.id = "e" + std::to_string(i);
            edge.source_id = "n" + std::to_string(i - 1);
            edge.target_id = node.id;
            edges.push_back(edge);
        }
    }
    return std::make_shared<const graph::GraphModel>(std::move(nodes), std::move(edges));
}

class GraphViewportTest : public ::testing::Test {
protected:
    GraphViewportTest()
        : m_rng(42u),
          m_viewport(GraphViewport::Dependencies{m_events, m_size, m_frames, m_renderer, m_rng}) {
        m_descriptor.animate = false;
        m_descriptor.layout.iterations = 30;
    }

    gui::InputEventDispatcher m_events;
    FakeViewport m_size;
    gui::FrameRequestQueue m_frames;
    FakeRenderer m_renderer;
    core::Mt19937RandomSource m_rng;
    ViewportDescriptor m_descriptor;
    GraphViewport m_viewport;
};

} // namespace

TEST_F(GraphViewportTest, InitializeBuildsSceneAndFramesCamera) {
    m_viewport.Initialize(m_descriptor, MakeChain(4));

    EXPECT_TRUE(m_viewport.IsMounted());
    EXPECT_TRUE(m_renderer.initialized);
    EXPECT_EQ(m_renderer.init_calls, 1);
    ASSERT_TRUE(m_renderer.installed);
    EXPECT_EQ(m_renderer.installed->PointCount(), 4u);
    EXPECT_EQ(m_renderer.installed->LineSegmentCount(), 3u);
    EXPECT_TRUE(m_renderer.background);
    EXPECT_EQ(m_viewport.GetPositions().size(), 4u);
    EXPECT_EQ(m_viewport.GetCamera().GetViewportWidth(), 800);
    EXPECT_EQ(m_events.ListenerCount(), 1u);
}

TEST_F(GraphViewportTest, InitializeTwiceThrows) {
    m_viewport.Initialize(m_descriptor, MakeChain(2));
    EXPECT_THROW(m_viewport.Initialize(m_descriptor, MakeChain(2)), std::runtime_error);
}

TEST_F(GraphViewportTest, NullModelMountsEmptyScene) {
    m_viewport.Initialize(m_descriptor, nullptr);

    ASSERT_TRUE(m_viewport.GetModel());
    EXPECT_TRUE(m_viewport.GetModel()->Empty());
    EXPECT_FALSE(m_renderer.installed);
    m_viewport.RenderStill();
    EXPECT_EQ(m_renderer.render_calls, 1);
}

TEST_F(GraphViewportTest, SameSnapshotIsNoOp) {
    auto model = MakeChain(3);
    m_viewport.Initialize(m_descriptor, model);
    const int installs = m_renderer.install_calls;

    EXPECT_FALSE(m_viewport.Update(model));
    EXPECT_EQ(m_renderer.install_calls, installs);

    EXPECT_TRUE(m_viewport.Update(MakeChain(5)));
    EXPECT_GT(m_renderer.install_calls, installs);
    EXPECT_EQ(m_renderer.installed->PointCount(), 5u);
}

TEST_F(GraphViewportTest, DisposeReleasesSceneAndIgnoresLateUpdates) {
    m_viewport.Initialize(m_descriptor, MakeChain(3));
    m_viewport.Dispose();

    EXPECT_TRUE(m_viewport.IsDisposed());
    EXPECT_FALSE(m_viewport.IsMounted());
    EXPECT_FALSE(m_renderer.installed);
    EXPECT_FALSE(m_renderer.background);
    EXPECT_EQ(m_events.ListenerCount(), 0u);

    const int installs = m_renderer.install_calls;
    EXPECT_FALSE(m_viewport.Update(MakeChain(6)));
    m_viewport.RenderStill();
    EXPECT_EQ(m_renderer.install_calls, installs);
    EXPECT_EQ(m_renderer.render_calls, 0);
    EXPECT_THROW(m_viewport.Initialize(m_descriptor, MakeChain(1)), std::runtime_error);
}

TEST_F(GraphViewportTest, AnimateDrivesFrameLoop) {
    m_descriptor.animate = true;
    m_viewport.Initialize(m_descriptor, MakeChain(3));

    EXPECT_TRUE(m_viewport.IsAnimating());
    EXPECT_EQ(m_frames.PendingCount(), 1u);
    m_frames.RunFrame(0.0);
    m_frames.RunFrame(0.016);
    EXPECT_EQ(m_renderer.render_calls, 2);

    m_viewport.SetAnimate(false);
    EXPECT_EQ(m_frames.PendingCount(), 0u);
    EXPECT_EQ(m_frames.RunFrame(0.032), 0u);
    EXPECT_EQ(m_renderer.render_calls, 2);
}

TEST_F(GraphViewportTest, InputWhileStoppedIsNotReplayedOnResume) {
    m_viewport.Initialize(m_descriptor, MakeChain(3));
    const glm::vec3 start = m_viewport.GetCamera().GetPosition();

    m_events.DispatchPointerButton(gui::PointerButtonEvent{gui::MouseButton::PRIMARY, true, glm::vec2(400.0f, 300.0f)});
    m_events.DispatchPointerMove(gui::PointerMoveEvent{glm::vec2(600.0f, 400.0f)});
    m_events.DispatchPointerButton(gui::PointerButtonEvent{gui::MouseButton::PRIMARY, false, glm::vec2(600.0f, 400.0f)});
    m_events.DispatchScroll(gui::ScrollEvent{5.0f});
    m_events.DispatchKey(gui::KeyEvent{gui::Key::W, true});
    ASSERT_TRUE(m_viewport.GetController()->GetOrbitControls().HasPendingMotion());

    m_viewport.SetAnimate(true);
    EXPECT_FALSE(m_viewport.GetController()->GetOrbitControls().HasPendingMotion());
    EXPECT_TRUE(m_viewport.GetController()->GetActiveInput().Empty());

    m_frames.RunFrame(0.0);
    m_frames.RunFrame(0.016);
    EXPECT_EQ(m_viewport.GetCamera().GetPosition(), start);
}

TEST_F(GraphViewportTest, ChunkedLayoutProgressesPerFrame) {
    m_descriptor.animate = true;
    m_descriptor.iterations_per_frame = 10;
    m_viewport.Initialize(m_descriptor, MakeChain(4));

    EXPECT_TRUE(m_viewport.IsLayoutInProgress());
    for (int frame = 0; frame < 5 && m_viewport.IsLayoutInProgress(); ++frame) {
        m_frames.RunFrame(frame * 0.016);
    }
    EXPECT_FALSE(m_viewport.IsLayoutInProgress());
    EXPECT_EQ(m_viewport.GetPositions().size(), 4u);
}

TEST_F(GraphViewportTest, RenderStillFinishesChunkedLayout) {
    m_descriptor.iterations_per_frame = 5;
    m_viewport.Initialize(m_descriptor, MakeChain(4));

    EXPECT_TRUE(m_viewport.IsLayoutInProgress());
    m_viewport.RenderStill();
    EXPECT_FALSE(m_viewport.IsLayoutInProgress());
    EXPECT_EQ(m_renderer.render_calls, 1);
}

TEST_F(GraphViewportTest, ThemeChangeRebuildsWithNewClearColor) {
    m_viewport.Initialize(m_descriptor, MakeChain(2));
    const glm::vec3 dark = m_renderer.clear_color;
    auto before = m_renderer.installed;

    m_viewport.SetTheme(ThemeType::WHITE);
    EXPECT_NE(m_renderer.clear_color, dark);
    EXPECT_EQ(m_renderer.clear_color, graph::GetThemePalette(ThemeType::WHITE).background);
    EXPECT_NE(m_renderer.installed, before);
}

TEST_F(GraphViewportTest, ClickSelectionReachesEveryListener) {
    m_viewport.Initialize(m_descriptor, MakeChain(1));

    std::vector<std::string> first;
    int second = 0;
    int cleared = 0;
    m_viewport.OnNodeSelected([&](const gui::NodeSelectedEvent& event) { first.push_back(event.node.id()); });
    m_viewport.OnNodeSelected([&](const gui::NodeSelectedEvent&) { ++second; });
    m_viewport.OnSelectionCleared([&]() { ++cleared; });

    // A lone node sits at the framed centre of the surface.
    m_events.DispatchPointerButton(gui::PointerButtonEvent{gui::MouseButton::PRIMARY, true, glm::vec2(400.0f, 300.0f)});
    m_events.DispatchPointerButton(gui::PointerButtonEvent{gui::MouseButton::PRIMARY, false, glm::vec2(400.0f, 300.0f)});

    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0], "n0");
    EXPECT_EQ(second, 1);

    m_viewport.Update(MakeChain(0));
    EXPECT_EQ(cleared, 1);
}
