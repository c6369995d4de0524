#include "gtest/gtest.h"
#include <kgview/graph/graph_model.h>
#include <kgview/graph/render/camera_utils.h>
#include <kgview/graph/render/color_palette.h>
#include <kgview/graph/render/scene_primitives.h>
#include <kgview/gui/interaction/input_events.h>
#include <kgview/gui/interaction/interaction_controller.h>

#include <glm/geometric.hpp>

#include <memory>
#include <vector>

using namespace kgview;
using gui::InputEventDispatcher;
using gui::InteractionController;
using gui::Key;
using gui::KeyEvent;
using gui::MouseButton;
using gui::PointerButtonEvent;
using gui::PointerMoveEvent;

namespace {

class FakeViewport : public gui::ViewportSizeProvider {
public:
    gui::SurfaceRect rect{0.0f, 0.0f, 800, 600};
    gui::SurfaceRect GetSurfaceRect() const override { return rect; }
};

class InteractionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<graph::NodeRecord> nodes(2);
        nodes[0].id = "center";
        nodes[0].content = "at the origin";
        nodes[1].id = "side";
        m_model = std::make_shared<const graph::GraphModel>(std::move(nodes), std::vector<graph::EdgeRecord>{});

        graph::PositionMap positions{{"center", glm::vec3(0.0f)}, {"side", glm::vec3(60.0f, 0.0f, 0.0f)}};
        m_primitives = graph::ScenePrimitiveBuilder::Build(*m_model, positions, graph::GetThemePalette(ThemeType::DARK));

        m_controller = std::make_unique<InteractionController>(m_events, m_viewport, m_camera);
        m_controller->SetScene(m_model, m_primitives);
        m_controller->SetNodeSelectedCallback([this](const gui::NodeSelectedEvent& event) {
            m_selected.push_back(event);
        });
        m_controller->SetSelectionClearedCallback([this]() { ++m_cleared; });
    }

    void Click(float x, float y) {
        m_events.DispatchPointerButton(PointerButtonEvent{MouseButton::PRIMARY, true, glm::vec2(x, y)});
        m_events.DispatchPointerButton(PointerButtonEvent{MouseButton::PRIMARY, false, glm::vec2(x, y)});
    }

    InputEventDispatcher m_events;
    FakeViewport m_viewport;
    graph::PerspectiveCamera m_camera;
    std::shared_ptr<const graph::GraphModel> m_model;
    std::shared_ptr<const graph::ScenePrimitives> m_primitives;
    std::unique_ptr<InteractionController> m_controller;
    std::vector<gui::NodeSelectedEvent> m_selected;
    int m_cleared = 0;
};

} // namespace

TEST_F(InteractionControllerTest, RegistersAndUnregistersListener) {
    EXPECT_EQ(m_events.ListenerCount(), 1u);
    m_controller->Dispose();
    EXPECT_EQ(m_events.ListenerCount(), 0u);
    EXPECT_TRUE(m_controller->IsDisposed());
}

TEST_F(InteractionControllerTest, ClickOnNodeEmitsSelection) {
    Click(400.0f, 300.0f);

    ASSERT_EQ(m_selected.size(), 1u);
    EXPECT_EQ(m_selected[0].node.id(), "center");
    EXPECT_EQ(m_selected[0].node.record.content, "at the origin");
    EXPECT_EQ(m_selected[0].screen_position, glm::vec2(400.0f, 300.0f));
    ASSERT_TRUE(m_controller->GetSelection().has_value());
    EXPECT_EQ(m_controller->GetSelection()->node_id, "center");
}

TEST_F(InteractionControllerTest, BackgroundClickClearsSelection) {
    Click(400.0f, 300.0f);
    Click(20.0f, 20.0f);

    EXPECT_EQ(m_cleared, 1);
    EXPECT_FALSE(m_controller->GetSelection().has_value());

    // Nothing selected: a second miss emits nothing new.
    Click(20.0f, 20.0f);
    EXPECT_EQ(m_cleared, 1);
}

TEST_F(InteractionControllerTest, ClickPositionIsRelativeToSurface) {
    m_viewport.rect = gui::SurfaceRect{100.0f, 50.0f, 800, 600};
    Click(500.0f, 350.0f);

    ASSERT_EQ(m_selected.size(), 1u);
    EXPECT_EQ(m_selected[0].screen_position, glm::vec2(400.0f, 300.0f));
}

TEST_F(InteractionControllerTest, DragOrbitsInsteadOfSelecting) {
    const float yaw_before = m_controller->GetOrbitControls().GetYaw();

    m_events.DispatchPointerButton(PointerButtonEvent{MouseButton::PRIMARY, true, glm::vec2(400.0f, 300.0f)});
    m_events.DispatchPointerMove(PointerMoveEvent{glm::vec2(450.0f, 300.0f)});
    m_events.DispatchPointerMove(PointerMoveEvent{glm::vec2(500.0f, 300.0f)});
    m_events.DispatchPointerButton(PointerButtonEvent{MouseButton::PRIMARY, false, glm::vec2(400.0f, 300.0f)});

    EXPECT_TRUE(m_selected.empty());
    EXPECT_TRUE(m_controller->GetOrbitControls().HasPendingMotion());

    m_controller->Advance(0.016f);
    EXPECT_NE(m_controller->GetOrbitControls().GetYaw(), yaw_before);
}

TEST_F(InteractionControllerTest, HeldKeysMoveCameraEachFrame) {
    const glm::vec3 start = m_camera.GetPosition();

    m_events.DispatchKey(KeyEvent{Key::W, true});
    EXPECT_TRUE(m_controller->GetActiveInput().Contains(gui::MovementKey::FORWARD));
    m_controller->Advance(0.5f);

    const glm::vec3 moved = m_camera.GetPosition();
    EXPECT_NEAR(glm::length(moved - start), 0.5f * m_controller->GetParams().move_speed, 1e-3f);
    EXPECT_LT(moved.z, start.z);

    m_events.DispatchKey(KeyEvent{Key::W, false});
    m_controller->Advance(0.5f);
    EXPECT_NEAR(glm::length(m_camera.GetPosition() - moved), 0.0f, 1e-4f);
}

TEST_F(InteractionControllerTest, ReleasingOneOfTwoUpKeysKeepsRising) {
    m_events.DispatchKey(KeyEvent{Key::E, true});
    m_events.DispatchKey(KeyEvent{Key::SPACE, true});
    m_events.DispatchKey(KeyEvent{Key::SPACE, false});

    const glm::vec3 start = m_camera.GetPosition();
    m_controller->Advance(0.5f);
    EXPECT_GT(m_camera.GetPosition().y, start.y);
}

TEST_F(InteractionControllerTest, EscapeClearsAndFocusTargetsSelection) {
    Click(400.0f, 300.0f);
    EXPECT_TRUE(m_controller->FocusSelected());

    m_events.DispatchKey(KeyEvent{Key::ESCAPE, true});
    EXPECT_FALSE(m_controller->GetSelection().has_value());
    EXPECT_EQ(m_cleared, 1);
    EXPECT_FALSE(m_controller->FocusSelected());
}

TEST_F(InteractionControllerTest, SelectionDroppedWhenNodeLeavesScene) {
    Click(400.0f, 300.0f);

    std::vector<graph::NodeRecord> nodes(1);
    nodes[0].id = "side";
    auto replacement = std::make_shared<const graph::GraphModel>(std::move(nodes), std::vector<graph::EdgeRecord>{});
    m_controller->SetScene(replacement, std::make_shared<const graph::ScenePrimitives>());

    EXPECT_FALSE(m_controller->GetSelection().has_value());
    EXPECT_EQ(m_cleared, 1);
}

TEST_F(InteractionControllerTest, ResizeResyncsCameraFromViewport) {
    m_viewport.rect = gui::SurfaceRect{0.0f, 0.0f, 1024, 512};
    m_events.DispatchResize(gui::ResizeEvent{1024, 512});
    EXPECT_EQ(m_camera.GetViewportWidth(), 1024);
    EXPECT_FLOAT_EQ(m_camera.GetAspect(), 2.0f);
}

TEST_F(InteractionControllerTest, DisposedControllerIgnoresLateCalls) {
    m_controller->Dispose();
    m_controller->OnPointerButton(PointerButtonEvent{MouseButton::PRIMARY, true, glm::vec2(400.0f, 300.0f)});
    m_controller->OnPointerButton(PointerButtonEvent{MouseButton::PRIMARY, false, glm::vec2(400.0f, 300.0f)});
    m_controller->OnKey(KeyEvent{Key::W, true});
    m_controller->Advance(1.0f);

    EXPECT_TRUE(m_selected.empty());
    EXPECT_TRUE(m_controller->GetActiveInput().Empty());
}

TEST(InputEventDispatcherTest, ListenerMayRemoveItselfWhileHandling) {
    InputEventDispatcher dispatcher;

    struct SelfRemoving : gui::InputListener {
        InputEventDispatcher* owner = nullptr;
        int calls = 0;
        void OnScroll(const gui::ScrollEvent&) override {
            ++calls;
            owner->RemoveListener(this);
        }
    } listener;
    listener.owner = &dispatcher;

    dispatcher.AddListener(&listener);
    dispatcher.AddListener(&listener);
    EXPECT_EQ(dispatcher.ListenerCount(), 1u);

    dispatcher.DispatchScroll(gui::ScrollEvent{1.0f});
    dispatcher.DispatchScroll(gui::ScrollEvent{1.0f});
    EXPECT_EQ(listener.calls, 1);
    EXPECT_EQ(dispatcher.ListenerCount(), 0u);
}
