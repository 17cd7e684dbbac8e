#include "input_reducer.h"
#include "test_doubles.h"
#include <gtest/gtest.h>

namespace
{
constexpr double TOLERANCE = 1e-12;

class InputReducerTest : public ::testing::Test
{
protected:
    ViewState view{ViewState::Clock::time_point{}};
    FakeWindow window;
    RecordingSink sink;
    FrameSynchronizer synchronizer{view, window, sink, [] { return ViewState::Clock::time_point{}; }};
    InputReducer reducer{view, window, synchronizer};

    void press(Key key) { reducer.handle(KeyInput{key, true, false}); }
    void release(Key key) { reducer.handle(KeyInput{key, false, false}); }
};
}

TEST_F(InputReducerTest, PressAndReleaseRestoresMovement)
{
    view.zoom(-view.getZoomLevel());

    press(Key::A);
    EXPECT_DOUBLE_EQ(view.getMovementDelta().x, -0.005);
    release(Key::A);
    EXPECT_EQ(view.getMovementDelta().x, 0.0);
}

TEST_F(InputReducerTest, DirectionKeysMoveAlongTheirAxis)
{
    double step = view.stepSize();

    press(Key::D);
    EXPECT_DOUBLE_EQ(view.getMovementDelta().x, step);
    press(Key::W);
    EXPECT_DOUBLE_EQ(view.getMovementDelta().y, step);
    release(Key::W);
    press(Key::S);
    EXPECT_DOUBLE_EQ(view.getMovementDelta().y, -step);

    release(Key::S);
    release(Key::D);
    EXPECT_EQ(view.getMovementDelta().x, 0.0);
    EXPECT_EQ(view.getMovementDelta().y, 0.0);
}

TEST_F(InputReducerTest, OppositeKeysCancel)
{
    press(Key::A);
    press(Key::D);
    EXPECT_EQ(view.getMovementDelta().x, 0.0);
    release(Key::A);
    EXPECT_DOUBLE_EQ(view.getMovementDelta().x, view.stepSize());
    release(Key::D);
    EXPECT_EQ(view.getMovementDelta().x, 0.0);
}

TEST_F(InputReducerTest, ReleaseAfterZoomStillStops)
{
    press(Key::D);
    reducer.handle(ScrollInput{3.0});
    release(Key::D);
    EXPECT_EQ(view.getMovementDelta().x, 0.0);
}

TEST_F(InputReducerTest, RepeatsAreIgnored)
{
    press(Key::A);
    Point2 held = view.getMovementDelta();

    reducer.handle(KeyInput{Key::A, true, true});
    reducer.handle(KeyInput{Key::A, true, true});
    EXPECT_EQ(view.getMovementDelta().x, held.x);

    reducer.handle(KeyInput{Key::Space, true, true});
    EXPECT_TRUE(view.isMandelbrot());
}

TEST_F(InputReducerTest, TogglesFlipOnPressOnly)
{
    press(Key::Space);
    EXPECT_FALSE(view.isMandelbrot());
    release(Key::Space);
    EXPECT_FALSE(view.isMandelbrot());
    press(Key::Space);
    EXPECT_TRUE(view.isMandelbrot());

    press(Key::Q);
    EXPECT_FALSE(view.isRotatingColors());
    release(Key::Q);
    EXPECT_FALSE(view.isRotatingColors());
}

TEST_F(InputReducerTest, IterationKeysStepByHundredAndClamp)
{
    press(Key::Comma);
    EXPECT_EQ(view.getMaxIterations(), 1400u);

    for (int i = 0; i < 14; ++i)
        press(Key::Comma);
    EXPECT_EQ(view.getMaxIterations(), 100u);

    press(Key::Comma);
    EXPECT_EQ(view.getMaxIterations(), 100u);

    press(Key::Period);
    EXPECT_EQ(view.getMaxIterations(), 200u);
}

TEST_F(InputReducerTest, IterationChangeSynchronizesImmediately)
{
    press(Key::Period);
    ASSERT_EQ(sink.blocks.size(), 1u);
    EXPECT_EQ(sink.blocks.back().maxIterations, 1600u);
    EXPECT_EQ(window.titles.size(), 1u);

    release(Key::Period);
    EXPECT_EQ(sink.blocks.size(), 1u);
}

TEST_F(InputReducerTest, IterationNoOpDoesNotSynchronize)
{
    view.setMaxIterations(100);
    press(Key::Comma);
    EXPECT_TRUE(sink.blocks.empty());
}

TEST_F(InputReducerTest, ResetKeyRestoresDefaults)
{
    view.zoom(-5.0);
    view.translate({0.1, 0.2});
    press(Key::Space);

    press(Key::R);

    EXPECT_DOUBLE_EQ(view.getZoomLevel(), ViewState::DEFAULT_ZOOM_LEVEL);
    EXPECT_DOUBLE_EQ(view.getOffset().x, ViewState::DEFAULT_OFFSET.x);
    EXPECT_TRUE(view.isMandelbrot());
}

TEST_F(InputReducerTest, FullscreenKeyTogglesWindowMode)
{
    press(Key::F11);
    EXPECT_TRUE(view.isFullscreen());
    release(Key::F11);
    press(Key::F11);
    EXPECT_FALSE(view.isFullscreen());

    ASSERT_EQ(window.fullscreenRequests.size(), 2u);
    EXPECT_TRUE(window.fullscreenRequests[0]);
    EXPECT_FALSE(window.fullscreenRequests[1]);
}

TEST_F(InputReducerTest, OtherKeysDoNothing)
{
    press(Key::Other);
    release(Key::Other);
    EXPECT_EQ(view.getMovementDelta().x, 0.0);
    EXPECT_TRUE(view.isMandelbrot());
    EXPECT_TRUE(sink.blocks.empty());
}

TEST_F(InputReducerTest, CursorMoveWithoutButtonOnlyTracksMouse)
{
    reducer.handle(CursorMoveInput{100.0, 100.0});
    EXPECT_DOUBLE_EQ(view.getMousePosition().x, -0.75);
    EXPECT_DOUBLE_EQ(view.getOffset().x, ViewState::DEFAULT_OFFSET.x);
    EXPECT_DOUBLE_EQ(view.getOffset().y, ViewState::DEFAULT_OFFSET.y);
}

TEST_F(InputReducerTest, DragKeepsGrabbedPointUnderCursor)
{
    reducer.handle(CursorMoveInput{300.0, 200.0});
    reducer.handle(MouseButtonInput{MouseButton::Left, true});
    Point2 grabbed = view.mouseCoords();

    const Point2 path[] = {{310.0, 205.0}, {350.0, 260.0}, {500.0, 90.0}, {20.0, 580.0}, {300.0, 200.0}};
    for (const Point2 &p : path)
    {
        reducer.handle(CursorMoveInput{p.x, p.y});
        EXPECT_NEAR(view.mouseCoords().x, grabbed.x, TOLERANCE);
        EXPECT_NEAR(view.mouseCoords().y, grabbed.y, TOLERANCE);
    }

    reducer.handle(MouseButtonInput{MouseButton::Left, false});
    Point2 offset = view.getOffset();
    reducer.handle(CursorMoveInput{0.0, 0.0});
    EXPECT_EQ(view.getOffset().x, offset.x);
    EXPECT_EQ(view.getOffset().y, offset.y);
}

TEST_F(InputReducerTest, DragWorksAtDeepZoom)
{
    view.zoom(-200.0);
    reducer.handle(CursorMoveInput{400.0, 300.0});
    reducer.handle(MouseButtonInput{MouseButton::Left, true});
    Point2 grabbed = view.mouseCoords();

    reducer.handle(CursorMoveInput{450.0, 310.0});
    EXPECT_NEAR(view.mouseCoords().x, grabbed.x, 1e-15);
    EXPECT_NEAR(view.mouseCoords().y, grabbed.y, 1e-15);
}

TEST_F(InputReducerTest, OnlyLeftButtonStartsDrag)
{
    reducer.handle(MouseButtonInput{MouseButton::Other, true});
    EXPECT_FALSE(view.isMouseClicked());
    reducer.handle(MouseButtonInput{MouseButton::Left, true});
    EXPECT_TRUE(view.isMouseClicked());
    reducer.handle(MouseButtonInput{MouseButton::Left, false});
    EXPECT_FALSE(view.isMouseClicked());
}

TEST_F(InputReducerTest, ScrollZoomsAtCursor)
{
    reducer.handle(CursorMoveInput{700.0, 100.0});
    Point2 before = view.mouseCoords();

    reducer.handle(ScrollInput{1.0});

    EXPECT_DOUBLE_EQ(view.getZoomLevel(), 7.0);
    EXPECT_NEAR(view.mouseCoords().x, before.x, TOLERANCE);
    EXPECT_NEAR(view.mouseCoords().y, before.y, TOLERANCE);
}

TEST_F(InputReducerTest, CtrlScrollZoomsAtViewCenter)
{
    reducer.handle(CursorMoveInput{700.0, 100.0});
    reducer.handle(ModifierInput{true});
    EXPECT_TRUE(view.isCtrlPressed());

    reducer.handle(ScrollInput{-2.0});

    EXPECT_DOUBLE_EQ(view.getZoomLevel(), 10.0);
    EXPECT_DOUBLE_EQ(view.getOffset().x, ViewState::DEFAULT_OFFSET.x);
    EXPECT_DOUBLE_EQ(view.getOffset().y, ViewState::DEFAULT_OFFSET.y);

    reducer.handle(ModifierInput{false});
    EXPECT_FALSE(view.isCtrlPressed());
}
