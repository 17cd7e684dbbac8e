#include "frame_synchronizer.h"
#include "input_reducer.h"
#include "test_doubles.h"
#include <gtest/gtest.h>

namespace
{
class FrameSynchronizerTest : public ::testing::Test
{
protected:
    ViewState::Clock::time_point start{};
    ViewState::Clock::time_point clock = start;
    ViewState view{start};
    FakeWindow window;
    RecordingSink sink;
    FrameSynchronizer synchronizer{view, window, sink, [this] { return clock; }};
};
}

TEST_F(FrameSynchronizerTest, StampsTimeAndResolution)
{
    window.drawableSize = {1600, 1200};
    clock = start + std::chrono::milliseconds(1500);

    synchronizer.synchronize();

    ASSERT_EQ(sink.blocks.size(), 1u);
    const ParameterBlock &block = sink.blocks.back();
    EXPECT_DOUBLE_EQ(block.elapsedSeconds, 1.5);
    EXPECT_EQ(block.resolution[0], 1600.0);
    EXPECT_EQ(block.resolution[1], 1200.0);
    EXPECT_EQ(block.zoomLevel, view.getZoomLevel());
    EXPECT_EQ(block.maxIterations, view.getMaxIterations());
}

TEST_F(FrameSynchronizerTest, FoldsMovementOncePerFrame)
{
    view.addMovement({0.25, -0.5});
    Point2 origin = view.getOffset();

    synchronizer.synchronize();
    EXPECT_DOUBLE_EQ(view.getOffset().x, origin.x + 0.25);
    EXPECT_DOUBLE_EQ(view.getOffset().y, origin.y - 0.5);

    synchronizer.synchronize();
    EXPECT_DOUBLE_EQ(view.getOffset().x, origin.x + 0.5);
    EXPECT_DOUBLE_EQ(view.getOffset().y, origin.y - 1.0);

    // The uploaded block already contains the moved offset
    EXPECT_EQ(sink.blocks.back().offset[0], view.getOffset().x);
    EXPECT_EQ(sink.blocks.back().offset[1], view.getOffset().y);
}

TEST_F(FrameSynchronizerTest, HeldKeyMovesByStepPerFrame)
{
    InputReducer reducer(view, window, synchronizer);
    double step = view.stepSize();
    double x0 = view.getOffset().x;

    reducer.handle(KeyInput{Key::D, true, false});
    for (int i = 0; i < 10; ++i)
        synchronizer.synchronize();
    reducer.handle(KeyInput{Key::D, false, false});
    synchronizer.synchronize();

    EXPECT_NEAR(view.getOffset().x, x0 + 10 * step, 1e-12);
}

TEST_F(FrameSynchronizerTest, BooleansBecomeNumbers)
{
    view.toggleMandelbrot();
    synchronizer.synchronize();
    EXPECT_EQ(sink.blocks.back().isMandelbrot, 0.0f);
    EXPECT_EQ(sink.blocks.back().rotateColors, 1.0f);
}

TEST_F(FrameSynchronizerTest, SetsWindowTitle)
{
    synchronizer.synchronize();
    ASSERT_EQ(window.titles.size(), 1u);
    EXPECT_EQ(window.titles.back(), synchronizer.getLastStatus());
    EXPECT_EQ(window.titles.back().rfind("Mandelbrot | Zoom = x", 0), 0u);
    EXPECT_NE(window.titles.back().find("Max Iter = 1500"), std::string::npos);
}

TEST_F(FrameSynchronizerTest, LastBlockMatchesUpload)
{
    synchronizer.synchronize();
    EXPECT_EQ(synchronizer.getLastBlock().zoomLevel, sink.blocks.back().zoomLevel);
    EXPECT_EQ(synchronizer.getLastBlock().offset[0], sink.blocks.back().offset[0]);
}
