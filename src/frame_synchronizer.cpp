#include "frame_synchronizer.h"
#include "status_text.h"
#include <utility>

FrameSynchronizer::FrameSynchronizer(ViewState &v, WindowHost &w, ParameterSink &s)
    : FrameSynchronizer(v, w, s, [] { return ViewState::Clock::now(); })
{
}

FrameSynchronizer::FrameSynchronizer(ViewState &v, WindowHost &w, ParameterSink &s, TimeSource clock)
    : view(v), window(w), sink(s), now(std::move(clock)), lastBlock{}
{
}

void FrameSynchronizer::synchronize()
{
    double elapsed = view.elapsedSeconds(now());
    WindowSize resolution = window.getDrawableSize();

    // Held keys move the view at a fixed rate per frame, independent of how
    // often key events arrive
    view.translate(view.getMovementDelta());

    lastBlock = view.toParameterBlock(resolution, elapsed);
    sink.upload(lastBlock);

    lastStatus = formatStatusLine(view);
    window.setTitle(lastStatus);
}
