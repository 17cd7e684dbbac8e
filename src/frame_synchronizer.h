#pragma once

#include "view_state.h"
#include "window_host.h"
#include <functional>
#include <string>

// Runs once per frame before the draw: integrates the keyboard velocity,
// builds the parameter block, uploads it and refreshes the window title.
class FrameSynchronizer
{
public:
    using TimeSource = std::function<ViewState::Clock::time_point()>;

    FrameSynchronizer(ViewState &view, WindowHost &window, ParameterSink &sink);
    FrameSynchronizer(ViewState &view, WindowHost &window, ParameterSink &sink, TimeSource now);

    void synchronize();

    // The block sent by the last synchronize() call
    const ParameterBlock &getLastBlock() const { return lastBlock; }
    const std::string &getLastStatus() const { return lastStatus; }

private:
    ViewState &view;
    WindowHost &window;
    ParameterSink &sink;
    TimeSource now;

    ParameterBlock lastBlock;
    std::string lastStatus;
};
