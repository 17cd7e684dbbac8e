#pragma once

#include "window_host.h"
#include <functional>
#include <ostream>
#include <string>

enum class RenderStatus
{
    Ok,
    SurfaceStale, // drawable no longer matches the viewport, resize and retry
    Failed        // GL reported an error, frame skipped
};

// Hooks into the surface a frame was drawn to
struct FrameActions
{
    std::function<void()> present;
    std::function<void(WindowSize)> resize;
    std::function<std::string()> describeFailure;
};

// Finishes a drawn frame: presents it, reconfigures a stale surface to the
// current drawable size, or logs the failure. Returns true when presented.
bool completeFrame(RenderStatus status, const WindowHost &window, const FrameActions &actions, std::ostream &log);
