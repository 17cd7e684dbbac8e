#pragma once

#include "coordinate_transform.h"
#include "parameter_block.h"
#include <string>

// What the core needs from the window it is shown in
class WindowHost
{
public:
    virtual ~WindowHost() = default;

    // Logical window size, the space cursor positions are reported in
    virtual WindowSize getWindowSize() const = 0;

    // Size of the surface in pixels, differs from the window size on HiDPI
    virtual WindowSize getDrawableSize() const = 0;

    virtual void setTitle(const std::string &title) = 0;
    virtual void setFullscreen(bool enabled) = 0;
};

// Receives the parameter block once per frame
class ParameterSink
{
public:
    virtual ~ParameterSink() = default;

    virtual void upload(const ParameterBlock &block) = 0;
};
