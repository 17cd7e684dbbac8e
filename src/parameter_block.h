#pragma once

#include <cstddef>
#include <cstdint>

// Per-frame data handed to the fragment shader. The layout mirrors the
// std140 uniform block `ViewParameters` in gpu_evaluator.cpp, both sides
// have to change together.
struct ParameterBlock
{
    double resolution[2];    // drawable width and height in pixels
    double elapsedSeconds;   // time since the session started
    double zoomLevel;        // log-domain zoom, factor = exp(zoomLevel / 10)
    double offset[2];        // view center in the complex plane
    double mousePosition[2]; // cursor, normalized to [-1, 1] window space
    float isMandelbrot;      // 1.0 = Mandelbrot, 0.0 = Julia
    float rotateColors;      // 1.0 = palette phase follows elapsedSeconds
    uint32_t maxIterations;
    uint32_t padding;
};

static_assert(sizeof(ParameterBlock) % 16 == 0, "uniform buffers are 16-byte aligned");
static_assert(sizeof(ParameterBlock) == 80);
static_assert(offsetof(ParameterBlock, resolution) == 0);
static_assert(offsetof(ParameterBlock, elapsedSeconds) == 16);
static_assert(offsetof(ParameterBlock, zoomLevel) == 24);
static_assert(offsetof(ParameterBlock, offset) == 32);
static_assert(offsetof(ParameterBlock, mousePosition) == 48);
static_assert(offsetof(ParameterBlock, isMandelbrot) == 64);
static_assert(offsetof(ParameterBlock, rotateColors) == 68);
static_assert(offsetof(ParameterBlock, maxIterations) == 72);
static_assert(offsetof(ParameterBlock, padding) == 76);
