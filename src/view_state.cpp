#include "view_state.h"
#include <algorithm>
#include <cmath>

ViewState::ViewState()
    : ViewState(Clock::now())
{
}

ViewState::ViewState(Clock::time_point start)
    : sessionStart(start), zoomLevel(DEFAULT_ZOOM_LEVEL), offset(DEFAULT_OFFSET),
      mousePosition{0.0, 0.0}, movementDelta{0.0, 0.0}, maxIterations(DEFAULT_ITERATIONS),
      mandelbrot(true), rotateColors(true), ctrlPressed(false), mouseClicked(false), fullscreen(false)
{
}

void ViewState::translate(Point2 delta)
{
    offset.x += delta.x;
    offset.y += delta.y;
}

void ViewState::zoom(double delta)
{
    // Past these bounds double precision starts to visibly distort the image
    zoomLevel = std::clamp(zoomLevel + delta, MIN_ZOOM_LEVEL, MAX_ZOOM_LEVEL);
    rescaleMovement();
}

void ViewState::mouseZoom(double delta)
{
    Point2 before = mouseCoords();
    zoom(delta);
    Point2 after = mouseCoords();
    translate({before.x - after.x, before.y - after.y});
}

void ViewState::moveMouse(Point2 pixel, WindowSize window)
{
    // Minimized windows report a zero extent
    if (window.width <= 0 || window.height <= 0)
        return;

    mousePosition = screenToNormalized(pixel, window);
}

Point2 ViewState::mouseCoords() const
{
    return normalizedToComplex(mousePosition, offset, getZoomFactor());
}

void ViewState::reset()
{
    zoomLevel = DEFAULT_ZOOM_LEVEL;
    offset = DEFAULT_OFFSET;
    mousePosition = {0.0, 0.0};
    maxIterations = DEFAULT_ITERATIONS;
    mandelbrot = true;
    rotateColors = true;

    // A key may still be held, keep its direction at the new speed
    rescaleMovement();
}

double ViewState::stepSize() const
{
    return std::max(0.005 * getZoomFactor(), std::numeric_limits<double>::epsilon());
}

void ViewState::addMovement(Point2 delta)
{
    movementDelta.x += delta.x;
    movementDelta.y += delta.y;
}

bool ViewState::increaseIterations()
{
    if (maxIterations > MAX_ITERATIONS - ITERATION_STEP)
        return false;

    maxIterations += ITERATION_STEP;
    return true;
}

bool ViewState::decreaseIterations()
{
    if (maxIterations < MIN_ITERATIONS + ITERATION_STEP)
        return false;

    maxIterations -= ITERATION_STEP;
    return true;
}

void ViewState::setMaxIterations(uint32_t iterations)
{
    iterations = std::clamp(iterations, MIN_ITERATIONS, MAX_ITERATIONS);
    maxIterations = iterations - iterations % ITERATION_STEP;
}

double ViewState::elapsedSeconds(Clock::time_point now) const
{
    return std::chrono::duration<double>(now - sessionStart).count();
}

ParameterBlock ViewState::toParameterBlock(WindowSize resolution, double elapsed) const
{
    ParameterBlock block{};
    block.resolution[0] = static_cast<double>(resolution.width);
    block.resolution[1] = static_cast<double>(resolution.height);
    block.elapsedSeconds = elapsed;
    block.zoomLevel = zoomLevel;
    block.offset[0] = offset.x;
    block.offset[1] = offset.y;
    block.mousePosition[0] = mousePosition.x;
    block.mousePosition[1] = mousePosition.y;
    block.isMandelbrot = mandelbrot ? 1.0f : 0.0f;
    block.rotateColors = rotateColors ? 1.0f : 0.0f;
    block.maxIterations = maxIterations;
    block.padding = 0;
    return block;
}

void ViewState::rescaleMovement()
{
    double step = stepSize();
    if (movementDelta.x != 0.0)
        movementDelta.x = std::copysign(step, movementDelta.x);
    if (movementDelta.y != 0.0)
        movementDelta.y = std::copysign(step, movementDelta.y);
}
