#pragma once

#include "coordinate_transform.h"
#include "parameter_block.h"
#include <chrono>
#include <cstdint>
#include <limits>

// The mutable session state of the viewer: which part of the complex plane
// is shown, how deep, in which mode, and what the input devices are doing.
// One instance lives for the whole session and is owned by ViewerApp.
class ViewState
{
public:
    using Clock = std::chrono::steady_clock;

    static constexpr double MIN_ZOOM_LEVEL = -314.0;
    static constexpr double MAX_ZOOM_LEVEL = 42.0;
    static constexpr uint32_t ITERATION_STEP = 100;
    static constexpr uint32_t MIN_ITERATIONS = 100;
    static constexpr uint32_t MAX_ITERATIONS = std::numeric_limits<uint32_t>::max() / 10;

    static constexpr double DEFAULT_ZOOM_LEVEL = 8.0;
    static constexpr Point2 DEFAULT_OFFSET = {(0.25 - 2.0) / 2.0, 0.0};
    static constexpr uint32_t DEFAULT_ITERATIONS = 1500;

    ViewState();
    explicit ViewState(Clock::time_point sessionStart);

    // Moves the view center by delta (complex-plane units).
    void translate(Point2 delta);

    // Adds delta to the zoom level, clamps it and rescales any running
    // keyboard velocity to the new step size.
    void zoom(double delta);

    // Same as zoom() but keeps the complex point under the cursor in place.
    void mouseZoom(double delta);

    void moveMouse(Point2 pixel, WindowSize window);
    Point2 mouseCoords() const;

    // Restores the view defaults. Input mirrors (ctrl, mouse button,
    // fullscreen) and the session clock are left alone.
    void reset();

    // Keyboard pan speed for the current zoom. Never below epsilon so
    // panning still works at the deepest zoom.
    double stepSize() const;
    void addMovement(Point2 delta);

    bool increaseIterations();
    bool decreaseIterations();
    void setMaxIterations(uint32_t iterations);

    void toggleMandelbrot() { mandelbrot = !mandelbrot; }
    void toggleRotateColors() { rotateColors = !rotateColors; }
    void toggleFullscreen() { fullscreen = !fullscreen; }

    void setCtrlPressed(bool pressed) { ctrlPressed = pressed; }
    void setMouseClicked(bool clicked) { mouseClicked = clicked; }
    void setFullscreen(bool enabled) { fullscreen = enabled; }

    double getZoomLevel() const { return zoomLevel; }
    double getZoomFactor() const { return computeZoomFactor(zoomLevel); }
    Point2 getOffset() const { return offset; }
    Point2 getMousePosition() const { return mousePosition; }
    Point2 getMovementDelta() const { return movementDelta; }
    uint32_t getMaxIterations() const { return maxIterations; }
    bool isMandelbrot() const { return mandelbrot; }
    bool isRotatingColors() const { return rotateColors; }
    bool isCtrlPressed() const { return ctrlPressed; }
    bool isMouseClicked() const { return mouseClicked; }
    bool isFullscreen() const { return fullscreen; }

    double elapsedSeconds(Clock::time_point now) const;

    // Flattens the state into the layout the shader reads. Booleans become
    // 0.0 / 1.0 here and nowhere else.
    ParameterBlock toParameterBlock(WindowSize resolution, double elapsed) const;

private:
    Clock::time_point sessionStart;

    double zoomLevel;
    Point2 offset;
    Point2 mousePosition;
    Point2 movementDelta;
    uint32_t maxIterations;

    bool mandelbrot;
    bool rotateColors;
    bool ctrlPressed;
    bool mouseClicked;
    bool fullscreen;

    void rescaleMovement();
};
