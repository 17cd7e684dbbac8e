#include "input_reducer.h"
#include <format>
#include <iostream>
#include <type_traits>

InputReducer::InputReducer(ViewState &v, WindowHost &w, FrameSynchronizer &s)
    : view(v), window(w), synchronizer(s), verboseMode(false)
{
}

void InputReducer::handle(const InputEvent &event)
{
    std::visit([this](const auto &input)
               {
                   using T = std::decay_t<decltype(input)>;
                   if constexpr (std::is_same_v<T, KeyInput>)
                       onKey(input);
                   else if constexpr (std::is_same_v<T, CursorMoveInput>)
                       onCursorMove(input);
                   else if constexpr (std::is_same_v<T, ScrollInput>)
                       onScroll(input);
                   else if constexpr (std::is_same_v<T, MouseButtonInput>)
                       onMouseButton(input);
                   else if constexpr (std::is_same_v<T, ModifierInput>)
                       onModifier(input);
                   else
                       static_assert(!sizeof(T), "unhandled InputEvent alternative");
               },
               event);
}

void InputReducer::onKey(const KeyInput &input)
{
    // Edge-triggered only, auto-repeat would keep adding velocity
    if (input.repeat)
        return;

    // Press adds the step and release takes it back, so a held key moves at
    // constant speed and releasing it stops the movement
    double sign = input.pressed ? 1.0 : -1.0;
    double step = view.stepSize();

    switch (input.key)
    {
    case Key::A:
        view.addMovement({-sign * step, 0.0});
        return;
    case Key::D:
        view.addMovement({sign * step, 0.0});
        return;
    case Key::W:
        view.addMovement({0.0, sign * step});
        return;
    case Key::S:
        view.addMovement({0.0, -sign * step});
        return;
    default:
        break;
    }

    if (!input.pressed)
        return;

    switch (input.key)
    {
    case Key::Space:
        view.toggleMandelbrot();
        break;
    case Key::Q:
        view.toggleRotateColors();
        break;
    case Key::Comma:
    case Key::Period:
    {
        bool changed = input.key == Key::Comma ? view.decreaseIterations() : view.increaseIterations();
        if (changed)
        {
            if (verboseMode)
                std::cout << std::format("Max iterations: {}\n", view.getMaxIterations());
            synchronizer.synchronize();
        }
        break;
    }
    case Key::R:
        view.reset();
        if (verboseMode)
            std::cout << "View reset" << std::endl;
        break;
    case Key::F11:
        view.toggleFullscreen();
        window.setFullscreen(view.isFullscreen());
        if (verboseMode)
            std::cout << "Fullscreen: " << (view.isFullscreen() ? "ON" : "OFF") << std::endl;
        break;
    default:
        break;
    }
}

void InputReducer::onCursorMove(const CursorMoveInput &input)
{
    Point2 before = view.mouseCoords();
    view.moveMouse({input.x, input.y}, window.getWindowSize());
    Point2 after = view.mouseCoords();

    // Dragging keeps the grabbed complex point under the cursor
    if (view.isMouseClicked())
        view.translate({before.x - after.x, before.y - after.y});
}

void InputReducer::onScroll(const ScrollInput &input)
{
    // Wheel up zooms in, which means a smaller zoom level
    if (view.isCtrlPressed())
        view.zoom(-input.delta);
    else
        view.mouseZoom(-input.delta);
}

void InputReducer::onMouseButton(const MouseButtonInput &input)
{
    if (input.button == MouseButton::Left)
        view.setMouseClicked(input.pressed);
}

void InputReducer::onModifier(const ModifierInput &input)
{
    view.setCtrlPressed(input.ctrl);
}
