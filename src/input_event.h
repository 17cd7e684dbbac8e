#pragma once

#include <variant>

// Physical keys the viewer reacts to. Everything else maps to Other and is
// ignored by the reducer.
enum class Key
{
    A,
    D,
    W,
    S,
    Space,
    Q,
    Comma,
    Period,
    R,
    F11,
    Other
};

enum class MouseButton
{
    Left,
    Other
};

struct KeyInput
{
    Key key;
    bool pressed;
    bool repeat;
};

struct CursorMoveInput
{
    double x;
    double y;
};

// Vertical wheel movement in lines, positive = away from the user.
struct ScrollInput
{
    double delta;
};

struct MouseButtonInput
{
    MouseButton button;
    bool pressed;
};

struct ModifierInput
{
    bool ctrl;
};

// The closed set of events the input reducer accepts. The platform layer
// filters everything else out before it gets here.
using InputEvent = std::variant<KeyInput, CursorMoveInput, ScrollInput, MouseButtonInput, ModifierInput>;
