#include "sdl_event_translator.h"

Key translateScancode(SDL_Scancode scancode)
{
    switch (scancode)
    {
    case SDL_SCANCODE_A:
        return Key::A;
    case SDL_SCANCODE_D:
        return Key::D;
    case SDL_SCANCODE_W:
        return Key::W;
    case SDL_SCANCODE_S:
        return Key::S;
    case SDL_SCANCODE_SPACE:
        return Key::Space;
    case SDL_SCANCODE_Q:
        return Key::Q;
    case SDL_SCANCODE_COMMA:
        return Key::Comma;
    case SDL_SCANCODE_PERIOD:
        return Key::Period;
    case SDL_SCANCODE_R:
        return Key::R;
    case SDL_SCANCODE_F11:
        return Key::F11;
    default:
        return Key::Other;
    }
}

std::optional<InputEvent> translateEvent(const SDL_Event &event)
{
    return translateEvent(event, SDL_GetModState());
}

std::optional<InputEvent> translateEvent(const SDL_Event &event, SDL_Keymod liveModifiers)
{
    switch (event.type)
    {
    case SDL_KEYDOWN:
    case SDL_KEYUP:
    {
        SDL_Scancode scancode = event.key.keysym.scancode;
        if (scancode == SDL_SCANCODE_ESCAPE)
            return std::nullopt;

        // SDL has no modifier event, the Ctrl keys stand in for it
        if (scancode == SDL_SCANCODE_LCTRL || scancode == SDL_SCANCODE_RCTRL)
            return ModifierInput{(event.key.keysym.mod & KMOD_CTRL) != 0};

        Key key = translateScancode(scancode);
        if (key == Key::Other)
            return std::nullopt;

        return KeyInput{key, event.type == SDL_KEYDOWN, event.key.repeat != 0};
    }

    case SDL_WINDOWEVENT:
        // Ctrl may have changed while another window had focus
        if (event.window.event == SDL_WINDOWEVENT_FOCUS_GAINED)
            return ModifierInput{(liveModifiers & KMOD_CTRL) != 0};
        return std::nullopt;

    case SDL_MOUSEMOTION:
        return CursorMoveInput{static_cast<double>(event.motion.x), static_cast<double>(event.motion.y)};

    case SDL_MOUSEWHEEL:
    {
        // Horizontal scrolling is not used
        if (event.wheel.y == 0)
            return std::nullopt;

        double delta = static_cast<double>(event.wheel.y);
        if (event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED)
            delta = -delta;
        return ScrollInput{delta};
    }

    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
    {
        MouseButton button = event.button.button == SDL_BUTTON_LEFT ? MouseButton::Left : MouseButton::Other;
        return MouseButtonInput{button, event.type == SDL_MOUSEBUTTONDOWN};
    }

    default:
        return std::nullopt;
    }
}
