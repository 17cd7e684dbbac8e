#pragma once

#include "input_event.h"
#include <SDL2/SDL.h>
#include <optional>

// Maps a physical key to the viewer's key set
Key translateScancode(SDL_Scancode scancode);

// Converts an SDL event into an input event for the reducer. Returns nothing
// for events the reducer does not handle (window, quit, Escape, ...), those
// stay with the application loop.
std::optional<InputEvent> translateEvent(const SDL_Event &event);

// Same, with the keyboard modifier state taken from liveModifiers instead of
// SDL_GetModState(). Used to resync Ctrl when the window regains focus.
std::optional<InputEvent> translateEvent(const SDL_Event &event, SDL_Keymod liveModifiers);
