#pragma once

#include "frame_synchronizer.h"
#include "input_event.h"
#include "view_state.h"
#include "window_host.h"

// Turns input events into ViewState changes. Events are handled in arrival
// order on the thread that owns the view.
class InputReducer
{
public:
    InputReducer(ViewState &view, WindowHost &window, FrameSynchronizer &synchronizer);

    void handle(const InputEvent &event);

    void setVerboseMode(bool verbose) { verboseMode = verbose; }

private:
    ViewState &view;
    WindowHost &window;
    FrameSynchronizer &synchronizer;
    bool verboseMode;

    void onKey(const KeyInput &input);
    void onCursorMove(const CursorMoveInput &input);
    void onScroll(const ScrollInput &input);
    void onMouseButton(const MouseButtonInput &input);
    void onModifier(const ModifierInput &input);
};
