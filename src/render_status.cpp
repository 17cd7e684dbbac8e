#include "render_status.h"

bool completeFrame(RenderStatus status, const WindowHost &window, const FrameActions &actions, std::ostream &log)
{
    switch (status)
    {
    case RenderStatus::Ok:
        actions.present();
        return true;

    case RenderStatus::SurfaceStale:
        actions.resize(window.getDrawableSize());
        return false;

    case RenderStatus::Failed:
        log << "Render error: " << actions.describeFailure() << std::endl;
        return false;
    }
    return false;
}
