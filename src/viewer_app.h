#pragma once

#include "frame_synchronizer.h"
#include "gpu_evaluator.h"
#include "input_reducer.h"
#include "view_state.h"
#include "viewer_options.h"
#include "window_host.h"
#include <SDL2/SDL.h>
#include <chrono>
#include <memory>
#include <string>

class ViewerApp : public WindowHost
{
public:
    explicit ViewerApp(const ViewerOptions &options);
    ~ViewerApp();

    ViewerApp(const ViewerApp &) = delete;
    ViewerApp &operator=(const ViewerApp &) = delete;

    void run();

    WindowSize getWindowSize() const override;
    WindowSize getDrawableSize() const override;
    void setTitle(const std::string &title) override;
    void setFullscreen(bool enabled) override;

private:
    ViewerOptions options;

    SDL_Window *window;
    SDL_GLContext glContext;

    ViewState view;
    std::unique_ptr<GpuEvaluator> evaluator;
    std::unique_ptr<FrameSynchronizer> synchronizer;
    std::unique_ptr<InputReducer> reducer;

    // Verbose frame statistics
    std::chrono::steady_clock::time_point statsStart;
    int statsFrames;

    void initSDL();
    void initGL();
    void cleanup();

    // Returns false once the session should end
    bool processEvents();
    void renderFrame();
    void reportFrameStats();
};
