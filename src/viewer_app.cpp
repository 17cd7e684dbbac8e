#include "viewer_app.h"
#include "sdl_event_translator.h"
#include <format>
#include <iostream>
#include <stdexcept>

ViewerApp::ViewerApp(const ViewerOptions &opts)
    : options(opts), window(nullptr), glContext(nullptr), statsStart(std::chrono::steady_clock::now()), statsFrames(0)
{
    initSDL();

    try
    {
        initGL();
        evaluator = std::make_unique<GpuEvaluator>(getDrawableSize());
    }
    catch (...)
    {
        cleanup();
        throw;
    }

    view.setFullscreen(options.fullscreen);
    synchronizer = std::make_unique<FrameSynchronizer>(view, *this, *evaluator);
    reducer = std::make_unique<InputReducer>(view, *this, *synchronizer);
    reducer->setVerboseMode(options.verbose);
}

ViewerApp::~ViewerApp()
{
    cleanup();
}

void ViewerApp::cleanup()
{
    // GL objects have to go while the context still exists
    reducer.reset();
    synchronizer.reset();
    evaluator.reset();

    if (glContext)
        SDL_GL_DeleteContext(glContext);
    glContext = nullptr;
    if (window)
        SDL_DestroyWindow(window);
    window = nullptr;
    SDL_Quit();
}

void ViewerApp::initSDL()
{
    if (SDL_Init(SDL_INIT_VIDEO) < 0)
    {
        throw std::runtime_error(std::string("SDL initialization failed: ") + SDL_GetError());
    }

    // Double precision in shaders needs GL 4.0
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 4);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    Uint32 flags = SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_OPENGL | SDL_WINDOW_ALLOW_HIGHDPI;
    if (options.fullscreen)
        flags |= SDL_WINDOW_FULLSCREEN_DESKTOP;

    window = SDL_CreateWindow(
        "Mandelbrot",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        options.width, options.height, flags);

    if (!window)
    {
        SDL_Quit();
        throw std::runtime_error(std::string("Window creation failed: ") + SDL_GetError());
    }
}

void ViewerApp::initGL()
{
    glContext = SDL_GL_CreateContext(window);
    if (!glContext)
    {
        throw std::runtime_error(std::string("OpenGL 4.0 context creation failed: ") + SDL_GetError());
    }
    SDL_GL_MakeCurrent(window, glContext);

    if (SDL_GL_SetSwapInterval(options.vsync ? 1 : 0) != 0)
    {
        std::cerr << "Could not set swap interval: " << SDL_GetError() << std::endl;
    }

    if (options.verbose)
    {
        std::cout << "OpenGL " << glGetString(GL_VERSION) << " on " << glGetString(GL_RENDERER) << std::endl;
    }
}

WindowSize ViewerApp::getWindowSize() const
{
    WindowSize size;
    SDL_GetWindowSize(window, &size.width, &size.height);
    return size;
}

WindowSize ViewerApp::getDrawableSize() const
{
    WindowSize size;
    SDL_GL_GetDrawableSize(window, &size.width, &size.height);
    return size;
}

void ViewerApp::setTitle(const std::string &title)
{
    SDL_SetWindowTitle(window, title.c_str());
}

void ViewerApp::setFullscreen(bool enabled)
{
    if (SDL_SetWindowFullscreen(window, enabled ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0) != 0)
    {
        std::cerr << "Fullscreen switch failed: " << SDL_GetError() << std::endl;
    }
}

void ViewerApp::run()
{
    if (!options.quiet)
    {
        printControls(std::cout);
    }

    while (processEvents())
    {
        if (SDL_GetWindowFlags(window) & SDL_WINDOW_MINIMIZED)
        {
            SDL_Delay(16);
            continue;
        }

        renderFrame();
    }
}

bool ViewerApp::processEvents()
{
    SDL_Event event;
    while (SDL_PollEvent(&event))
    {
        switch (event.type)
        {
        case SDL_QUIT:
            return false;

        case SDL_WINDOWEVENT:
            if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
            {
                evaluator->resize(getDrawableSize());
            }
            break;

        case SDL_KEYDOWN:
            if (event.key.keysym.scancode == SDL_SCANCODE_ESCAPE)
            {
                return false;
            }
            break;

        default:
            break;
        }

        if (auto input = translateEvent(event))
        {
            reducer->handle(*input);
        }
    }
    return true;
}

void ViewerApp::renderFrame()
{
    synchronizer->synchronize();

    FrameActions actions{
        [this] { SDL_GL_SwapWindow(window); },
        [this](WindowSize drawable) { evaluator->resize(drawable); },
        [this] { return GpuEvaluator::describeError(evaluator->getLastError()); }};
    completeFrame(evaluator->render(getDrawableSize()), *this, actions, std::cerr);

    if (options.verbose)
    {
        reportFrameStats();
    }
}

void ViewerApp::reportFrameStats()
{
    ++statsFrames;

    auto now = std::chrono::steady_clock::now();
    std::chrono::duration<double, std::milli> interval = now - statsStart;
    if (interval.count() < 1000.0)
        return;

    std::cout << std::format("{:>5} frames {:>8.2f} ms/frame  zoom {:>9.3f}  iter {}\n",
                             statsFrames, interval.count() / statsFrames,
                             view.getZoomLevel(), view.getMaxIterations());

    statsStart = now;
    statsFrames = 0;
}
