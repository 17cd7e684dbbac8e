#pragma once

#include "coordinate_transform.h"
#include "render_status.h"
#include "window_host.h"
#include <SDL2/SDL.h>

// Define this to get modern OpenGL functions
#define GL_GLEXT_PROTOTYPES
#include <SDL2/SDL_opengl.h>
#include <string>

// Evaluates the fractal per pixel in a fragment shader. The parameter block
// goes into a uniform buffer, the image is one full screen quad.
class GpuEvaluator : public ParameterSink
{
public:
    // Requires a current OpenGL 4.0 core context
    explicit GpuEvaluator(WindowSize drawable);
    ~GpuEvaluator();

    GpuEvaluator(const GpuEvaluator &) = delete;
    GpuEvaluator &operator=(const GpuEvaluator &) = delete;

    void upload(const ParameterBlock &block) override;

    // Reconfigures the viewport, ignored for empty sizes (minimized window)
    void resize(WindowSize drawable);

    RenderStatus render(WindowSize drawable);

    GLenum getLastError() const { return lastError; }

    static std::string describeError(GLenum error);

private:
    GLuint programId;
    GLuint vao;
    GLuint vbo;
    GLuint ubo;

    WindowSize viewport;
    GLenum lastError;

    void release();
    void initShaders();
    void initGeometry();
    void initUniformBuffer();
    GLuint compileShader(GLenum type, const std::string &source);
};
