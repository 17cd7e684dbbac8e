#include "gpu_evaluator.h"
#include <stdexcept>
#include <vector>

namespace
{
constexpr GLuint PARAMETER_BINDING = 0;
}

GpuEvaluator::GpuEvaluator(WindowSize drawable)
    : programId(0), vao(0), vbo(0), ubo(0), viewport{0, 0}, lastError(GL_NO_ERROR)
{
    // We assume an OpenGL context is already active when this is created
    if (!glGetString(GL_VERSION))
    {
        throw std::runtime_error("No active OpenGL context for the GPU evaluator");
    }

    try
    {
        initShaders();
        initGeometry();
        initUniformBuffer();
    }
    catch (...)
    {
        release();
        throw;
    }
    resize(drawable);
}

GpuEvaluator::~GpuEvaluator()
{
    release();
}

void GpuEvaluator::release()
{
    if (programId)
        glDeleteProgram(programId);
    if (vao)
        glDeleteVertexArrays(1, &vao);
    if (vbo)
        glDeleteBuffers(1, &vbo);
    if (ubo)
        glDeleteBuffers(1, &ubo);
    programId = vao = vbo = ubo = 0;
}

void GpuEvaluator::upload(const ParameterBlock &block)
{
    glBindBuffer(GL_UNIFORM_BUFFER, ubo);
    glBufferSubData(GL_UNIFORM_BUFFER, 0, sizeof(ParameterBlock), &block);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);
}

void GpuEvaluator::resize(WindowSize drawable)
{
    if (drawable.width <= 0 || drawable.height <= 0)
        return;

    viewport = drawable;
    glViewport(0, 0, viewport.width, viewport.height);
}

RenderStatus GpuEvaluator::render(WindowSize drawable)
{
    if (drawable.width != viewport.width || drawable.height != viewport.height)
        return RenderStatus::SurfaceStale;

    if (glCheckFramebufferStatus(GL_FRAMEBUFFER) != GL_FRAMEBUFFER_COMPLETE)
        return RenderStatus::SurfaceStale;

    glUseProgram(programId);
    glBindBufferBase(GL_UNIFORM_BUFFER, PARAMETER_BINDING, ubo);

    // Draw full screen quad using VAO
    glBindVertexArray(vao);
    glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
    glBindVertexArray(0);

    glUseProgram(0);

    // Report the first error, drain the rest so the next frame starts clean
    GLenum err = glGetError();
    if (err == GL_NO_ERROR)
        return RenderStatus::Ok;

    lastError = err;
    while (glGetError() != GL_NO_ERROR)
    {
    }
    return RenderStatus::Failed;
}

std::string GpuEvaluator::describeError(GLenum error)
{
    switch (error)
    {
    case GL_NO_ERROR:
        return "GL_NO_ERROR";
    case GL_INVALID_ENUM:
        return "GL_INVALID_ENUM";
    case GL_INVALID_VALUE:
        return "GL_INVALID_VALUE";
    case GL_INVALID_OPERATION:
        return "GL_INVALID_OPERATION";
    case GL_INVALID_FRAMEBUFFER_OPERATION:
        return "GL_INVALID_FRAMEBUFFER_OPERATION";
    case GL_OUT_OF_MEMORY:
        return "GL_OUT_OF_MEMORY";
    default:
        return "GL error " + std::to_string(error);
    }
}

void GpuEvaluator::initGeometry()
{
    // Full screen quad coordinates (-1 to 1)
    float vertices[] = {
        -1.0f, -1.0f,
        1.0f, -1.0f,
        -1.0f, 1.0f,
        1.0f, 1.0f};

    // Create and bind VAO (required for Core Profile)
    glGenVertexArrays(1, &vao);
    glBindVertexArray(vao);

    glGenBuffers(1, &vbo);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(vertices), vertices, GL_STATIC_DRAW);

    // Setup vertex attribute
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 0, (void *)0);

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void GpuEvaluator::initUniformBuffer()
{
    glGenBuffers(1, &ubo);
    glBindBuffer(GL_UNIFORM_BUFFER, ubo);
    glBufferData(GL_UNIFORM_BUFFER, sizeof(ParameterBlock), nullptr, GL_DYNAMIC_DRAW);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);
}

void GpuEvaluator::initShaders()
{
    // Vertex Shader - GLSL 4.0 Core
    const std::string vsSource = R"(
        #version 400 core
        in vec2 position;
        void main() {
            gl_Position = vec4(position, 0.0, 1.0);
        }
    )";

    // Fragment Shader - GLSL 4.0 Core, double precision coordinates.
    // ViewParameters must match ParameterBlock (parameter_block.h), std140
    // puts every member at the same offset as the C++ struct.
    const std::string fsSource = R"(
        #version 400 core

        layout(std140) uniform ViewParameters {
            dvec2 resolution;
            double elapsedSeconds;
            double zoomLevel;
            dvec2 offset;
            dvec2 mousePosition;
            float isMandelbrot;
            float rotateColors;
            uint maxIterations;
            uint padding;
        };

        out vec4 fragColor;

        void main() {
            // gl_FragCoord starts at the bottom left, the view transform
            // expects window coordinates from the top left
            dvec2 pixel = dvec2(gl_FragCoord.x, resolution.y - double(gl_FragCoord.y));
            double aspect = resolution.x / resolution.y;
            dvec2 normalized = dvec2(pixel.x / resolution.x * 2.0 - 1.0,
                                     (pixel.y / resolution.y * 2.0 - 1.0) / aspect);

            // No double exp() in GLSL, the factor only scales the view
            double zoomFactor = double(exp(float(zoomLevel / 10.0)));
            dvec2 point = dvec2(normalized.x, -normalized.y) * zoomFactor + offset;

            dvec2 z;
            dvec2 c;
            if (isMandelbrot > 0.5) {
                z = dvec2(0.0);
                c = point;
            } else {
                z = point;
                c = dvec2(mousePosition.x, -mousePosition.y);
            }

            uint iter = 0u;
            double r2 = 0.0;
            for (; iter < maxIterations; ++iter) {
                r2 = z.x * z.x + z.y * z.y;
                if (r2 > 256.0) {
                    break;
                }
                z = dvec2(z.x * z.x - z.y * z.y, 2.0 * z.x * z.y) + c;
            }

            if (iter >= maxIterations) {
                fragColor = vec4(0.0, 0.0, 0.0, 1.0);
                return;
            }

            // Normalized iteration count for smooth bands
            float smoothIter = float(iter) + 1.0 - log2(0.5 * log2(float(r2)));
            float phase = rotateColors > 0.5 ? float(elapsedSeconds) * 0.25 : 0.0;
            float t = smoothIter * 0.03 + phase;
            vec3 color = 0.5 + 0.5 * cos(6.2831853 * (t + vec3(0.0, 0.33, 0.67)));
            fragColor = vec4(color, 1.0);
        }
    )";

    GLuint vs = compileShader(GL_VERTEX_SHADER, vsSource);
    GLuint fs;
    try
    {
        fs = compileShader(GL_FRAGMENT_SHADER, fsSource);
    }
    catch (const std::runtime_error &)
    {
        glDeleteShader(vs);
        throw;
    }

    programId = glCreateProgram();
    glAttachShader(programId, vs);
    glAttachShader(programId, fs);

    // Bind attribute location before linking
    glBindAttribLocation(programId, 0, "position");

    glLinkProgram(programId);

    glDeleteShader(vs);
    glDeleteShader(fs);

    GLint linked;
    glGetProgramiv(programId, GL_LINK_STATUS, &linked);
    if (!linked)
    {
        char log[512];
        glGetProgramInfoLog(programId, 512, NULL, log);
        throw std::runtime_error(std::string("Shader Linking Error: ") + log);
    }

    GLuint blockIndex = glGetUniformBlockIndex(programId, "ViewParameters");
    if (blockIndex == GL_INVALID_INDEX)
    {
        throw std::runtime_error("Uniform block ViewParameters not found in shader");
    }

    GLint blockSize = 0;
    glGetActiveUniformBlockiv(programId, blockIndex, GL_UNIFORM_BLOCK_DATA_SIZE, &blockSize);
    if (blockSize != static_cast<GLint>(sizeof(ParameterBlock)))
    {
        throw std::runtime_error("Uniform block ViewParameters is " + std::to_string(blockSize) +
                                 " bytes, expected " + std::to_string(sizeof(ParameterBlock)));
    }

    glUniformBlockBinding(programId, blockIndex, PARAMETER_BINDING);
}

GLuint GpuEvaluator::compileShader(GLenum type, const std::string &source)
{
    GLuint shader = glCreateShader(type);
    const char *src = source.c_str();
    glShaderSource(shader, 1, &src, NULL);
    glCompileShader(shader);

    GLint compiled;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compiled);
    if (!compiled)
    {
        char log[512];
        glGetShaderInfoLog(shader, 512, NULL, log);
        glDeleteShader(shader);
        throw std::runtime_error(std::string("Shader Compilation Error (") + (type == GL_VERTEX_SHADER ? "VS" : "FS") + "): " + log);
    }
    return shader;
}
