#include "viewer_options.h"
#include <charconv>
#include <cstring>
#include <ostream>
#include <stdexcept>
#include <system_error>

namespace
{
constexpr int MIN_WINDOW_EXTENT = 64;
constexpr int MAX_WINDOW_EXTENT = 16384;

int parseExtent(const char *option, const char *value)
{
    int result = 0;
    const char *end = value + std::strlen(value);
    auto [ptr, ec] = std::from_chars(value, end, result);
    if (ec != std::errc() || ptr != end)
        throw std::invalid_argument(std::string(option) + " expects an integer, got '" + value + "'");

    if (result < MIN_WINDOW_EXTENT || result > MAX_WINDOW_EXTENT)
        throw std::invalid_argument(std::string(option) + " must be between " + std::to_string(MIN_WINDOW_EXTENT) +
                                    " and " + std::to_string(MAX_WINDOW_EXTENT));
    return result;
}
}

ViewerOptions parseCommandLine(int argc, const char *const argv[])
{
    ViewerOptions options;

    for (int i = 1; i < argc; ++i)
    {
        if (strcmp(argv[i], "--width") == 0 || strcmp(argv[i], "--height") == 0)
        {
            if (i + 1 >= argc)
                throw std::invalid_argument(std::string(argv[i]) + " requires an argument");

            int extent = parseExtent(argv[i], argv[i + 1]);
            if (strcmp(argv[i], "--width") == 0)
                options.width = extent;
            else
                options.height = extent;
            ++i;
        }
        else if (strcmp(argv[i], "--fullscreen") == 0 || strcmp(argv[i], "-F") == 0)
        {
            options.fullscreen = true;
        }
        else if (strcmp(argv[i], "--no-vsync") == 0)
        {
            options.vsync = false;
        }
        else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0)
        {
            options.verbose = true;
        }
        else if (strcmp(argv[i], "--quiet") == 0 || strcmp(argv[i], "-q") == 0)
        {
            options.quiet = true;
        }
        else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0)
        {
            options.showHelp = true;
        }
        else
        {
            throw std::invalid_argument(std::string("Unknown option: ") + argv[i]);
        }
    }

    return options;
}

void printUsage(std::ostream &out, const std::string &program)
{
    out << "Interactive GPU Mandelbrot / Julia viewer" << std::endl;
    out << "\nUsage: " << program << " [options]" << std::endl;
    out << "\nOptions:" << std::endl;
    out << "  --width <px>        Initial window width (default 1280)" << std::endl;
    out << "  --height <px>       Initial window height (default 720)" << std::endl;
    out << "  --fullscreen, -F    Start in borderless fullscreen" << std::endl;
    out << "  --no-vsync          Do not wait for vertical sync" << std::endl;
    out << "  --verbose, -v       Print frame timing and state changes" << std::endl;
    out << "  --quiet, -q         Do not print the controls on startup" << std::endl;
    out << "  --help, -h          Show this help message" << std::endl;
    out << std::endl;
    printControls(out);
}

void printControls(std::ostream &out)
{
    out << "Keyboard controls:" << std::endl;
    out << "  W/A/S/D  - Pan (hold)" << std::endl;
    out << "  SPACE    - Toggle Mandelbrot / Julia" << std::endl;
    out << "  Q        - Toggle color rotation" << std::endl;
    out << "  , / .    - Max iterations -100 / +100" << std::endl;
    out << "  R        - Reset view" << std::endl;
    out << "  F11      - Toggle fullscreen" << std::endl;
    out << "  ESC      - Quit" << std::endl;
    out << "\nMouse controls:" << std::endl;
    out << "  Drag       - Pan" << std::endl;
    out << "  Wheel      - Zoom at cursor" << std::endl;
    out << "  Ctrl+Wheel - Zoom at view center" << std::endl;
}
