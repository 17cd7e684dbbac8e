#pragma once

#include <iosfwd>
#include <string>

struct ViewerOptions
{
    int width = 1280;
    int height = 720;
    bool fullscreen = false;
    bool vsync = true;
    bool verbose = false;
    bool quiet = false;
    bool showHelp = false;
};

// Parses argv. Throws std::invalid_argument on unknown options and bad
// values.
ViewerOptions parseCommandLine(int argc, const char *const argv[]);

void printUsage(std::ostream &out, const std::string &program);
void printControls(std::ostream &out);
