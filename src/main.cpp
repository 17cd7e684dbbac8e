#include "viewer_app.h"
#include "viewer_options.h"
#include <iostream>
#include <stdexcept>

int main(int argc, char *argv[])
{
    ViewerOptions options;
    try
    {
        options = parseCommandLine(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Run with --help for the list of options" << std::endl;
        return 1;
    }

    if (options.showHelp)
    {
        printUsage(std::cout, argv[0]);
        return 0;
    }

    try
    {
        ViewerApp app(options);
        app.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
