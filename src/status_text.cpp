#include "status_text.h"
#include <format>

namespace
{
constexpr int FRACTION_DIGITS = 20;
constexpr int COLUMN_WIDTH = FRACTION_DIGITS + 5;
}

std::string formatCoordinate(double value, bool imaginary)
{
    std::string text = std::format("{:.{}f}", value, FRACTION_DIGITS);

    size_t end = text.find_last_not_of('0');
    text.erase(end + 1);
    if (!text.empty() && text.back() == '.')
        text.pop_back();

    if (imaginary)
        text += 'i';
    return text;
}

std::string formatImaginary(double value)
{
    std::string text = formatCoordinate(value, true);
    if (text.front() != '-')
        text.insert(text.begin(), '+');
    return text;
}

std::string formatStatusLine(const ViewState &view)
{
    Point2 center = view.getOffset();
    Point2 mouse = view.mouseCoords();

    return std::format("{} | Zoom = x{:<{}} | Max Iter = {} | Center = {:>{}}{:<{}} | Mouse = {:>{}}{:<{}}",
                       view.isMandelbrot() ? "Mandelbrot" : "Julia",
                       formatCoordinate(1.0 / view.getZoomFactor()), COLUMN_WIDTH,
                       view.getMaxIterations(),
                       formatCoordinate(center.x), COLUMN_WIDTH,
                       formatImaginary(center.y), COLUMN_WIDTH,
                       formatCoordinate(mouse.x), COLUMN_WIDTH,
                       formatImaginary(mouse.y), COLUMN_WIDTH);
}
