#include "coordinate_transform.h"
#include <cmath>

double computeZoomFactor(double zoomLevel)
{
    return std::exp(zoomLevel / 10.0);
}

Point2 screenToNormalized(Point2 pixel, WindowSize window)
{
    double w = static_cast<double>(window.width);
    double h = static_cast<double>(window.height);
    double aspect = w / h;

    double nx = std::fma(pixel.x / w, 2.0, -1.0);
    double ny = std::fma(pixel.y / h, 2.0, -1.0) / aspect;
    return {nx, ny};
}

Point2 normalizedToComplex(Point2 normalized, Point2 offset, double zoomFactor)
{
    return {std::fma(normalized.x, zoomFactor, offset.x),
            std::fma(-normalized.y, zoomFactor, offset.y)};
}
