#pragma once

// A pair of doubles: pixels, normalized window space or complex plane
// depending on where it comes from.
struct Point2
{
    double x = 0.0;
    double y = 0.0;
};

struct WindowSize
{
    int width = 0;
    int height = 0;
};

// Linear zoom factor for a log-domain zoom level. exp() makes equal wheel
// steps feel equally large at any depth.
double computeZoomFactor(double zoomLevel);

// Maps a pixel position to [-1, 1] horizontally and [-1, 1] / aspect
// vertically, aspect = width / height.
Point2 screenToNormalized(Point2 pixel, WindowSize window);

// complex = normalized * zoomFactor + offset, with the y axis flipped since
// screen y grows downwards.
Point2 normalizedToComplex(Point2 normalized, Point2 offset, double zoomFactor);
