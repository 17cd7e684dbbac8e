#pragma once

#include "view_state.h"
#include <string>

// Fixed-point with 20 fractional digits, trailing zeros (and a bare decimal
// point) removed. Imaginary values get an `i` suffix.
std::string formatCoordinate(double value, bool imaginary = false);

// "+0.5i" / "-0.5i": imaginary part with an explicit sign
std::string formatImaginary(double value);

// One-line summary of the view for the window title
std::string formatStatusLine(const ViewState &view);
