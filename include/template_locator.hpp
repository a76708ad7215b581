#pragma once
#include "image.hpp"
#include "pmacro_value.hpp"

namespace PMACRO {

struct MatchResult {
    bool found = false;
    Position center;          // capture-pixel space
    Position offset;          // top-left of best window
    double confidence = 0.0;  // best normalised cross-correlation score
    bool searched = false;    // false when the template does not fit
};

// Zero-mean normalised cross-correlation over every offset where the template
// fits inside the captured image. `threshold` is a fraction in [0,1].
MatchResult locate(const Image& captured, const Image& templ, double threshold);
MatchResult locate(const GrayImage& captured, const GrayImage& templ, double threshold);

// logical = center / (captureSize / logicalSize), per axis, truncated
Position rescaleToLogical(const Position& center, ScreenSize captureSize, ScreenSize logicalSize);

} // namespace PMACRO
