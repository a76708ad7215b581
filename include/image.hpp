#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace PMACRO {

struct ScreenSize {
    int width = 0;
    int height = 0;
};

// Decoded pixels, row-major, `channels` bytes per pixel (1, 3 or 4; RGB order)
struct Image {
    int w = 0;
    int h = 0;
    int channels = 4;
    std::vector<uint8_t> pixels;
    std::string path;

    bool empty() const { return w <= 0 || h <= 0 || pixels.empty(); }
    ScreenSize size() const { return { w, h }; }
};

// Single-channel intensity image
struct GrayImage {
    int w = 0;
    int h = 0;
    std::vector<float> data;

    float at(int x, int y) const { return data[(size_t)y * w + x]; }
};

// Blank (black) RGBA image of the given size
Image blankImage(int w, int h);

// 0.299 R + 0.587 G + 0.114 B; single-channel input is copied as is.
// Alpha is ignored.
GrayImage toGray(const Image& img);

} // namespace PMACRO
