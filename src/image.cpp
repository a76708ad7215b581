#include "image.hpp"
#include "pmacro_errors.hpp"

namespace PMACRO {

Image blankImage(int w, int h) {
    Image img;
    img.w = w > 0 ? w : 0;
    img.h = h > 0 ? h : 0;
    img.channels = 4;
    img.pixels.assign((size_t)img.w * img.h * 4, 0);
    return img;
}

GrayImage toGray(const Image& img) {
    if(img.channels < 1 || img.channels > 4)
        throw MacroError("unsupported channel count " + std::to_string(img.channels));
    size_t n = (size_t)img.w * img.h;
    if(img.w < 0 || img.h < 0 || img.pixels.size() < n * img.channels)
        throw MacroError("image buffer is smaller than " + std::to_string(img.w) + "x" + std::to_string(img.h));

    GrayImage g;
    g.w = img.w;
    g.h = img.h;
    g.data.resize(n);
    const uint8_t* p = img.pixels.data();
    for(size_t i = 0; i < n; ++i, p += img.channels){
        if(img.channels < 3) g.data[i] = p[0];
        else g.data[i] = 0.299f * p[0] + 0.587f * p[1] + 0.114f * p[2];
    }
    return g;
}

} // namespace PMACRO
