// ImageDriver.h
#pragma once

#include "SDL2/SDL.h"
#include "SDL2/SDL_image.h"

#include <optional>
#include <string>

#include "image.hpp"

namespace PMACRO {

// Thin SDL2 / SDL2_image layer: decoding template files and display geometry.
// Decoding needs SDL_image only, so it works without a video device.
class ImageDriver {
public:
    ImageDriver();
    ~ImageDriver();

    ImageDriver(const ImageDriver&) = delete;
    ImageDriver& operator=(const ImageDriver&) = delete;

    // Initialize/Shutdown
    bool init();              // SDL video, for display queries
    bool initDecoder();       // SDL_image loaders
    void shutdown();          // cleans up whatever was started

    // Decode an image file into RGBA pixels; empty on error
    std::optional<Image> loadImage(const std::string &path);

    // Desktop mode of the primary display, in logical pixels
    bool displaySize(ScreenSize &out);

private:
    bool videoInited_ = false;
    bool decoderInited_ = false;

    // Copy a surface into an Image, converting to RGBA32. Frees `surf`.
    std::optional<Image> imageFromSurface(SDL_Surface* surf, const std::string &path);
};

} // namespace PMACRO
