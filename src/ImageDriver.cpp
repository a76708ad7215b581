// ImageDriver.cpp
#include "image_driver.hpp"

#include <cstring>
#include <iostream>

namespace PMACRO {

ImageDriver::ImageDriver() {}
ImageDriver::~ImageDriver() { shutdown(); }

bool ImageDriver::init() {
    if (videoInited_) return true;
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << std::endl;
        return false;
    }
    videoInited_ = true;
    return true;
}

bool ImageDriver::initDecoder() {
    if (decoderInited_) return true;
    int imgFlags = IMG_INIT_PNG | IMG_INIT_JPG;
    if (!(IMG_Init(imgFlags) & imgFlags)) {
        std::cerr << "IMG_Init failed: " << IMG_GetError() << std::endl;
        return false;
    }
    decoderInited_ = true;
    return true;
}

void ImageDriver::shutdown() {
    if (decoderInited_) {
        IMG_Quit();
        decoderInited_ = false;
    }
    if (videoInited_) {
        SDL_Quit();
        videoInited_ = false;
    }
}

std::optional<Image> ImageDriver::imageFromSurface(SDL_Surface* surf, const std::string &path) {
    if (!surf) return std::nullopt;

    SDL_Surface* rgba = SDL_ConvertSurfaceFormat(surf, SDL_PIXELFORMAT_RGBA32, 0);
    SDL_FreeSurface(surf);
    if (!rgba) {
        std::cerr << "SDL_ConvertSurfaceFormat failed for '" << path << "': " << SDL_GetError() << std::endl;
        return std::nullopt;
    }

    Image img;
    img.w = rgba->w;
    img.h = rgba->h;
    img.channels = 4;
    img.path = path;
    img.pixels.resize((size_t)img.w * img.h * 4);

    if (SDL_LockSurface(rgba) != 0) {
        std::cerr << "SDL_LockSurface failed for '" << path << "': " << SDL_GetError() << std::endl;
        SDL_FreeSurface(rgba);
        return std::nullopt;
    }
    // rows may be padded; copy them one by one
    const uint8_t* src = static_cast<const uint8_t*>(rgba->pixels);
    const size_t rowBytes = (size_t)img.w * 4;
    for (int y = 0; y < img.h; ++y) {
        std::memcpy(&img.pixels[(size_t)y * rowBytes], src + (size_t)y * rgba->pitch, rowBytes);
    }
    SDL_UnlockSurface(rgba);
    SDL_FreeSurface(rgba);
    return img;
}

std::optional<Image> ImageDriver::loadImage(const std::string &path) {
    if (!initDecoder()) return std::nullopt;

    SDL_Surface* surf = IMG_Load(path.c_str());
    if (!surf) {
        std::cerr << "IMG_Load failed for '" << path << "': " << IMG_GetError() << std::endl;
        return std::nullopt;
    }
    return imageFromSurface(surf, path);
}

bool ImageDriver::displaySize(ScreenSize &out) {
    if (!init()) return false;
    SDL_DisplayMode mode;
    if (SDL_GetDesktopDisplayMode(0, &mode) != 0) {
        std::cerr << "SDL_GetDesktopDisplayMode failed: " << SDL_GetError() << std::endl;
        return false;
    }
    out.width = mode.w;
    out.height = mode.h;
    return true;
}

} // namespace PMACRO
