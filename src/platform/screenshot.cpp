#include "bulbtrace/platform/screenshot.hpp"

#include <SDL3/SDL.h>

#include <iostream>
#include <stdexcept>
#include <vector>

namespace bulbtrace::platform {

void save_screenshot_bmp(const render::FrameBuffer& frame, const std::string& path) {
    if (frame.empty()) {
        throw std::runtime_error("Cannot save an empty frame to " + path);
    }

    // SDL wants mutable pixels; keep the caller's frame untouched.
    std::vector<render::Pixel> pixels(frame.data(),
                                      frame.data() + static_cast<std::size_t>(frame.width()) *
                                                         static_cast<std::size_t>(frame.height()));
    for (render::Pixel& p : pixels) {
        p.a = 255;
    }

    SDL_Surface* surface = SDL_CreateSurfaceFrom(frame.width(),
                                                 frame.height(),
                                                 SDL_PIXELFORMAT_RGBA32,
                                                 pixels.data(),
                                                 frame.pitch_bytes());
    if (!surface) {
        throw std::runtime_error(std::string("SDL_CreateSurfaceFrom: ") + SDL_GetError());
    }

    const bool saved = SDL_SaveBMP(surface, path.c_str());
    SDL_DestroySurface(surface);
    if (!saved) {
        throw std::runtime_error("SDL_SaveBMP(" + path + "): " + SDL_GetError());
    }

    std::cout << "[screenshot] wrote " << frame.width() << "x" << frame.height() << " to " << path << "\n";
}

} // namespace bulbtrace::platform
