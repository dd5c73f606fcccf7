#pragma once

#include "bulbtrace/render/frame_buffer.hpp"

#include <string>

namespace bulbtrace::platform {

// Writes the frame buffer as a 32-bit BMP through SDL. Throws
// std::runtime_error if the surface cannot be created or saved.
void save_screenshot_bmp(const render::FrameBuffer& frame, const std::string& path);

} // namespace bulbtrace::platform
