#include "bulbtrace/render/frame_buffer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace bulbtrace::render {

namespace {

std::uint8_t quantize(float v) noexcept {
    return static_cast<std::uint8_t>(std::clamp(v, 0.0f, 1.0f) * 255.0f + 0.5f);
}

} // namespace

Pixel to_pixel(const core::Vec3& color) noexcept {
    return {quantize(color.x), quantize(color.y), quantize(color.z), 255};
}

FrameBuffer::FrameBuffer(int width, int height) {
    resize(width, height);
}

void FrameBuffer::resize(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Frame buffer dimensions must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    width_ = width;
    height_ = height;
    pixels_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), Pixel{});
}

void FrameBuffer::clear(Pixel value) {
    std::fill(pixels_.begin(), pixels_.end(), value);
}

std::span<Pixel> FrameBuffer::row(int y) noexcept {
    return {pixels_.data() + index(0, y), static_cast<std::size_t>(width_)};
}

std::span<const Pixel> FrameBuffer::row(int y) const noexcept {
    return {pixels_.data() + index(0, y), static_cast<std::size_t>(width_)};
}

} // namespace bulbtrace::render
