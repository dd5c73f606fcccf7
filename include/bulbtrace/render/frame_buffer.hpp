#pragma once

#include "bulbtrace/core/vec.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace bulbtrace::render {

struct Pixel {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

static_assert(sizeof(Pixel) == 4, "Pixel must match SDL_PIXELFORMAT_RGBA32");

// Clamps to [0, 1] and quantizes; alpha is always opaque.
[[nodiscard]] Pixel to_pixel(const core::Vec3& color) noexcept;

// CPU-side RGBA8 render target, row 0 at the top.
class FrameBuffer {
public:
    FrameBuffer() = default;
    // Throws std::invalid_argument for non-positive dimensions.
    FrameBuffer(int width, int height);

    // Reallocates and clears to opaque black.
    void resize(int width, int height);
    void clear(Pixel value = {});

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }

    [[nodiscard]] Pixel& at(int x, int y) noexcept { return pixels_[index(x, y)]; }
    [[nodiscard]] const Pixel& at(int x, int y) const noexcept { return pixels_[index(x, y)]; }

    [[nodiscard]] std::span<Pixel> row(int y) noexcept;
    [[nodiscard]] std::span<const Pixel> row(int y) const noexcept;

    [[nodiscard]] Pixel* data() noexcept { return pixels_.data(); }
    [[nodiscard]] const Pixel* data() const noexcept { return pixels_.data(); }
    [[nodiscard]] int pitch_bytes() const noexcept { return width_ * static_cast<int>(sizeof(Pixel)); }

private:
    [[nodiscard]] std::size_t index(int x, int y) const noexcept {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
    }

    int width_ = 0;
    int height_ = 0;
    std::vector<Pixel> pixels_;
};

} // namespace bulbtrace::render
