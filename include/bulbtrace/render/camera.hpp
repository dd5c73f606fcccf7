#pragma once

#include "bulbtrace/core/vec.hpp"

#include <variant>

namespace bulbtrace::render {

using core::Mat4;
using core::Vec2;
using core::Vec3;

struct Ray {
    Vec3 origin{};
    Vec3 direction{0.0f, 0.0f, -1.0f}; // unit length
};

struct Orthographic {
    float width = 2.0f; // world units across the frame
};

struct Perspective {
    float hfov_degrees = 60.0f;
};

using Projection = std::variant<Orthographic, Perspective>;

// The camera looks down its local -Z axis. `transform` holds an orthonormal
// basis in its upper 3x3 and the eye position in its last column.
struct Camera {
    Mat4 transform{};
    Projection projection = Perspective{};

    [[nodiscard]] Vec3 position() const noexcept { return transform.column(3); }
    [[nodiscard]] Vec3 forward() const noexcept { return -transform.column(2); }
};

// Camera-to-world transform looking from eye at focus. Undefined when `up` is
// parallel to the view direction; the caller must avoid that.
[[nodiscard]] Mat4 look_at(const Vec3& eye, const Vec3& focus, const Vec3& up) noexcept;

struct Resolution {
    int width = 1;
    int height = 1;

    [[nodiscard]] float aspect() const noexcept {
        return static_cast<float>(width) / static_cast<float>(height);
    }
};

// NDC = ((pixel + sample_offset) / resolution) * 2 - 1, +Y up. The offset is
// a sub-pixel jitter in [-0.5, 0.5]^2.
[[nodiscard]] Ray generate_ray(const Camera& camera,
                               const Vec2& pixel,
                               const Vec2& sample_offset,
                               const Resolution& resolution) noexcept;

struct OrbitParameters {
    float distance = 2.5f;
    float yaw_radians = 0.0f;   // around +Y, 0 looks down -Z
    float pitch_radians = 0.0f; // [-pi/2, pi/2], positive looks down
};

// Eye on a sphere around `focus`, up vector kept away from the view axis
// near the poles.
[[nodiscard]] Camera make_orbit_camera(const OrbitParameters& orbit,
                                       const Vec3& focus,
                                       const Projection& projection);

} // namespace bulbtrace::render
