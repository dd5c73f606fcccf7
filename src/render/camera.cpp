#include "bulbtrace/render/camera.hpp"

#include <cmath>
#include <numbers>

namespace bulbtrace::render {

namespace {

constexpr float kDegreesToRadians = std::numbers::pi_v<float> / 180.0f;

Vec3 orbit_offset(float distance, float yaw, float pitch) {
    const float cos_pitch = std::cos(pitch);
    return {
        distance * cos_pitch * std::sin(yaw),
        distance * std::sin(pitch),
        distance * cos_pitch * std::cos(yaw),
    };
}

} // namespace

Mat4 look_at(const Vec3& eye, const Vec3& focus, const Vec3& up) noexcept {
    const Vec3 z = core::normalized(eye - focus);
    const Vec3 x = core::normalized(core::cross(up, z));
    const Vec3 y = core::cross(z, x);
    return Mat4::from_basis(x, y, z, eye);
}

Ray generate_ray(const Camera& camera,
                 const Vec2& pixel,
                 const Vec2& sample_offset,
                 const Resolution& resolution) noexcept {
    const Vec2 ndc{
        (pixel.x + sample_offset.x) / static_cast<float>(resolution.width) * 2.0f - 1.0f,
        (pixel.y + sample_offset.y) / static_cast<float>(resolution.height) * 2.0f - 1.0f,
    };
    const float aspect = resolution.aspect();

    if (const auto* ortho = std::get_if<Orthographic>(&camera.projection)) {
        const float half_w = ortho->width * 0.5f;
        const float half_h = (ortho->width / aspect) * 0.5f;
        const core::Vec4 local{ndc.x * half_w, ndc.y * half_h, 0.0f, 1.0f};
        const core::Vec4 world = camera.transform * local;
        return {
            {world.x, world.y, world.z},
            core::normalized(camera.transform.rotate({0.0f, 0.0f, -1.0f})),
        };
    }

    const auto& persp = std::get<Perspective>(camera.projection);
    const float fov_scale = std::tan(persp.hfov_degrees * kDegreesToRadians * 0.5f);
    const Vec3 local{ndc.x * fov_scale, ndc.y * fov_scale / aspect, -1.0f};
    return {
        camera.position(),
        core::normalized(camera.transform.rotate(local)),
    };
}

Camera make_orbit_camera(const OrbitParameters& orbit,
                         const Vec3& focus,
                         const Projection& projection) {
    const Vec3 eye = focus + orbit_offset(orbit.distance, orbit.yaw_radians, orbit.pitch_radians);

    // Near the poles the view axis approaches +Y; fall back to the yaw
    // direction as the reference up.
    Vec3 up{0.0f, 1.0f, 0.0f};
    if (std::abs(std::cos(orbit.pitch_radians)) < 0.01f) {
        up = {-std::sin(orbit.yaw_radians), 0.0f, -std::cos(orbit.yaw_radians)};
    }

    Camera camera;
    camera.transform = look_at(eye, focus, up);
    camera.projection = projection;
    return camera;
}

} // namespace bulbtrace::render
