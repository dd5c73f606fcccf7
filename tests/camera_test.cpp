#include "bulbtrace/render/camera.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>

namespace bulbtrace::render {
namespace {

void expect_vec_near(const Vec3& actual, const Vec3& expected, float tolerance) {
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.z, expected.z, tolerance);
}

TEST(CameraTest, LookAtBuildsOrthonormalBasis) {
    const Mat4 m = look_at({1.0f, 2.0f, 3.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f});
    const Vec3 x = m.column(0);
    const Vec3 y = m.column(1);
    const Vec3 z = m.column(2);

    EXPECT_NEAR(core::length(x), 1.0f, 1e-6f);
    EXPECT_NEAR(core::length(y), 1.0f, 1e-6f);
    EXPECT_NEAR(core::length(z), 1.0f, 1e-6f);
    EXPECT_NEAR(core::dot(x, y), 0.0f, 1e-6f);
    EXPECT_NEAR(core::dot(y, z), 0.0f, 1e-6f);
    EXPECT_NEAR(core::dot(x, z), 0.0f, 1e-6f);
    expect_vec_near(m.column(3), {1.0f, 2.0f, 3.0f}, 0.0f);
}

TEST(CameraTest, PerspectiveCenterRayIsForward) {
    Camera camera;
    camera.transform = look_at({0.5f, 1.0f, 2.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f});
    camera.projection = Perspective{90.0f};

    const Resolution resolution{64, 64};
    const Ray ray = generate_ray(camera, {32.0f, 32.0f}, {0.0f, 0.0f}, resolution);

    expect_vec_near(ray.origin, camera.position(), 0.0f);
    expect_vec_near(ray.direction, camera.forward(), 1e-6f);
}

TEST(CameraTest, PerspectiveEdgeRayMatchesFieldOfView) {
    Camera camera;
    camera.transform = look_at({0.0f, 0.0f, 3.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f});
    camera.projection = Perspective{90.0f};

    // NDC x = +1 at pixel == width.
    const Ray ray = generate_ray(camera, {64.0f, 32.0f}, {0.0f, 0.0f}, {64, 64});
    const float expected = std::cos(std::numbers::pi_v<float> / 4.0f);
    EXPECT_NEAR(core::dot(ray.direction, camera.forward()), expected, 1e-5f);
    EXPECT_GT(ray.direction.x, 0.0f);
}

TEST(CameraTest, OffsetIsAddedToPixel) {
    Camera camera;
    camera.transform = look_at({0.0f, 0.0f, 3.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f});
    camera.projection = Perspective{60.0f};

    const Ray a = generate_ray(camera, {10.0f, 20.0f}, {0.5f, -0.25f}, {64, 48});
    const Ray b = generate_ray(camera, {10.5f, 19.75f}, {0.0f, 0.0f}, {64, 48});
    expect_vec_near(a.direction, b.direction, 1e-6f);
}

TEST(CameraTest, OrthographicRaysAreParallel) {
    Camera camera;
    camera.transform = look_at({0.0f, 0.0f, 2.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f});
    camera.projection = Orthographic{2.0f};

    const Resolution resolution{8, 4};
    const Ray corner = generate_ray(camera, {0.0f, 0.0f}, {0.0f, 0.0f}, resolution);
    const Ray center = generate_ray(camera, {4.0f, 2.0f}, {0.0f, 0.0f}, resolution);

    expect_vec_near(corner.direction, {0.0f, 0.0f, -1.0f}, 1e-6f);
    expect_vec_near(center.direction, {0.0f, 0.0f, -1.0f}, 1e-6f);
    expect_vec_near(center.origin, {0.0f, 0.0f, 2.0f}, 1e-6f);
    // Width 2 spans x in [-1, 1]; the aspect of 2 halves the height.
    expect_vec_near(corner.origin, {-1.0f, -0.5f, 2.0f}, 1e-6f);
}

TEST(CameraTest, OrbitCameraLooksAtFocus) {
    OrbitParameters orbit;
    orbit.distance = 2.5f;
    const Camera camera = make_orbit_camera(orbit, {0.0f, 0.0f, 0.0f}, Perspective{});
    expect_vec_near(camera.position(), {0.0f, 0.0f, 2.5f}, 1e-6f);
    expect_vec_near(camera.forward(), {0.0f, 0.0f, -1.0f}, 1e-6f);

    orbit.yaw_radians = 1.1f;
    orbit.pitch_radians = 0.4f;
    const Vec3 focus{0.2f, -0.1f, 0.3f};
    const Camera turned = make_orbit_camera(orbit, focus, Perspective{});
    EXPECT_NEAR(core::length(turned.position() - focus), 2.5f, 1e-5f);
    expect_vec_near(turned.forward(), core::normalized(focus - turned.position()), 1e-5f);
    EXPECT_GT(turned.position().y, focus.y);
}

TEST(CameraTest, OrbitCameraAtPoleStaysFinite) {
    OrbitParameters orbit;
    orbit.pitch_radians = std::numbers::pi_v<float> * 0.5f;
    const Camera camera = make_orbit_camera(orbit, {0.0f, 0.0f, 0.0f}, Perspective{});
    const Vec3 right = camera.transform.column(0);
    EXPECT_TRUE(std::isfinite(right.x) && std::isfinite(right.y) && std::isfinite(right.z));
    EXPECT_NEAR(core::length(right), 1.0f, 1e-5f);
    EXPECT_NEAR(camera.forward().y, -1.0f, 1e-5f);
}

} // namespace
} // namespace bulbtrace::render
