#include "bulbtrace/render/sphere_tracer.hpp"

#include <cmath>

namespace bulbtrace::render {

std::optional<SphereInterval> intersect_bounding_sphere(const Ray& ray, float radius) noexcept {
    // |o + t d|^2 = r^2 with |d| = 1
    const float b = core::dot(ray.origin, ray.direction);
    const float c = core::dot(ray.origin, ray.origin) - radius * radius;
    const float discriminant = b * b - c;
    if (discriminant < 0.0f) {
        return std::nullopt;
    }

    const float root = std::sqrt(discriminant);
    const SphereInterval interval{-b - root, -b + root};
    if (interval.exit < 0.0f) {
        return std::nullopt;
    }
    return interval;
}

} // namespace bulbtrace::render
