#pragma once

#include "bulbtrace/core/vec.hpp"
#include "bulbtrace/render/camera.hpp"

#include <algorithm>
#include <optional>

namespace bulbtrace::render {

inline constexpr int kMaxMarchSteps = 128;
inline constexpr float kHitEpsilon = 0.001f;

struct TraceSettings {
    float bounding_radius = 1.0f;
    int max_steps = kMaxMarchSteps;
    float hit_epsilon = kHitEpsilon;
};

// Ray parameters where the ray enters and leaves the bounding sphere.
struct SphereInterval {
    float entry = 0.0f;
    float exit = 0.0f;
};

// Analytic intersection with the origin-centered sphere. Empty when the ray
// misses it or the sphere lies entirely behind the origin.
[[nodiscard]] std::optional<SphereInterval> intersect_bounding_sphere(const Ray& ray, float radius) noexcept;

struct MarchResult {
    bool hit = false;
    float t = 0.0f;
    int steps = 0;
    Vec3 position{};
    // 1 - steps / max_steps; a cheap occlusion proxy for the hit.
    float step_gradient = 0.0f;
};

// Sphere tracing against `field`, any callable float(const Vec3&) returning
// a distance that does not overestimate. Each iteration evaluates the field,
// advances by the result, then reports Miss once past the sphere exit or Hit
// once the evaluated distance drops below the epsilon. Running out of steps is
// a Miss.
template <typename Field>
[[nodiscard]] MarchResult march_ray(const Ray& ray, const Field& field, const TraceSettings& settings) {
    const std::optional<SphereInterval> bounds = intersect_bounding_sphere(ray, settings.bounding_radius);
    if (!bounds) {
        return {};
    }

    float t = std::max(bounds->entry, 0.0f);
    for (int step = 0; step < settings.max_steps; ++step) {
        const float d = field(ray.origin + ray.direction * t);
        t += d;
        if (t > bounds->exit) {
            return {};
        }
        if (d < settings.hit_epsilon) {
            MarchResult result;
            result.hit = true;
            result.t = t;
            result.steps = step;
            result.position = ray.origin + ray.direction * t;
            result.step_gradient =
                1.0f - static_cast<float>(step) / static_cast<float>(settings.max_steps);
            return result;
        }
    }
    return {};
}

} // namespace bulbtrace::render
