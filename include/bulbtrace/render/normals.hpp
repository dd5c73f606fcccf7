#pragma once

#include "bulbtrace/core/vec.hpp"

namespace bulbtrace::render {

using core::Vec3;

inline constexpr float kNormalEpsilon = 1e-5f;
// Distance stepped back along the incoming ray before estimating the normal.
inline constexpr float kNormalBackoff = 1e-3f;

enum class NormalMethod {
    BackwardDifference, // 3 extra evaluations
    CentralDifference,  // 6 extra evaluations
};

template <typename Field>
[[nodiscard]] Vec3 backward_difference_normal(const Field& field, const Vec3& p, float eps = kNormalEpsilon) {
    const float center = field(p);
    return core::normalized({
        center - field(Vec3{p.x - eps, p.y, p.z}),
        center - field(Vec3{p.x, p.y - eps, p.z}),
        center - field(Vec3{p.x, p.y, p.z - eps}),
    });
}

template <typename Field>
[[nodiscard]] Vec3 central_difference_normal(const Field& field, const Vec3& p, float eps = kNormalEpsilon) {
    return core::normalized({
        field(Vec3{p.x + eps, p.y, p.z}) - field(Vec3{p.x - eps, p.y, p.z}),
        field(Vec3{p.x, p.y + eps, p.z}) - field(Vec3{p.x, p.y - eps, p.z}),
        field(Vec3{p.x, p.y, p.z + eps}) - field(Vec3{p.x, p.y, p.z - eps}),
    });
}

// Normal at a sphere-traced hit. The backward difference is taken slightly in
// front of the surface, which keeps thin features from flipping the result.
template <typename Field>
[[nodiscard]] Vec3 estimate_normal(const Field& field,
                                   const Vec3& hit_position,
                                   const Vec3& ray_direction,
                                   NormalMethod method) {
    switch (method) {
    case NormalMethod::CentralDifference:
        return central_difference_normal(field, hit_position);
    case NormalMethod::BackwardDifference:
        break;
    }
    return backward_difference_normal(field, hit_position - ray_direction * kNormalBackoff);
}

} // namespace bulbtrace::render
