#include "bulbtrace/sdf/distance_field.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace bulbtrace::sdf {

namespace {

constexpr float kPhi = std::numbers::phi_v<float>;

std::array<Vec3, kPolytopeNormalCount> make_polytope_normals() {
    const std::array<Vec3, kPolytopeNormalCount> raw{{
        {1.0f, 0.0f, 0.0f},
        {0.0f, 1.0f, 0.0f},
        {0.0f, 0.0f, 1.0f},

        {1.0f, 1.0f, 1.0f},
        {-1.0f, 1.0f, 1.0f},
        {1.0f, -1.0f, 1.0f},
        {1.0f, 1.0f, -1.0f},

        {0.0f, 1.0f, kPhi + 1.0f},
        {0.0f, -1.0f, kPhi + 1.0f},
        {kPhi + 1.0f, 0.0f, 1.0f},
        {-kPhi - 1.0f, 0.0f, 1.0f},
        {1.0f, kPhi + 1.0f, 0.0f},
        {-1.0f, kPhi + 1.0f, 0.0f},

        {0.0f, kPhi, 1.0f},
        {0.0f, -kPhi, 1.0f},
        {1.0f, 0.0f, kPhi},
        {-1.0f, 0.0f, kPhi},
        {kPhi, 1.0f, 0.0f},
        {-kPhi, 1.0f, 0.0f},
    }};

    std::array<Vec3, kPolytopeNormalCount> out{};
    std::transform(raw.begin(), raw.end(), out.begin(), [](const Vec3& v) {
        return core::normalized(v);
    });
    return out;
}

struct NormalRange {
    std::size_t begin = 0;
    std::size_t end = 0; // inclusive
};

constexpr NormalRange range_for(Polytope kind) noexcept {
    switch (kind) {
    case Polytope::Octahedron:
        return {3, 6};
    case Polytope::Dodecahedron:
        return {13, 18};
    case Polytope::Icosahedron:
        return {3, 12};
    case Polytope::TruncatedOctahedron:
        return {0, 6};
    case Polytope::TruncatedIcosahedron:
        return {3, 18};
    }
    return {0, 2};
}

} // namespace

float sphere(const Vec3& p, float radius) noexcept {
    return core::length(p) - radius;
}

float torus(const Vec3& p, float major_radius, float minor_radius) noexcept {
    const Vec2 q{core::length(Vec2{p.x, p.z}) - major_radius, p.y};
    return core::length(q) - minor_radius;
}

float rounded_box(const Vec3& p, const Vec3& half_extents, float radius) noexcept {
    const Vec3 d = core::abs(p) - half_extents;
    const float outside = core::length(core::max(d, 0.0f));
    const float inside = std::min(core::max_component(d), 0.0f);
    return outside + inside - radius;
}

float cone(const Vec3& p, const Vec2& cos_sin, float height) noexcept {
    const float q = core::length(Vec2{p.x, p.z});
    const float side = core::dot(cos_sin, Vec2{q, p.y});
    const float cap = -p.y - height;
    return std::max(side, cap);
}

std::span<const Vec3, kPolytopeNormalCount> polytope_normal_table() noexcept {
    static const std::array<Vec3, kPolytopeNormalCount> table = make_polytope_normals();
    return table;
}

std::span<const Vec3> polytope_normals(Polytope kind) noexcept {
    const NormalRange range = range_for(kind);
    return polytope_normal_table().subspan(range.begin, range.end - range.begin + 1);
}

float polytope(const Vec3& p, std::span<const Vec3> normals, float exponent, float radius) noexcept {
    // Scale by the largest projection so |dot|^e stays representable in float.
    float largest = 0.0f;
    for (const Vec3& n : normals) {
        largest = std::max(largest, std::abs(core::dot(p, n)));
    }
    if (largest == 0.0f) {
        return -radius;
    }

    float sum = 0.0f;
    for (const Vec3& n : normals) {
        sum += std::pow(std::abs(core::dot(p, n)) / largest, exponent);
    }
    return largest * std::pow(sum, 1.0f / exponent) - radius;
}

float polytope_sharp(const Vec3& p, std::span<const Vec3> normals, float radius) noexcept {
    float d = 0.0f;
    for (const Vec3& n : normals) {
        d = std::max(d, std::abs(core::dot(p, n)));
    }
    return d - radius;
}

float smooth_min(float a, float b, float k) noexcept {
    if (!(k > 0.0f)) {
        return std::min(a, b);
    }
    const float m = std::min(a, b);
    return m - std::log1p(std::exp(-k * std::abs(a - b))) / k;
}

} // namespace bulbtrace::sdf
