#pragma once

#include "bulbtrace/core/vec.hpp"

#include <array>
#include <span>

namespace bulbtrace::sdf {

using core::Vec2;
using core::Vec3;

// Signed distance primitives. All of them return either the exact distance
// or an underestimate, so a sphere tracer may step by the returned value.

[[nodiscard]] float sphere(const Vec3& p, float radius) noexcept;

// Torus around the Y axis.
[[nodiscard]] float torus(const Vec3& p, float major_radius, float minor_radius) noexcept;

// Box with the given half extents, edges rounded by `radius`. The rounding
// grows the box, so pass half_extents - radius to keep the outer size.
[[nodiscard]] float rounded_box(const Vec3& p, const Vec3& half_extents, float radius) noexcept;

// Cone with its apex at the origin, opening along -Y and capped at
// y = -height. `cos_sin` holds the cosine and sine of the half angle.
[[nodiscard]] float cone(const Vec3& p, const Vec2& cos_sin, float height) noexcept;

// Generalized distance function (Akleman & Chen) face directions.
// Index ranges into this table select the polytope family.
inline constexpr std::size_t kPolytopeNormalCount = 19;
[[nodiscard]] std::span<const Vec3, kPolytopeNormalCount> polytope_normal_table() noexcept;

enum class Polytope {
    Octahedron,
    Dodecahedron,
    Icosahedron,
    TruncatedOctahedron,
    TruncatedIcosahedron,
};

[[nodiscard]] std::span<const Vec3> polytope_normals(Polytope kind) noexcept;

// (sum |dot(p, n_i)|^e)^(1/e) - r. Larger exponents give sharper edges.
[[nodiscard]] float polytope(const Vec3& p, std::span<const Vec3> normals, float exponent, float radius) noexcept;

// Sharp variant: max |dot(p, n_i)| - r.
[[nodiscard]] float polytope_sharp(const Vec3& p, std::span<const Vec3> normals, float radius) noexcept;

// Exponential smooth minimum, -ln(e^(-k a) + e^(-k b)) / k.
// Evaluated in the shifted form min(a, b) - ln(1 + e^(-k |a - b|)) / k, which
// is identical in exact arithmetic and cannot overflow for finite inputs.
// Non-positive k degrades to a hard min.
[[nodiscard]] float smooth_min(float a, float b, float k) noexcept;

} // namespace bulbtrace::sdf
