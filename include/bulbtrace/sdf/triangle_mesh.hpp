#pragma once

#include "bulbtrace/core/vec.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace bulbtrace::sdf {

using core::Vec3;

inline constexpr std::size_t kFloatsPerTriangle = 9;
inline constexpr std::size_t kMaxMeshTriangles = 32;

struct Triangle {
    Vec3 a{};
    Vec3 b{};
    Vec3 c{};
};

// Small triangle soup evaluated by brute force. The distance is unsigned, so
// it only suits rays that start outside the mesh.
class TriangleMesh {
public:
    TriangleMesh() = default;

    // Packed x, y, z per vertex, three vertices per triangle. Throws
    // std::invalid_argument when the size is not a multiple of nine or holds
    // more than kMaxMeshTriangles triangles.
    static TriangleMesh from_floats(std::span<const float> packed);

    [[nodiscard]] float distance(const Vec3& p) const noexcept;

    [[nodiscard]] const std::vector<Triangle>& triangles() const noexcept { return triangles_; }
    [[nodiscard]] bool empty() const noexcept { return triangles_.empty(); }

    // Radius of the origin-centered sphere enclosing every vertex.
    [[nodiscard]] float bounding_radius() const noexcept;

private:
    std::vector<Triangle> triangles_;
};

// Exact unsigned distance from p to a triangle.
[[nodiscard]] float triangle_distance(const Vec3& p, const Triangle& tri) noexcept;

// Axis-aligned box centered at the origin as 12 triangles in the packed
// layout accepted by TriangleMesh::from_floats.
[[nodiscard]] std::vector<float> make_box_mesh_floats(const Vec3& half_extents);

} // namespace bulbtrace::sdf
