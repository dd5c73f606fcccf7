#include "bulbtrace/sdf/triangle_mesh.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace bulbtrace::sdf {

namespace {

inline float dot2(const Vec3& v) noexcept {
    return core::dot(v, v);
}

inline float sign(float v) noexcept {
    return v > 0.0f ? 1.0f : (v < 0.0f ? -1.0f : 0.0f);
}

inline float segment_distance2(const Vec3& edge, const Vec3& to_p) noexcept {
    const float t = std::clamp(core::dot(edge, to_p) / dot2(edge), 0.0f, 1.0f);
    return dot2(edge * t - to_p);
}

} // namespace

float triangle_distance(const Vec3& p, const Triangle& tri) noexcept {
    const Vec3 ba = tri.b - tri.a;
    const Vec3 pa = p - tri.a;
    const Vec3 cb = tri.c - tri.b;
    const Vec3 pb = p - tri.b;
    const Vec3 ac = tri.a - tri.c;
    const Vec3 pc = p - tri.c;
    const Vec3 nor = core::cross(ba, ac);

    // Outside the prism over the triangle the closest feature is an edge.
    const float inside = sign(core::dot(core::cross(ba, nor), pa))
                       + sign(core::dot(core::cross(cb, nor), pb))
                       + sign(core::dot(core::cross(ac, nor), pc));
    if (inside < 2.0f) {
        const float d2 = std::min({
            segment_distance2(ba, pa),
            segment_distance2(cb, pb),
            segment_distance2(ac, pc),
        });
        return std::sqrt(d2);
    }

    const float plane = core::dot(nor, pa);
    return std::sqrt(plane * plane / dot2(nor));
}

TriangleMesh TriangleMesh::from_floats(std::span<const float> packed) {
    if (packed.size() % kFloatsPerTriangle != 0) {
        throw std::invalid_argument("Triangle buffer size " + std::to_string(packed.size()) +
                                    " is not a multiple of " + std::to_string(kFloatsPerTriangle));
    }
    const std::size_t count = packed.size() / kFloatsPerTriangle;
    if (count > kMaxMeshTriangles) {
        throw std::invalid_argument("Triangle buffer holds " + std::to_string(count) +
                                    " triangles, limit is " + std::to_string(kMaxMeshTriangles));
    }

    TriangleMesh mesh;
    mesh.triangles_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const float* v = packed.data() + i * kFloatsPerTriangle;
        mesh.triangles_.push_back(Triangle{
            {v[0], v[1], v[2]},
            {v[3], v[4], v[5]},
            {v[6], v[7], v[8]},
        });
    }
    return mesh;
}

float TriangleMesh::distance(const Vec3& p) const noexcept {
    float d = std::numeric_limits<float>::max();
    for (const Triangle& tri : triangles_) {
        d = std::min(d, triangle_distance(p, tri));
    }
    return d;
}

float TriangleMesh::bounding_radius() const noexcept {
    float r = 0.0f;
    for (const Triangle& tri : triangles_) {
        r = std::max({r, core::length(tri.a), core::length(tri.b), core::length(tri.c)});
    }
    return r;
}

std::vector<float> make_box_mesh_floats(const Vec3& half_extents) {
    const float x = half_extents.x;
    const float y = half_extents.y;
    const float z = half_extents.z;

    const std::array<Vec3, 8> corners{{
        {-x, -y, -z}, {x, -y, -z}, {x, y, -z}, {-x, y, -z},
        {-x, -y, z},  {x, -y, z},  {x, y, z},  {-x, y, z},
    }};

    // Two triangles per face, counter-clockwise seen from outside.
    constexpr std::array<std::array<int, 3>, 12> faces{{
        {0, 2, 1}, {0, 3, 2}, // -Z
        {4, 5, 6}, {4, 6, 7}, // +Z
        {0, 1, 5}, {0, 5, 4}, // -Y
        {3, 7, 6}, {3, 6, 2}, // +Y
        {0, 4, 7}, {0, 7, 3}, // -X
        {1, 2, 6}, {1, 6, 5}, // +X
    }};

    std::vector<float> out;
    out.reserve(faces.size() * kFloatsPerTriangle);
    for (const auto& face : faces) {
        for (const int index : face) {
            const Vec3& c = corners[static_cast<std::size_t>(index)];
            out.push_back(c.x);
            out.push_back(c.y);
            out.push_back(c.z);
        }
    }
    return out;
}

} // namespace bulbtrace::sdf
