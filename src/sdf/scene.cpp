#include "bulbtrace/sdf/scene.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace bulbtrace::sdf {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

float shape_distance(const Shape& shape, const Vec3& p) noexcept {
    return std::visit(
        overloaded{
            [&](const SphereShape& s) { return sphere(p, s.radius); },
            [&](const TorusShape& s) { return torus(p, s.major_radius, s.minor_radius); },
            [&](const RoundedBoxShape& s) { return rounded_box(p, s.half_extents, s.radius); },
            [&](const ConeShape& s) {
                const Vec2 cos_sin{std::cos(s.half_angle_radians), std::sin(s.half_angle_radians)};
                return cone(p, cos_sin, s.height);
            },
            [&](const PolytopeShape& s) {
                return polytope(p, polytope_normals(s.kind), s.exponent, s.radius);
            },
        },
        shape);
}

float PrimitiveCsgScene::operator()(const Vec3& p) const noexcept {
    if (shapes.empty()) {
        return std::numeric_limits<float>::max();
    }

    float d = shape_distance(shapes.front().shape, p - shapes.front().offset);
    for (std::size_t i = 1; i < shapes.size(); ++i) {
        const PlacedShape& placed = shapes[i];
        d = smooth_min(d, shape_distance(placed.shape, p - placed.offset), blend_sharpness);
    }
    return d;
}

float MandelbulbScene::power_at(float elapsed_seconds) const noexcept {
    if (power_mode == PowerMode::Animated) {
        return animated_mandelbulb_power(elapsed_seconds);
    }
    return fixed_power;
}

std::string_view to_string(SceneKind kind) noexcept {
    switch (kind) {
    case SceneKind::PrimitiveCsg:
        return "csg";
    case SceneKind::Mandelbulb:
        return "mandelbulb";
    case SceneKind::BoxMesh:
        return "boxmesh";
    }
    return "unknown";
}

SceneKind scene_kind(const Scene& scene) noexcept {
    return std::visit(
        overloaded{
            [](const PrimitiveCsgScene&) { return SceneKind::PrimitiveCsg; },
            [](const MandelbulbScene&) { return SceneKind::Mandelbulb; },
            [](const BoxMeshScene&) { return SceneKind::BoxMesh; },
        },
        scene);
}

float bounding_radius(const Scene& scene) noexcept {
    return std::visit([](const auto& active) { return active.bounding_radius; }, scene);
}

PrimitiveCsgScene make_reference_csg_scene() {
    PrimitiveCsgScene scene;
    scene.blend_sharpness = kDefaultBlendSharpness;
    scene.bounding_radius = 1.0f;
    scene.shapes = {
        {RoundedBoxShape{{0.48f, 0.05f, 0.48f}, 0.03f}, {0.0f, -0.38f, 0.0f}},
        {SphereShape{0.22f}, {0.18f, -0.1f, 0.16f}},
        {TorusShape{0.2f, 0.055f}, {-0.24f, -0.27f, -0.2f}},
        {PolytopeShape{Polytope::Dodecahedron, 50.0f, 0.14f}, {-0.24f, -0.12f, 0.24f}},
        {PolytopeShape{Polytope::Icosahedron, 50.0f, 0.13f}, {0.28f, -0.18f, -0.24f}},
        {PolytopeShape{Polytope::TruncatedOctahedron, 50.0f, 0.1f}, {0.18f, 0.22f, 0.16f}},
        {ConeShape{0.3f, 0.32f}, {-0.24f, 0.3f, -0.2f}},
    };
    return scene;
}

PrimitiveCsgScene make_single_sphere_scene(float radius) {
    PrimitiveCsgScene scene;
    scene.shapes = {{SphereShape{radius}, {}}};
    scene.bounding_radius = 1.0f;
    return scene;
}

MandelbulbScene make_mandelbulb_scene(PowerMode mode) {
    MandelbulbScene scene;
    scene.power_mode = mode;
    return scene;
}

BoxMeshScene make_box_mesh_scene(std::span<const float> geometry) {
    BoxMeshScene scene;
    if (geometry.empty()) {
        const std::vector<float> box = make_box_mesh_floats({0.45f, 0.45f, 0.45f});
        scene.mesh = TriangleMesh::from_floats(box);
    } else {
        scene.mesh = TriangleMesh::from_floats(geometry);
    }
    scene.bounding_radius = std::max(1.0f, scene.mesh.bounding_radius() * 1.01f);
    return scene;
}

} // namespace bulbtrace::sdf
