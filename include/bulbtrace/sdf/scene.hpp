#pragma once

#include "bulbtrace/core/vec.hpp"
#include "bulbtrace/sdf/distance_field.hpp"
#include "bulbtrace/sdf/mandelbulb.hpp"
#include "bulbtrace/sdf/triangle_mesh.hpp"

#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace bulbtrace::sdf {

using core::Vec3;

inline constexpr float kDefaultBlendSharpness = 64.0f;

struct SphereShape {
    float radius = 0.5f;
};

struct TorusShape {
    float major_radius = 0.3f;
    float minor_radius = 0.1f;
};

struct RoundedBoxShape {
    Vec3 half_extents{0.25f, 0.25f, 0.25f};
    float radius = 0.02f;
};

struct ConeShape {
    float half_angle_radians = 0.35f;
    float height = 0.3f;
};

struct PolytopeShape {
    Polytope kind = Polytope::Dodecahedron;
    float exponent = 50.0f;
    float radius = 0.15f;
};

using Shape = std::variant<SphereShape, TorusShape, RoundedBoxShape, ConeShape, PolytopeShape>;

struct PlacedShape {
    Shape shape;
    Vec3 offset{};
};

[[nodiscard]] float shape_distance(const Shape& shape, const Vec3& p) noexcept;

// Primitives folded together with smooth_min. The list is fixed once the
// scene is built.
struct PrimitiveCsgScene {
    std::vector<PlacedShape> shapes;
    float blend_sharpness = kDefaultBlendSharpness;
    float bounding_radius = 1.0f;

    [[nodiscard]] float operator()(const Vec3& p) const noexcept;
};

enum class PowerMode {
    Fixed,
    Animated,
};

struct MandelbulbScene {
    PowerMode power_mode = PowerMode::Fixed;
    float fixed_power = 8.0f;
    float bounding_radius = 1.25f;

    [[nodiscard]] float power_at(float elapsed_seconds) const noexcept;
};

// A Mandelbulb with its power resolved for one frame.
struct MandelbulbField {
    float power = 8.0f;

    [[nodiscard]] float operator()(const Vec3& p) const noexcept {
        return mandelbulb_distance(p, power);
    }
};

struct BoxMeshScene {
    TriangleMesh mesh;
    float bounding_radius = 1.0f;

    [[nodiscard]] float operator()(const Vec3& p) const noexcept {
        return mesh.distance(p);
    }
};

using Scene = std::variant<PrimitiveCsgScene, MandelbulbScene, BoxMeshScene>;

enum class SceneKind {
    PrimitiveCsg,
    Mandelbulb,
    BoxMesh,
};

[[nodiscard]] std::string_view to_string(SceneKind kind) noexcept;
[[nodiscard]] SceneKind scene_kind(const Scene& scene) noexcept;
[[nodiscard]] float bounding_radius(const Scene& scene) noexcept;

// The demo composition: a rounded plate carrying a sphere, a torus, two
// polytopes and a cone, blended with k = 64.
[[nodiscard]] PrimitiveCsgScene make_reference_csg_scene();

[[nodiscard]] PrimitiveCsgScene make_single_sphere_scene(float radius);

[[nodiscard]] MandelbulbScene make_mandelbulb_scene(PowerMode mode);

// Builds the mesh scene from packed triangle floats (see TriangleMesh). An
// empty span selects the default box.
[[nodiscard]] BoxMeshScene make_box_mesh_scene(std::span<const float> geometry = {});

// Calls fn with the concrete field for the active variant, with any
// time-dependent parameters resolved. Each alternative is a callable
// float(const Vec3&), so the per-pixel code is instantiated once per variant.
template <typename Fn>
decltype(auto) visit_field(const Scene& scene, float elapsed_seconds, Fn&& fn) {
    return std::visit(
        [&](const auto& active) -> decltype(auto) {
            using T = std::decay_t<decltype(active)>;
            if constexpr (std::is_same_v<T, MandelbulbScene>) {
                return fn(MandelbulbField{active.power_at(elapsed_seconds)});
            } else {
                return fn(active);
            }
        },
        scene);
}

} // namespace bulbtrace::sdf
