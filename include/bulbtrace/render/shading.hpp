#pragma once

#include "bulbtrace/core/vec.hpp"
#include "bulbtrace/render/environment.hpp"

namespace bulbtrace::render {

using core::Vec3;

inline constexpr float kDisplayGamma = 2.2f;
inline constexpr float kSpecularPower = 8.0f;
inline constexpr float kMirrorStrength = 0.1f;
inline constexpr float kExposure = 3.0f;

// Shading constants for the single surface material. Defaults approximate
// gold: a warm diffuse base and a conductor specular lobe.
struct Material {
    Vec3 diffuse_color{0.8f, 0.62f, 0.38f};
    Vec3 specular_color{1.0f, 0.86f, 0.57f};
    float diffuse_weight = 0.3f;
    float specular_weight = 0.7f;
    float eta = 0.37f; // index of refraction
    float k = 2.82f;   // absorption
};

// Unpolarized conductor Fresnel reflectance: mean of the parallel and
// perpendicular terms. cos_i is clamped to [0, 1]; a vanishing denominator
// yields full reflectance for that term.
[[nodiscard]] float fresnel_conductor(float cos_i, float eta, float k) noexcept;

// Energy normalization of a Phong lobe, (power + 2) / 2.
[[nodiscard]] float phong_norm_factor(float power) noexcept;

// Radiance leaving a hit: diffuse irradiance, cosine^8 glossy lobe and a
// faint mirror term, scaled by exposure and ambient occlusion.
[[nodiscard]] Vec3 shade_hit(const Environment& env,
                             const Material& material,
                             const Vec3& ray_direction,
                             const Vec3& normal,
                             float ambient_occlusion) noexcept;

// Rays that miss show the mirror environment directly.
[[nodiscard]] Vec3 shade_miss(const Environment& env, const Vec3& ray_direction) noexcept;

[[nodiscard]] Vec3 gamma_encode(const Vec3& linear) noexcept;

} // namespace bulbtrace::render
