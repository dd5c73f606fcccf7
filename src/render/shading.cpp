#include "bulbtrace/render/shading.hpp"

#include <algorithm>
#include <cmath>

namespace bulbtrace::render {

namespace {

float safe_ratio(float num, float den) noexcept {
    return den == 0.0f ? 1.0f : num / den;
}

} // namespace

float fresnel_conductor(float cos_i, float eta, float k) noexcept {
    const float c = std::clamp(cos_i, 0.0f, 1.0f);
    const float c2 = c * c;
    const float eta_k2 = eta * eta + k * k;
    const float two_eta_c = 2.0f * eta * c;

    const float parallel = safe_ratio(eta_k2 * c2 - two_eta_c + 1.0f, eta_k2 * c2 + two_eta_c + 1.0f);
    const float perpendicular = safe_ratio(eta_k2 - two_eta_c + c2, eta_k2 + two_eta_c + c2);
    return 0.5f * (parallel + perpendicular);
}

float phong_norm_factor(float power) noexcept {
    return (power + 2.0f) / 2.0f;
}

Vec3 shade_hit(const Environment& env,
               const Material& material,
               const Vec3& ray_direction,
               const Vec3& normal,
               float ambient_occlusion) noexcept {
    const Vec3 reflected = core::reflect(ray_direction, normal);
    const float fresnel = fresnel_conductor(core::dot(-ray_direction, normal), material.eta, material.k);

    const Vec3 diffuse = env.diffuse().sample(normal) * material.diffuse_color * material.diffuse_weight;
    const Vec3 glossy = env.specular8().sample(reflected) * material.specular_color *
                        (phong_norm_factor(kSpecularPower) * fresnel * material.specular_weight);
    const Vec3 mirror = env.mirror.sample(reflected) * (material.specular_weight * fresnel * kMirrorStrength);

    return (diffuse + glossy + mirror) * (kExposure * ambient_occlusion);
}

Vec3 shade_miss(const Environment& env, const Vec3& ray_direction) noexcept {
    return env.mirror.sample(ray_direction);
}

Vec3 gamma_encode(const Vec3& linear) noexcept {
    return core::pow(core::max(linear, 0.0f), 1.0f / kDisplayGamma);
}

} // namespace bulbtrace::render
