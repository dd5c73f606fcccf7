#include "bulbtrace/sdf/mandelbulb.hpp"

#include <cmath>

namespace bulbtrace::sdf {

Vec3 triplex_pow_trig(const Vec3& w, float power) noexcept {
    const float r = core::length(w);
    if (r == 0.0f) {
        return {};
    }

    const float theta = std::acos(w.z / r) * power;
    const float phi = std::atan2(w.y, w.x) * power;
    const float rp = std::pow(r, power);

    const float sin_theta = std::sin(theta);
    return {
        rp * sin_theta * std::cos(phi),
        rp * sin_theta * std::sin(phi),
        rp * std::cos(theta),
    };
}

// Expand (z + i*rho)^8 for the polar angle, rho = |w.xy|, and
// (x + i*y)^8 / rho^8 for the azimuth. The imaginary part of the first keeps
// one factor of rho; the azimuth uses the unit vector (x, y) / rho.
Vec3 triplex_pow8(const Vec3& w) noexcept {
    const float x2 = w.x * w.x;
    const float y2 = w.y * w.y;
    const float z2 = w.z * w.z;
    const float z4 = z2 * z2;

    const float rho2 = x2 + y2;
    const float rho4 = rho2 * rho2;

    const float cos_part = z4 * z4 - 28.0f * z4 * z2 * rho2 + 70.0f * z4 * rho4
                         - 28.0f * z2 * rho4 * rho2 + rho4 * rho4;

    // On the Z axis the azimuth is undefined and sin(8 theta) is zero.
    if (rho2 < 1e-30f) {
        return {0.0f, 0.0f, cos_part};
    }

    const float rho = std::sqrt(rho2);
    const float inv_rho = 1.0f / rho;
    const float u = w.x * inv_rho;
    const float v = w.y * inv_rho;
    const float u2 = u * u;
    const float v2 = v * v;
    const float u4 = u2 * u2;
    const float v4 = v2 * v2;

    const float cos_8phi = u4 * u4 - 28.0f * u4 * u2 * v2 + 70.0f * u4 * v4 - 28.0f * u2 * v4 * v2 + v4 * v4;
    const float sin_8phi = 8.0f * u * v * (u4 * u2 - 7.0f * u4 * v2 + 7.0f * u2 * v4 - v4 * v2);
    const float sin_part = 8.0f * w.z * (z4 * z2 - 7.0f * z4 * rho2 + 7.0f * z2 * rho4 - rho4 * rho2) * rho;

    return {sin_part * cos_8phi, sin_part * sin_8phi, cos_part};
}

Vec3 triplex_pow(const Vec3& w, float power) noexcept {
    if (power == 8.0f) {
        return triplex_pow8(w);
    }
    return triplex_pow_trig(w, power);
}

float mandelbulb_distance(const Vec3& p, float power) noexcept {
    const Vec3 c{p.x, p.z, p.y};

    Vec3 w = c;
    float dr = 1.0f;
    float r = core::length(w);

    for (int i = 0; i < kMandelbulbMaxIterations; ++i) {
        if (r > kMandelbulbBailout) {
            break;
        }
        dr = power * std::pow(r, power - 1.0f) * dr + 1.0f;
        w = triplex_pow(w, power) + c;
        r = core::length(w);
    }

    if (r == 0.0f) {
        return 0.0f;
    }
    return 0.5f * std::log(r) * r / dr;
}

float animated_mandelbulb_power(float elapsed_seconds) noexcept {
    const float phase = elapsed_seconds / kMandelbulbPowerPeriod;
    const float tri = std::abs(2.0f * (phase - std::floor(phase)) - 1.0f);
    return kMandelbulbMinPower + (kMandelbulbMaxPower - kMandelbulbMinPower) * tri;
}

} // namespace bulbtrace::sdf
