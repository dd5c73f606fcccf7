#pragma once

#include "bulbtrace/core/vec.hpp"

namespace bulbtrace::sdf {

using core::Vec3;

inline constexpr int kMandelbulbMaxIterations = 25;
inline constexpr float kMandelbulbBailout = 4.0f;

inline constexpr float kMandelbulbMinPower = 2.0f;
inline constexpr float kMandelbulbMaxPower = 11.0f;
// Seconds for a full 2 -> 11 -> 2 sweep of the animated power.
inline constexpr float kMandelbulbPowerPeriod = 40.0f;

// Raises a triplex number to `power`: r^power, theta*power, phi*power in
// spherical coordinates (theta measured from +Z, phi around Z). Power 8 is
// routed through the closed-form path.
[[nodiscard]] Vec3 triplex_pow(const Vec3& w, float power) noexcept;

// The same operator via trigonometry regardless of power.
[[nodiscard]] Vec3 triplex_pow_trig(const Vec3& w, float power) noexcept;

// Closed-form polynomial for power 8; one square root and no trig calls.
[[nodiscard]] Vec3 triplex_pow8(const Vec3& w) noexcept;

// Escape-time distance estimate. The input is swizzled (x, z, y) so the pole
// of the bulb points along +Y. Returns 0 at the fixed point w == 0.
[[nodiscard]] float mandelbulb_distance(const Vec3& p, float power) noexcept;

// Triangle wave over [kMandelbulbMinPower, kMandelbulbMaxPower], starting at
// the maximum for t = 0.
[[nodiscard]] float animated_mandelbulb_power(float elapsed_seconds) noexcept;

} // namespace bulbtrace::sdf
