#pragma once

#include "bulbtrace/core/vec.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace bulbtrace::render {

using core::Vec3;

enum class CubeFace : int {
    PositiveX = 0,
    NegativeX,
    PositiveY,
    NegativeY,
    PositiveZ,
    NegativeZ,
};

inline constexpr int kCubeFaceCount = 6;

// Six square faces of linear RGB, GL cube-map orientation.
class CubeMap {
public:
    CubeMap() = default;
    explicit CubeMap(int face_size);

    [[nodiscard]] int face_size() const noexcept { return face_size_; }
    [[nodiscard]] bool empty() const noexcept { return face_size_ == 0; }

    [[nodiscard]] Vec3& texel(CubeFace face, int x, int y) noexcept;
    [[nodiscard]] const Vec3& texel(CubeFace face, int x, int y) const noexcept;

    // Bilinear lookup within the face hit by `direction`; edges clamp.
    [[nodiscard]] Vec3 sample(const Vec3& direction) const noexcept;

    // Unit direction through the center of texel (x, y) on `face`.
    [[nodiscard]] Vec3 texel_direction(CubeFace face, int x, int y) const noexcept;

    // Solid angle subtended by texel (x, y).
    [[nodiscard]] float texel_solid_angle(int x, int y) const noexcept;

private:
    [[nodiscard]] std::size_t index(CubeFace face, int x, int y) const noexcept;

    int face_size_ = 0;
    std::vector<Vec3> texels_;
};

struct EnvironmentSettings {
    int mirror_face_size = 64;
    int source_face_size = 32; // resolution fed to the convolution
    int filtered_face_size = 16;

    Vec3 zenith_color{0.18f, 0.32f, 0.62f};
    Vec3 horizon_color{0.85f, 0.82f, 0.75f};
    Vec3 ground_color{0.22f, 0.19f, 0.16f};
    Vec3 sun_direction{0.45f, 0.65f, 0.35f};
    Vec3 sun_color{18.0f, 16.0f, 13.0f};
    float sun_angular_radius = 0.05f;
};

// Procedural sky: zenith/horizon gradient above, flat ground below, and a
// bright sun disk.
[[nodiscard]] Vec3 sky_radiance(const EnvironmentSettings& settings, const Vec3& direction) noexcept;
[[nodiscard]] CubeMap make_sky_cube_map(const EnvironmentSettings& settings, int face_size);

// Normalized convolution of `source` with a max(0, dot)^power lobe, texels
// weighted by solid angle. Runs on the global task pool.
[[nodiscard]] CubeMap prefilter_cosine_power(const CubeMap& source, float power, int face_size);

inline constexpr std::array<float, 4> kFilteredPowers{1.0f, 8.0f, 64.0f, 512.0f};

// One mirror-reflection map and four cosine-power-filtered maps. Read-only
// once built; shared by every pixel of a frame.
struct Environment {
    CubeMap mirror;
    std::array<CubeMap, kFilteredPowers.size()> filtered;

    [[nodiscard]] const CubeMap& diffuse() const noexcept { return filtered[0]; }
    [[nodiscard]] const CubeMap& specular8() const noexcept { return filtered[1]; }
};

[[nodiscard]] Environment build_environment(const EnvironmentSettings& settings);

} // namespace bulbtrace::render
