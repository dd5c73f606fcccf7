#include "bulbtrace/render/environment.hpp"

#include "bulbtrace/core/task/task_pool.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace bulbtrace::render {

namespace {

struct FaceCoord {
    CubeFace face = CubeFace::PositiveX;
    float s = 0.0f; // [0, 1]
    float t = 0.0f; // [0, 1]
};

FaceCoord direction_to_face(const Vec3& d) noexcept {
    const Vec3 a = core::abs(d);
    float sc = 0.0f;
    float tc = 0.0f;
    float ma = 1.0f;
    CubeFace face = CubeFace::PositiveX;

    if (a.x >= a.y && a.x >= a.z) {
        ma = a.x;
        if (d.x >= 0.0f) {
            face = CubeFace::PositiveX;
            sc = -d.z;
            tc = -d.y;
        } else {
            face = CubeFace::NegativeX;
            sc = d.z;
            tc = -d.y;
        }
    } else if (a.y >= a.z) {
        ma = a.y;
        if (d.y >= 0.0f) {
            face = CubeFace::PositiveY;
            sc = d.x;
            tc = d.z;
        } else {
            face = CubeFace::NegativeY;
            sc = d.x;
            tc = -d.z;
        }
    } else {
        ma = a.z;
        if (d.z >= 0.0f) {
            face = CubeFace::PositiveZ;
            sc = d.x;
            tc = -d.y;
        } else {
            face = CubeFace::NegativeZ;
            sc = -d.x;
            tc = -d.y;
        }
    }

    if (ma <= 0.0f) {
        return {CubeFace::PositiveX, 0.5f, 0.5f};
    }
    return {face, 0.5f * (sc / ma + 1.0f), 0.5f * (tc / ma + 1.0f)};
}

// Inverse of direction_to_face for u = 2s - 1, v = 2t - 1.
Vec3 face_to_direction(CubeFace face, float u, float v) noexcept {
    switch (face) {
    case CubeFace::PositiveX:
        return {1.0f, -v, -u};
    case CubeFace::NegativeX:
        return {-1.0f, -v, u};
    case CubeFace::PositiveY:
        return {u, 1.0f, v};
    case CubeFace::NegativeY:
        return {u, -1.0f, -v};
    case CubeFace::PositiveZ:
        return {u, -v, 1.0f};
    case CubeFace::NegativeZ:
        return {-u, -v, -1.0f};
    }
    return {0.0f, 0.0f, 1.0f};
}

float area_element(float x, float y) noexcept {
    return std::atan2(x * y, std::sqrt(x * x + y * y + 1.0f));
}

template <typename Fn>
void for_each_texel_row(CubeMap& map, Fn&& fn) {
    const int size = map.face_size();
    const std::size_t rows = static_cast<std::size_t>(kCubeFaceCount) * static_cast<std::size_t>(size);
    core::parallel_for(rows, [&](std::size_t row) {
        const auto face = static_cast<CubeFace>(static_cast<int>(row) / size);
        const int y = static_cast<int>(row) % size;
        for (int x = 0; x < size; ++x) {
            fn(face, x, y);
        }
    });
}

} // namespace

CubeMap::CubeMap(int face_size)
    : face_size_(face_size) {
    if (face_size <= 0) {
        throw std::invalid_argument("Cube map face size must be positive, got " + std::to_string(face_size));
    }
    texels_.assign(static_cast<std::size_t>(kCubeFaceCount) * face_size * face_size, Vec3{});
}

std::size_t CubeMap::index(CubeFace face, int x, int y) const noexcept {
    const auto size = static_cast<std::size_t>(face_size_);
    return static_cast<std::size_t>(face) * size * size + static_cast<std::size_t>(y) * size +
           static_cast<std::size_t>(x);
}

Vec3& CubeMap::texel(CubeFace face, int x, int y) noexcept {
    return texels_[index(face, x, y)];
}

const Vec3& CubeMap::texel(CubeFace face, int x, int y) const noexcept {
    return texels_[index(face, x, y)];
}

Vec3 CubeMap::sample(const Vec3& direction) const noexcept {
    if (face_size_ == 0) {
        return {};
    }

    const FaceCoord fc = direction_to_face(direction);
    const float px = fc.s * static_cast<float>(face_size_) - 0.5f;
    const float py = fc.t * static_cast<float>(face_size_) - 0.5f;
    const float fx = std::clamp(px - std::floor(px), 0.0f, 1.0f);
    const float fy = std::clamp(py - std::floor(py), 0.0f, 1.0f);

    const int max_index = face_size_ - 1;
    const int x0 = std::clamp(static_cast<int>(std::floor(px)), 0, max_index);
    const int y0 = std::clamp(static_cast<int>(std::floor(py)), 0, max_index);
    const int x1 = std::clamp(static_cast<int>(std::floor(px)) + 1, 0, max_index);
    const int y1 = std::clamp(static_cast<int>(std::floor(py)) + 1, 0, max_index);

    const Vec3 top = core::lerp(texel(fc.face, x0, y0), texel(fc.face, x1, y0), fx);
    const Vec3 bottom = core::lerp(texel(fc.face, x0, y1), texel(fc.face, x1, y1), fx);
    return core::lerp(top, bottom, fy);
}

Vec3 CubeMap::texel_direction(CubeFace face, int x, int y) const noexcept {
    const float inv = 1.0f / static_cast<float>(face_size_);
    const float u = 2.0f * (static_cast<float>(x) + 0.5f) * inv - 1.0f;
    const float v = 2.0f * (static_cast<float>(y) + 0.5f) * inv - 1.0f;
    return core::normalized(face_to_direction(face, u, v));
}

float CubeMap::texel_solid_angle(int x, int y) const noexcept {
    const float inv = 2.0f / static_cast<float>(face_size_);
    const float x0 = static_cast<float>(x) * inv - 1.0f;
    const float y0 = static_cast<float>(y) * inv - 1.0f;
    const float x1 = x0 + inv;
    const float y1 = y0 + inv;
    return area_element(x0, y0) - area_element(x0, y1) - area_element(x1, y0) + area_element(x1, y1);
}

Vec3 sky_radiance(const EnvironmentSettings& settings, const Vec3& direction) noexcept {
    const Vec3 d = core::normalized(direction);

    Vec3 color;
    if (d.y >= 0.0f) {
        color = core::lerp(settings.horizon_color, settings.zenith_color, std::sqrt(d.y));
    } else {
        // Short fade so the horizon line is not a hard seam in the filtered maps.
        const float fade = std::clamp(-d.y * 8.0f, 0.0f, 1.0f);
        color = core::lerp(settings.horizon_color, settings.ground_color, fade);
    }

    const Vec3 sun = core::normalized(settings.sun_direction);
    if (core::dot(d, sun) > std::cos(settings.sun_angular_radius)) {
        color += settings.sun_color;
    }
    return color;
}

CubeMap make_sky_cube_map(const EnvironmentSettings& settings, int face_size) {
    CubeMap map(face_size);
    for_each_texel_row(map, [&](CubeFace face, int x, int y) {
        map.texel(face, x, y) = sky_radiance(settings, map.texel_direction(face, x, y));
    });
    return map;
}

CubeMap prefilter_cosine_power(const CubeMap& source, float power, int face_size) {
    if (source.empty()) {
        throw std::invalid_argument("Cannot prefilter an empty cube map");
    }

    struct SourceTexel {
        Vec3 direction;
        Vec3 radiance;
        float solid_angle = 0.0f;
    };

    const int src_size = source.face_size();
    std::vector<SourceTexel> texels;
    texels.reserve(static_cast<std::size_t>(kCubeFaceCount) * src_size * src_size);
    for (int f = 0; f < kCubeFaceCount; ++f) {
        const auto face = static_cast<CubeFace>(f);
        for (int y = 0; y < src_size; ++y) {
            for (int x = 0; x < src_size; ++x) {
                texels.push_back({
                    source.texel_direction(face, x, y),
                    source.texel(face, x, y),
                    source.texel_solid_angle(x, y),
                });
            }
        }
    }

    CubeMap out(face_size);
    for_each_texel_row(out, [&](CubeFace face, int x, int y) {
        const Vec3 n = out.texel_direction(face, x, y);
        Vec3 sum{};
        float weight_sum = 0.0f;
        for (const SourceTexel& t : texels) {
            const float cos_theta = core::dot(n, t.direction);
            if (cos_theta <= 0.0f) {
                continue;
            }
            const float w = std::pow(cos_theta, power) * t.solid_angle;
            sum += t.radiance * w;
            weight_sum += w;
        }
        out.texel(face, x, y) = weight_sum > 0.0f ? sum * (1.0f / weight_sum) : Vec3{};
    });
    return out;
}

Environment build_environment(const EnvironmentSettings& settings) {
    using clock = std::chrono::steady_clock;
    const auto log_ms = [](const std::string& label, auto start) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start).count();
        std::cout << "[env] " << label << " took " << ms << " ms\n";
    };

    Environment env;

    auto start = clock::now();
    env.mirror = make_sky_cube_map(settings, settings.mirror_face_size);
    const CubeMap source = make_sky_cube_map(settings, settings.source_face_size);
    log_ms("sky generation", start);

    for (std::size_t i = 0; i < kFilteredPowers.size(); ++i) {
        start = clock::now();
        env.filtered[i] = prefilter_cosine_power(source, kFilteredPowers[i], settings.filtered_face_size);
        log_ms("cosine^" + std::to_string(static_cast<int>(kFilteredPowers[i])) + " prefilter", start);
    }
    return env;
}

} // namespace bulbtrace::render
