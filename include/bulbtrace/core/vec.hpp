#pragma once

#include <algorithm>
#include <cmath>

namespace bulbtrace::core {

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct Vec4 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 0.0f;
};

inline constexpr Vec3 operator+(const Vec3& a, const Vec3& b) noexcept {
    return {a.x + b.x, a.y + b.y, a.z + b.z};
}

inline constexpr Vec3 operator-(const Vec3& a, const Vec3& b) noexcept {
    return {a.x - b.x, a.y - b.y, a.z - b.z};
}

inline constexpr Vec3 operator-(const Vec3& v) noexcept {
    return {-v.x, -v.y, -v.z};
}

inline constexpr Vec3 operator*(const Vec3& v, float s) noexcept {
    return {v.x * s, v.y * s, v.z * s};
}

inline constexpr Vec3 operator*(float s, const Vec3& v) noexcept {
    return {v.x * s, v.y * s, v.z * s};
}

// Component-wise product, used for colors.
inline constexpr Vec3 operator*(const Vec3& a, const Vec3& b) noexcept {
    return {a.x * b.x, a.y * b.y, a.z * b.z};
}

inline constexpr Vec3& operator+=(Vec3& a, const Vec3& b) noexcept {
    a.x += b.x;
    a.y += b.y;
    a.z += b.z;
    return a;
}

inline constexpr float dot(const Vec3& a, const Vec3& b) noexcept {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline constexpr float dot(const Vec2& a, const Vec2& b) noexcept {
    return a.x * b.x + a.y * b.y;
}

inline constexpr Vec3 cross(const Vec3& a, const Vec3& b) noexcept {
    return {
        a.y * b.z - a.z * b.y,
        a.z * b.x - a.x * b.z,
        a.x * b.y - a.y * b.x,
    };
}

inline float length(const Vec3& v) noexcept {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

inline float length(const Vec2& v) noexcept {
    return std::sqrt(v.x * v.x + v.y * v.y);
}

// Returns +Y for degenerate input so callers always get a unit vector.
inline Vec3 normalized(const Vec3& v) noexcept {
    const float len = length(v);
    if (len < 1e-20f) {
        return {0.0f, 1.0f, 0.0f};
    }
    const float inv = 1.0f / len;
    return {v.x * inv, v.y * inv, v.z * inv};
}

inline Vec3 abs(const Vec3& v) noexcept {
    return {std::abs(v.x), std::abs(v.y), std::abs(v.z)};
}

inline Vec3 max(const Vec3& v, float s) noexcept {
    return {std::max(v.x, s), std::max(v.y, s), std::max(v.z, s)};
}

inline float max_component(const Vec3& v) noexcept {
    return std::max(v.x, std::max(v.y, v.z));
}

// Mirror `incident` about the plane with unit normal `n`.
inline constexpr Vec3 reflect(const Vec3& incident, const Vec3& n) noexcept {
    return incident - n * (2.0f * dot(n, incident));
}

inline Vec3 clamp01(const Vec3& v) noexcept {
    return {std::clamp(v.x, 0.0f, 1.0f), std::clamp(v.y, 0.0f, 1.0f), std::clamp(v.z, 0.0f, 1.0f)};
}

inline Vec3 pow(const Vec3& v, float e) noexcept {
    return {std::pow(v.x, e), std::pow(v.y, e), std::pow(v.z, e)};
}

inline constexpr Vec3 lerp(const Vec3& a, const Vec3& b, float t) noexcept {
    return a + (b - a) * t;
}

inline constexpr float luminance(const Vec3& c) noexcept {
    return 0.2126f * c.x + 0.7152f * c.y + 0.0722f * c.z;
}

// Column-major 4x4 matrix (m[column][row]), matching the usual GL layout.
struct Mat4 {
    float m[4][4] = {
        {1.0f, 0.0f, 0.0f, 0.0f},
        {0.0f, 1.0f, 0.0f, 0.0f},
        {0.0f, 0.0f, 1.0f, 0.0f},
        {0.0f, 0.0f, 0.0f, 1.0f},
    };

    [[nodiscard]] static Mat4 from_basis(const Vec3& x_axis,
                                         const Vec3& y_axis,
                                         const Vec3& z_axis,
                                         const Vec3& translation) noexcept {
        Mat4 r;
        r.m[0][0] = x_axis.x; r.m[0][1] = x_axis.y; r.m[0][2] = x_axis.z; r.m[0][3] = 0.0f;
        r.m[1][0] = y_axis.x; r.m[1][1] = y_axis.y; r.m[1][2] = y_axis.z; r.m[1][3] = 0.0f;
        r.m[2][0] = z_axis.x; r.m[2][1] = z_axis.y; r.m[2][2] = z_axis.z; r.m[2][3] = 0.0f;
        r.m[3][0] = translation.x; r.m[3][1] = translation.y; r.m[3][2] = translation.z; r.m[3][3] = 1.0f;
        return r;
    }

    [[nodiscard]] Vec4 operator*(const Vec4& v) const noexcept {
        return {
            m[0][0] * v.x + m[1][0] * v.y + m[2][0] * v.z + m[3][0] * v.w,
            m[0][1] * v.x + m[1][1] * v.y + m[2][1] * v.z + m[3][1] * v.w,
            m[0][2] * v.x + m[1][2] * v.y + m[2][2] * v.z + m[3][2] * v.w,
            m[0][3] * v.x + m[1][3] * v.y + m[2][3] * v.z + m[3][3] * v.w,
        };
    }

    // Upper 3x3 applied to a direction (no translation).
    [[nodiscard]] Vec3 rotate(const Vec3& v) const noexcept {
        return {
            m[0][0] * v.x + m[1][0] * v.y + m[2][0] * v.z,
            m[0][1] * v.x + m[1][1] * v.y + m[2][1] * v.z,
            m[0][2] * v.x + m[1][2] * v.y + m[2][2] * v.z,
        };
    }

    [[nodiscard]] Vec3 column(int i) const noexcept {
        return {m[i][0], m[i][1], m[i][2]};
    }
};

} // namespace bulbtrace::core
