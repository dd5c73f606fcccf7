#include "bulbtrace/sdf/distance_field.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace bulbtrace::sdf {
namespace {

TEST(DistanceFieldTest, SphereIsExact) {
    const Vec3 points[] = {
        {0.0f, 0.0f, 0.0f},
        {1.0f, 0.0f, 0.0f},
        {0.3f, -0.7f, 2.5f},
        {-4.0f, 1.0f, 0.25f},
    };
    for (const Vec3& p : points) {
        EXPECT_FLOAT_EQ(sphere(p, 0.75f), core::length(p) - 0.75f);
    }
}

TEST(DistanceFieldTest, TorusRingIsInside) {
    EXPECT_NEAR(torus({0.3f, 0.0f, 0.0f}, 0.3f, 0.1f), -0.1f, 1e-6f);
    EXPECT_NEAR(torus({0.0f, 0.0f, 0.0f}, 0.3f, 0.1f), 0.2f, 1e-6f);
    EXPECT_NEAR(torus({0.0f, 0.5f, -0.3f}, 0.3f, 0.1f), 0.4f, 1e-6f);
}

TEST(DistanceFieldTest, RoundedBoxInsideAndOutside) {
    const Vec3 half{0.25f, 0.25f, 0.25f};
    EXPECT_NEAR(rounded_box({1.0f, 0.0f, 0.0f}, half, 0.0f), 0.75f, 1e-6f);
    EXPECT_NEAR(rounded_box({0.0f, 0.0f, 0.0f}, half, 0.0f), -0.25f, 1e-6f);
    EXPECT_NEAR(rounded_box({1.0f, 0.0f, 0.0f}, half, 0.05f), 0.7f, 1e-6f);
}

TEST(DistanceFieldTest, ConeOpensDownward) {
    const float half_angle = 0.4f;
    const Vec2 cos_sin{std::cos(half_angle), std::sin(half_angle)};
    EXPECT_LT(cone({0.0f, -0.15f, 0.0f}, cos_sin, 0.3f), 0.0f);
    EXPECT_GT(cone({0.0f, 0.5f, 0.0f}, cos_sin, 0.3f), 0.0f);
    EXPECT_NEAR(cone({0.0f, -0.5f, 0.0f}, cos_sin, 0.3f), 0.2f, 1e-6f);
}

TEST(DistanceFieldTest, PolytopeNormalSets) {
    EXPECT_EQ(polytope_normals(Polytope::Octahedron).size(), 4u);
    EXPECT_EQ(polytope_normals(Polytope::Dodecahedron).size(), 6u);
    EXPECT_EQ(polytope_normals(Polytope::Icosahedron).size(), 10u);
    EXPECT_EQ(polytope_normals(Polytope::TruncatedOctahedron).size(), 7u);
    EXPECT_EQ(polytope_normals(Polytope::TruncatedIcosahedron).size(), 16u);

    for (const Vec3& n : polytope_normal_table()) {
        EXPECT_NEAR(core::length(n), 1.0f, 1e-6f);
    }
}

TEST(DistanceFieldTest, SmoothPolytopeBoundsSharpPolytope) {
    const auto normals = polytope_normals(Polytope::Dodecahedron);
    std::mt19937 rng(7);
    std::uniform_real_distribution<float> coord(-1.0f, 1.0f);

    for (int i = 0; i < 200; ++i) {
        const Vec3 p{coord(rng), coord(rng), coord(rng)};
        const float sharp = polytope_sharp(p, normals, 0.2f);
        const float smooth = polytope(p, normals, 50.0f, 0.2f);
        EXPECT_GE(smooth, sharp - 1e-5f);
        // (n * max^e)^(1/e) <= n^(1/e) * max with n = 6 and e = 50.
        EXPECT_LE(smooth - sharp, 0.04f * (sharp + 0.2f) + 1e-5f);
    }
}

TEST(DistanceFieldTest, SmoothPolytopeAtSmallRadii) {
    const Polytope kinds[] = {
        Polytope::Octahedron,
        Polytope::Dodecahedron,
        Polytope::Icosahedron,
        Polytope::TruncatedOctahedron,
        Polytope::TruncatedIcosahedron,
    };
    const float radii[] = {0.10f, 0.12f, 0.13f, 0.14f};

    for (const Polytope kind : kinds) {
        const auto normals = polytope_normals(kind);
        for (const float r : radii) {
            for (const Vec3& n : normals) {
                for (const float side : {1.0f, -1.0f}) {
                    const Vec3 outside = n * (side * (r + 0.01f));
                    const Vec3 inside = n * (side * (r - 0.01f));
                    const float smooth_out = polytope(outside, normals, 50.0f, r);
                    EXPECT_GT(smooth_out, 0.0f) << "r=" << r;
                    EXPECT_GE(smooth_out, polytope_sharp(outside, normals, r) - 1e-6f);
                    EXPECT_GE(polytope(inside, normals, 50.0f, r), polytope_sharp(inside, normals, r) - 1e-6f);
                }
            }
        }
    }
}

TEST(DistanceFieldTest, SmoothPolytopeNearCenter) {
    const auto normals = polytope_normals(Polytope::TruncatedOctahedron);
    EXPECT_FLOAT_EQ(polytope({0.0f, 0.0f, 0.0f}, normals, 50.0f, 0.1f), -0.1f);
    EXPECT_NEAR(polytope({0.11f, 0.0f, 0.0f}, normals, 50.0f, 0.1f), 0.01f, 1e-4f);
    EXPECT_NEAR(polytope({1e-4f, 0.0f, 0.0f}, normals, 50.0f, 0.1f), 1e-4f - 0.1f, 1e-6f);
}

TEST(DistanceFieldTest, SmoothMinNeverExceedsMin) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> value(-5.0f, 5.0f);
    std::uniform_real_distribution<float> sharpness(0.5f, 200.0f);

    for (int i = 0; i < 1000; ++i) {
        const float a = value(rng);
        const float b = value(rng);
        const float k = sharpness(rng);
        EXPECT_LE(smooth_min(a, b, k), std::min(a, b)) << "a=" << a << " b=" << b << " k=" << k;
    }
}

TEST(DistanceFieldTest, SmoothMinApproachesMinForLargeSharpness) {
    std::mt19937 rng(3);
    std::uniform_real_distribution<float> value(-2.0f, 2.0f);

    for (int i = 0; i < 200; ++i) {
        const float a = value(rng);
        const float b = value(rng);
        const float k = 1e4f;
        // The blend never removes more than ln(2) / k.
        EXPECT_NEAR(smooth_min(a, b, k), std::min(a, b), std::log(2.0f) / k + 1e-6f);
    }
}

TEST(DistanceFieldTest, SmoothMinDoesNotOverflow) {
    EXPECT_TRUE(std::isfinite(smooth_min(-1e3f, 1e3f, 1e3f)));
    EXPECT_FLOAT_EQ(smooth_min(-1e3f, 1e3f, 1e3f), -1e3f);
    EXPECT_TRUE(std::isfinite(smooth_min(50.0f, 50.0f, 500.0f)));
}

TEST(DistanceFieldTest, SmoothMinNonPositiveSharpnessIsHardMin) {
    EXPECT_FLOAT_EQ(smooth_min(0.3f, -0.2f, 0.0f), -0.2f);
    EXPECT_FLOAT_EQ(smooth_min(0.3f, 0.4f, -1.0f), 0.3f);
}

} // namespace
} // namespace bulbtrace::sdf
