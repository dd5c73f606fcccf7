#include "bulbtrace/render/ambient_occlusion.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <random>

namespace bulbtrace::render {
namespace {

float open_space(const Vec3&) {
    return 100.0f;
}

float ground_plane(const Vec3& p) {
    return p.y;
}

TEST(AmbientOcclusionTest, SampleTables) {
    const auto primary = ao_samples(AoProfile::Primary);
    ASSERT_EQ(primary.size(), 2u);
    EXPECT_FLOAT_EQ(primary[0].weight, 0.5f);
    EXPECT_FLOAT_EQ(primary[0].delta, 0.016f);
    EXPECT_FLOAT_EQ(primary[1].weight, 0.25f);
    EXPECT_FLOAT_EQ(primary[1].delta, 0.081f);

    const auto alternate = ao_samples(AoProfile::Alternate);
    ASSERT_EQ(alternate.size(), 4u);
    EXPECT_FLOAT_EQ(alternate[3].weight, 0.0625f);
    EXPECT_FLOAT_EQ(alternate[3].delta, 0.5f);
}

TEST(AmbientOcclusionTest, OpenSpaceIsUnoccluded) {
    const Vec3 p{0.0f, 0.0f, 0.0f};
    const Vec3 n{0.0f, 1.0f, 0.0f};
    EXPECT_FLOAT_EQ(ambient_occlusion(open_space, p, n, AoProfile::Primary), 1.0f);
    EXPECT_FLOAT_EQ(ambient_occlusion(open_space, p, n, AoProfile::Alternate), 1.0f);
}

TEST(AmbientOcclusionTest, FlatSurfaceIsUnoccluded) {
    // Each sample sits exactly delta above the plane, so nothing occludes.
    const Vec3 p{0.3f, 0.0f, -0.2f};
    const Vec3 n{0.0f, 1.0f, 0.0f};
    EXPECT_NEAR(ambient_occlusion(ground_plane, p, n, AoProfile::Primary), 1.0f, 1e-5f);
    EXPECT_NEAR(ambient_occlusion(ground_plane, p, n, AoProfile::Alternate), 1.0f, 1e-5f);
}

TEST(AmbientOcclusionTest, BuriedPointIsOccluded) {
    const auto solid = [](const Vec3&) { return -1.0f; };
    const Vec3 p{};
    const Vec3 n{0.0f, 0.0f, 1.0f};
    // Primary: sum 0.75 -> (0.25 - 0.29) * 3.5 squared, small but positive.
    EXPECT_NEAR(ambient_occlusion(solid, p, n, AoProfile::Primary), 0.0196f, 1e-4f);
    // Alternate: sum 0.4875.
    EXPECT_NEAR(ambient_occlusion(solid, p, n, AoProfile::Alternate), 0.5125f, 1e-5f);
}

TEST(AmbientOcclusionTest, RemapStaysInUnitInterval) {
    std::mt19937 rng(11);
    std::uniform_real_distribution<float> sum(-2.0f, 3.0f);
    for (int i = 0; i < 500; ++i) {
        const float s = sum(rng);
        for (const AoProfile profile : {AoProfile::Primary, AoProfile::Alternate}) {
            const float v = remap_occlusion(profile, s);
            EXPECT_GE(v, 0.0f);
            EXPECT_LE(v, 1.0f);
        }
    }
}

TEST(AmbientOcclusionTest, ResultAlwaysInUnitInterval) {
    std::mt19937 rng(5);
    std::uniform_real_distribution<float> offset(-0.5f, 0.5f);
    const auto bumpy = [](const Vec3& p) { return core::length(p) - 0.4f + 0.05f * std::sin(20.0f * p.x); };

    for (int i = 0; i < 200; ++i) {
        const Vec3 p{offset(rng), offset(rng), offset(rng)};
        const Vec3 n = core::normalized({offset(rng), offset(rng), offset(rng)});
        for (const AoProfile profile : {AoProfile::Primary, AoProfile::Alternate}) {
            const float ao = ambient_occlusion(bumpy, p, n, profile);
            EXPECT_GE(ao, 0.0f);
            EXPECT_LE(ao, 1.0f);
        }
    }
}

} // namespace
} // namespace bulbtrace::render
