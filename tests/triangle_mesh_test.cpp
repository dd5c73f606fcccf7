#include "bulbtrace/sdf/triangle_mesh.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace bulbtrace::sdf {
namespace {

TEST(TriangleMeshTest, TriangleDistanceToFaceEdgeAndVertex) {
    const Triangle tri{{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}};

    // Above the interior: plane distance.
    EXPECT_NEAR(triangle_distance({0.2f, 0.2f, 0.5f}, tri), 0.5f, 1e-6f);
    // Beside the hypotenuse in the plane.
    EXPECT_NEAR(triangle_distance({1.0f, 1.0f, 0.0f}, tri), std::sqrt(0.5f), 1e-6f);
    // Beyond a vertex.
    EXPECT_NEAR(triangle_distance({-1.0f, -1.0f, 0.0f}, tri), std::sqrt(2.0f), 1e-6f);
}

TEST(TriangleMeshTest, BoxMeshDistances) {
    const std::vector<float> floats = make_box_mesh_floats({0.45f, 0.45f, 0.45f});
    ASSERT_EQ(floats.size(), 12u * kFloatsPerTriangle);

    const TriangleMesh mesh = TriangleMesh::from_floats(floats);
    EXPECT_EQ(mesh.triangles().size(), 12u);
    EXPECT_FALSE(mesh.empty());

    EXPECT_NEAR(mesh.distance({1.0f, 0.0f, 0.0f}), 0.55f, 1e-5f);
    EXPECT_NEAR(mesh.distance({0.0f, -2.0f, 0.0f}), 1.55f, 1e-5f);
    EXPECT_NEAR(mesh.distance({1.0f, 1.0f, 1.0f}), std::sqrt(3.0f) * 0.55f, 1e-5f);
    // Unsigned: the center is 0.45 away from every face.
    EXPECT_NEAR(mesh.distance({0.0f, 0.0f, 0.0f}), 0.45f, 1e-5f);

    EXPECT_NEAR(mesh.bounding_radius(), std::sqrt(3.0f) * 0.45f, 1e-5f);
}

TEST(TriangleMeshTest, EmptyMeshIsFarAway) {
    const TriangleMesh mesh = TriangleMesh::from_floats({});
    EXPECT_TRUE(mesh.empty());
    EXPECT_GT(mesh.distance({0.0f, 0.0f, 0.0f}), 1e30f);
    EXPECT_EQ(mesh.bounding_radius(), 0.0f);
}

TEST(TriangleMeshTest, RejectsPartialTriangles) {
    const std::vector<float> floats(10, 0.0f);
    EXPECT_THROW((void)TriangleMesh::from_floats(floats), std::invalid_argument);
}

TEST(TriangleMeshTest, RejectsBareVertexArray) {
    // 32 vertices of 3 floats do not form whole triangles.
    const std::vector<float> vertices(96, 0.5f);
    EXPECT_THROW((void)TriangleMesh::from_floats(vertices), std::invalid_argument);
}

TEST(TriangleMeshTest, RejectsTooManyTriangles) {
    const std::vector<float> at_limit(kMaxMeshTriangles * kFloatsPerTriangle, 0.25f);
    ASSERT_EQ(at_limit.size(), 288u);
    EXPECT_EQ(TriangleMesh::from_floats(at_limit).triangles().size(), 32u);

    const std::vector<float> over_limit((kMaxMeshTriangles + 1) * kFloatsPerTriangle, 0.25f);
    EXPECT_THROW((void)TriangleMesh::from_floats(over_limit), std::invalid_argument);
}

} // namespace
} // namespace bulbtrace::sdf
