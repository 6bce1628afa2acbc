/**
 * @file test_Mesh.cpp
 * @brief Unit tests for the unstructured 2D Mesh
 */

#include <gtest/gtest.h>
#include "pfl/Geometry/Mesh.h"
#include "pfl/Geometry/UniformGrid.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Math/MathConstants.h"
#include <cmath>

using namespace pfl;
using namespace pfl::math;
using namespace pfl::geometry;

namespace {
constexpr double tol = 1e-12;

Tensor xy(Real x, Real y) {
    return Tensor::vector({"x", "y"}, {x, y});
}

Tensor triangle_vertices() {
    return Tensor::from_values(Shape{instance("vertices", 3), vector_dim({"x", "y"})}, {0, 0, 1, 0, 0, 1});
}
} // namespace

class MeshTest : public ::testing::Test {
protected:
    MeshTest() {
        UniformGrid grid(Shape{spatial("x", 2), spatial("y", 2)}, Box::from_size({"x", "y"}, {2, 2}));
        mesh = Mesh::from_grid(grid);
    }

    MeshPtr mesh;
};

TEST_F(MeshTest, CellsAndFaces) {
    EXPECT_EQ(mesh->cell_count(), 4);
    EXPECT_EQ(mesh->interior_face_count(), 4);
    EXPECT_EQ(mesh->face_count(), 12);
    EXPECT_EQ(mesh->shape(), (Shape{instance("cells", 4)}));
    EXPECT_EQ(mesh->face_shape().size("~faces"), 12);
    EXPECT_TRUE(close(mesh->volume(), Tensor::ones(Shape{instance("cells", 4)})));
}

TEST_F(MeshTest, CellCentroidsFollowGridOrder) {
    Tensor c = mesh->center();
    EXPECT_NEAR(c.value({{"cells", 0}, {"vector", 0}}), 0.5, tol);
    EXPECT_NEAR(c.value({{"cells", 0}, {"vector", 1}}), 0.5, tol);
    EXPECT_NEAR(c.value({{"cells", 1}, {"vector", 1}}), 1.5, tol);
    EXPECT_NEAR(c.value({{"cells", 2}, {"vector", 0}}), 1.5, tol);
}

TEST_F(MeshTest, InteriorFacesComeFirst) {
    EXPECT_EQ(mesh->face_owner()[0], 0);
    EXPECT_EQ(mesh->face_neighbor()[0], 2);
    EXPECT_NEAR(mesh->face_normals().value({{"~faces", 0}, {"vector", 0}}), 1.0, tol);
    for (Index f = 0; f < mesh->interior_face_count(); ++f) {
        EXPECT_GE(mesh->face_neighbor()[static_cast<std::size_t>(f)], 0);
    }
    for (Index f = mesh->interior_face_count(); f < mesh->face_count(); ++f) {
        EXPECT_EQ(mesh->face_neighbor()[static_cast<std::size_t>(f)], -1);
    }
}

TEST_F(MeshTest, BoundaryRangesAreContiguous) {
    BoundarySlices slices = mesh->boundary_faces();
    ASSERT_EQ(slices.size(), 4u);
    for (const auto& name : {"x-", "x+", "y-", "y+"}) {
        ASSERT_TRUE(slices.count(name)) << name;
        EXPECT_EQ(mesh->face_areas().slice(slices.at(name)).shape().size("~faces"), 2) << name;
    }

    Tensor lower_x = mesh->face_normals().slice(slices.at("x-"));
    EXPECT_TRUE(close(lower_x, xy(-1, 0).expand(Shape{dual("faces", 2)})));
    Tensor upper_y = mesh->face_centers().slice(slices.at("y+"));
    EXPECT_NEAR(upper_y.slice(Selection{{"vector", std::string("y")}}).min({"~faces"}).item(), 2.0, tol);
}

TEST_F(MeshTest, FaceAreasAreEdgeLengths) {
    EXPECT_TRUE(close(mesh->face_areas(), Tensor::ones(Shape{dual("faces", 12)})));
}

TEST_F(MeshTest, CellLookup) {
    Tensor points = Tensor::stack({xy(0.5, 0.5), xy(1.5, 0.5), xy(0.5, 1.5), xy(3, 3)}, instance("points", 4));
    EXPECT_EQ(mesh->cell_index(points).to_vector(), (std::vector<Real>{0, 2, 1, -1}));
    EXPECT_EQ(mesh->lies_inside(points).to_vector(), (std::vector<Real>{1, 1, 1, 0}));
    EXPECT_DOUBLE_EQ(mesh->nearest_cell(xy(3, 3)).item(), 3.0);
}

TEST_F(MeshTest, SignedDistanceToBoundary) {
    EXPECT_NEAR(mesh->approximate_signed_distance(xy(1, 1)).item(), -1.0, tol);
    EXPECT_NEAR(mesh->approximate_signed_distance(xy(0.5, 0.25)).item(), -0.25, tol);
    EXPECT_NEAR(mesh->approximate_signed_distance(xy(3, 1)).item(), 1.0, tol);

    ClosestSurface s = mesh->approximate_closest_surface(xy(0.25, 1));
    EXPECT_NEAR(s.signed_distance.item(), -0.25, tol);
    EXPECT_TRUE(close(s.delta, xy(-0.25, 0)));
    EXPECT_TRUE(close(s.normal, xy(-1, 0)));
}

TEST_F(MeshTest, BoundingExtents) {
    EXPECT_NEAR(mesh->bounding_radius().value({{"cells", 0}}), std::sqrt(0.5), tol);
    EXPECT_NEAR(mesh->bounding_half_extent().value({{"cells", 3}, {"vector", 1}}), 0.5, tol);
}

TEST_F(MeshTest, Transformations) {
    GeometryPtr moved = mesh->shifted(xy(1, 0));
    EXPECT_NEAR(moved->center().value({{"cells", 0}, {"vector", 0}}), 1.5, tol);
    EXPECT_THROW(mesh->at(xy(0, 0)), NotImplementedException);

    GeometryPtr turned = mesh->rotated(Tensor(constants::PI_2));
    EXPECT_NEAR(turned->center().value({{"cells", 0}, {"vector", 0}}), 1.5, 1e-12);
    EXPECT_NEAR(turned->center().value({{"cells", 0}, {"vector", 1}}), 0.5, 1e-12);

    GeometryPtr doubled = mesh->scaled(Tensor(2.0));
    EXPECT_NEAR(doubled->volume().value({{"cells", 0}}), 4.0, tol);
}

TEST_F(MeshTest, Slicing) {
    EXPECT_THROW(mesh->slice(Selection{{"cells", Index(0)}}), NotImplementedException);
    EXPECT_THROW(mesh->slice(Selection{{"~faces", Index(0)}}), NotImplementedException);
    EXPECT_EQ(mesh->slice(Selection{{"vector", std::string("x")}}), mesh);
}

TEST(MeshConstructionTest, TriangleCell) {
    Mesh tri(triangle_vertices(), {{0, 1, 2}}, {{"wall", {{0, 1}, {1, 2}, {2, 0}}}});
    EXPECT_NEAR(tri.volume().item(), 0.5, tol);
    EXPECT_NEAR(tri.center().value({{"cells", 0}, {"vector", 0}}), 1.0 / 3.0, tol);
    EXPECT_EQ(tri.interior_face_count(), 0);
    EXPECT_EQ(tri.face_count(), 3);
}

TEST(MeshConstructionTest, Equality) {
    Mesh a(triangle_vertices(), {{0, 1, 2}}, {{"wall", {{0, 1}, {1, 2}, {2, 0}}}});
    Mesh b(triangle_vertices(), {{0, 1, 2}}, {{"wall", {{0, 1}, {1, 2}, {2, 0}}}});
    Mesh c(triangle_vertices(), {{0, 1, 2}}, {{"bottom", {{0, 1}}}, {"rest", {{1, 2}, {2, 0}}}});
    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a != c);
}

TEST(MeshConstructionTest, InvalidMeshes) {
    // Untagged boundary edge
    EXPECT_THROW(Mesh(triangle_vertices(), {{0, 1, 2}}, {{"wall", {{0, 1}, {1, 2}}}}), InvalidArgumentException);
    // Edge listed twice
    EXPECT_THROW(Mesh(triangle_vertices(), {{0, 1, 2}}, {{"wall", {{0, 1}, {1, 2}, {2, 0}, {0, 1}}}}),
                 InvalidArgumentException);
    EXPECT_THROW(Mesh(triangle_vertices(), {{0, 1, 5}}, {}), OutOfRangeException);
    EXPECT_THROW(Mesh(triangle_vertices(), {}, {}), InvalidArgumentException);
}
