/**
 * @file test_FieldEmbedding.cpp
 * @brief Unit tests for fields used as the boundary of other fields
 */

#include <gtest/gtest.h>
#include "pfl/Field/FieldEmbedding.h"
#include "pfl/Field/FieldMath.h"
#include "pfl/Core/PFLException.h"
#include "pfl/Extrapolation/Constants.h"
#include "pfl/Geometry/UniformGrid.h"

using namespace pfl;
using namespace pfl::math;
using namespace pfl::field;
using namespace pfl::extrapolation;
using geometry::Box;
using geometry::UniformGrid;

namespace {
constexpr double tol = 1e-12;

Tensor x_of(const Tensor& p) {
    return p.slice(Selection{{"vector", std::string("x")}});
}
} // namespace

class FieldEmbeddingTest : public ::testing::Test {
protected:
    std::shared_ptr<const UniformGrid> inner = std::make_shared<const UniformGrid>(Shape{spatial("x", 4)},
                                                                                   Box::from_size({"x"}, {4}));
    // f(x) = x on [-2, 6]
    Field outer{std::make_shared<const UniformGrid>(
                    Shape{spatial("x", 8)},
                    std::make_shared<const Box>(Tensor::vector({"x"}, {-2}), Tensor::vector({"x"}, {6}))),
                [](const Tensor& p) { return x_of(p); }, ZERO_GRADIENT};
};

TEST_F(FieldEmbeddingTest, FieldsConvertToEmbeddings) {
    Field f(inner, Tensor(Real(0)), outer);
    auto embedding = std::dynamic_pointer_cast<const FieldEmbedding>(f.boundary());
    ASSERT_NE(embedding, nullptr);
    EXPECT_TRUE(embedding->field() == outer);
    EXPECT_TRUE(embedding->determines_boundary_values("x-"));
    EXPECT_EQ(embedding->to_string().rfind("embedded ", 0), 0u);
}

TEST_F(FieldEmbeddingTest, PaddingSamplesTheOuterField) {
    Field f(inner, [](const Tensor& p) { return x_of(p); }, outer);
    Field p = pad(f, 1);
    std::vector<Real> expected{-0.5, 0.5, 1.5, 2.5, 3.5, 4.5};
    std::vector<Real> actual = p.values().to_vector();
    ASSERT_EQ(actual.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(actual[i], expected[i], tol);
    }
}

TEST_F(FieldEmbeddingTest, PaddingWithoutCoordinatesThrows) {
    auto embedding = std::make_shared<const FieldEmbedding>(outer);
    Tensor values = Tensor::arange(spatial("x", 4));
    EXPECT_THROW(embedding->pad(values, {{"x", {1, 1}}}), InvalidArgumentException);
}

TEST_F(FieldEmbeddingTest, StaggeredFieldsStoreInteriorFacesOnly) {
    Field f(inner, Tensor(Real(1)), outer, SampleLocation::Face);
    ASSERT_TRUE(f.is_staggered());
    EXPECT_EQ(f.values().shape().size("x"), 3);
    Tensor faces = f.face_component("x");
    EXPECT_NEAR(faces.value({{"x", 0}}), 0.0, tol);
    EXPECT_NEAR(faces.value({{"x", 4}}), 4.0, tol);
}

TEST_F(FieldEmbeddingTest, ArithmeticWithConstantsTransformsTheEmbeddedField) {
    auto embedding = std::make_shared<const FieldEmbedding>(outer);
    ExtrapolationPtr shifted = combine(embedding, ONE, BinaryOp::Add);
    auto result = std::dynamic_pointer_cast<const FieldEmbedding>(shifted);
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(close(result->field().values(), outer.values() + Tensor(Real(1))));

    ExtrapolationPtr reversed = combine(ONE, embedding, BinaryOp::Sub);
    auto flipped = std::dynamic_pointer_cast<const FieldEmbedding>(reversed);
    ASSERT_NE(flipped, nullptr);
    EXPECT_TRUE(close(flipped->field().values(), Tensor(Real(1)) - outer.values()));

    EXPECT_THROW(combine(embedding, PERIODIC, BinaryOp::Add), IncompatibleExtrapolations);
}

TEST_F(FieldEmbeddingTest, DerivedRules) {
    auto embedding = std::make_shared<const FieldEmbedding>(outer);
    auto gradient = std::dynamic_pointer_cast<const FieldEmbedding>(embedding->spatial_gradient());
    ASSERT_NE(gradient, nullptr);
    EXPECT_NEAR(gradient->field().values().value({{"x", 3}, {"vector", 0}}), 1.0, tol);

    auto negated = std::dynamic_pointer_cast<const FieldEmbedding>(embedding->transform(UnaryOp::Neg));
    ASSERT_NE(negated, nullptr);
    EXPECT_TRUE(close(negated->field().values(), -outer.values()));

    EXPECT_EQ(embedding->component("x").get(), embedding.get());
    EXPECT_TRUE(embedding->equals(FieldEmbedding(outer)));
    EXPECT_FALSE(embedding->equals(*ZERO));
}
