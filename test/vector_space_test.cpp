#include <gtest/gtest.h>
#include "errors.hpp"
#include "vector_space.hpp"

using namespace glove;

TEST(VectorSpaceTest, ShapesAgree) {
    VectorSpace space(7, 5, 42);
    EXPECT_EQ(space.VocabSize(), 7u);
    EXPECT_EQ(space.Dimension(), 5u);
    EXPECT_EQ(space.vectors().Rows(), 7u);
    EXPECT_EQ(space.vectors().Cols(), 5u);
    EXPECT_EQ(space.biases().size(), 7u);
    EXPECT_EQ(space.vector_gradsq().Rows(), 7u);
    EXPECT_EQ(space.vector_gradsq().Cols(), 5u);
    EXPECT_EQ(space.bias_gradsq().size(), 7u);
}

TEST(VectorSpaceTest, Initialization) {
    const int dim = 10;
    VectorSpace space(50, dim, 7);

    const double bound = 0.5 / dim;
    for (double v : space.vectors().Data()) {
        EXPECT_GE(v, -bound);
        EXPECT_LT(v, bound);
    }
    for (double b : space.biases()) {
        EXPECT_EQ(b, 0.0);
    }
    // 累加器初值必须为正
    for (double g : space.vector_gradsq().Data()) {
        EXPECT_EQ(g, VectorSpace::kInitialGradSq);
    }
    for (double g : space.bias_gradsq()) {
        EXPECT_EQ(g, VectorSpace::kInitialGradSq);
    }
    EXPECT_GT(VectorSpace::kInitialGradSq, 0.0);
}

TEST(VectorSpaceTest, SameSeedSameVectors) {
    VectorSpace a(20, 8, 123);
    VectorSpace b(20, 8, 123);
    VectorSpace c(20, 8, 124);
    EXPECT_EQ(a.vectors(), b.vectors());
    EXPECT_NE(a.vectors(), c.vectors());
}

TEST(VectorSpaceTest, RowAccessIsWritable) {
    VectorSpace space(3, 2, 1);
    space.Vector(1)[0] = 5.0;
    space.Bias(2) = -1.5;
    EXPECT_EQ(space.vectors().At(1, 0), 5.0);
    EXPECT_EQ(space.biases()[2], -1.5);
}

TEST(VectorSpaceTest, InvalidShapeRejected) {
    EXPECT_THROW(VectorSpace(0, 5), InvalidConfiguration);
    EXPECT_THROW(VectorSpace(5, 0), InvalidConfiguration);
    EXPECT_THROW(VectorSpace(5, -2), InvalidConfiguration);
}

TEST(VectorSpaceTest, RebuildFromParameters) {
    DenseMatrix vectors(2, 3, 0.25);
    VectorSpace space(vectors, {1.0, 2.0});
    EXPECT_EQ(space.vectors(), vectors);
    EXPECT_EQ(space.Bias(1), 2.0);
    EXPECT_EQ(space.bias_gradsq()[0], VectorSpace::kInitialGradSq);

    EXPECT_THROW(VectorSpace(DenseMatrix(2, 3), {1.0}), DataIntegrityError);
}
