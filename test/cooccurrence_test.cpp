#include <gtest/gtest.h>
#include <stdexcept>
#include "cooccurrence.hpp"
#include "thread_pool.hpp"

using namespace glove;

class CooccurrenceBuilderTest : public ::testing::Test {
protected:
    // 约 2000 个词、20 种词，窗口 5，足够让每个线程分到多段观测
    Corpus LargerCorpus() {
        std::string text;
        for (int i = 0; i < 2000; ++i) {
            text += "w" + std::to_string((i * 7 + i / 3) % 20) + " ";
        }
        Corpus::Options options;
        options.window = 5;
        return Corpus::Build(text, options);
    }
};

TEST_F(CooccurrenceBuilderTest, ThreeTokenScenario) {
    ThreadPool pool(2);
    Corpus corpus = Corpus::Build("a b c");
    CooccurrenceMatrix matrix = CooccurrenceBuilder(pool).Build(corpus.pairs(), corpus.Size());

    const int a = 0, b = 1, c = 2;
    EXPECT_DOUBLE_EQ(matrix.Get(a, b), 1.0);
    EXPECT_DOUBLE_EQ(matrix.Get(b, c), 1.0);
    EXPECT_DOUBLE_EQ(matrix.Get(a, c), 0.5);
    EXPECT_DOUBLE_EQ(matrix.Get(b, a), 1.0);
    EXPECT_DOUBLE_EQ(matrix.Get(c, b), 1.0);
    EXPECT_DOUBLE_EQ(matrix.Get(c, a), 0.5);

    EXPECT_EQ(matrix.Get(a, a), 0.0);
    EXPECT_EQ(matrix.Get(b, b), 0.0);
    EXPECT_EQ(matrix.Get(c, c), 0.0);
    EXPECT_EQ(matrix.NonZeroCount(), 6u);
}

TEST_F(CooccurrenceBuilderTest, MatrixIsSymmetric) {
    ThreadPool pool(4);
    Corpus corpus = LargerCorpus();
    CooccurrenceMatrix matrix = CooccurrenceBuilder(pool).Build(corpus.pairs(), corpus.Size());

    const int size = static_cast<int>(matrix.Size());
    for (int i = 0; i < size; ++i) {
        for (int j = 0; j < size; ++j) {
            EXPECT_EQ(matrix.Get(i, j), matrix.Get(j, i)) << "at (" << i << ", " << j << ")";
        }
    }
}

TEST_F(CooccurrenceBuilderTest, WeightsArePositive) {
    ThreadPool pool(3);
    Corpus corpus = LargerCorpus();
    CooccurrenceMatrix matrix = CooccurrenceBuilder(pool).Build(corpus.pairs(), corpus.Size());

    for (const auto& entry : matrix.NonZeroEntries()) {
        EXPECT_GT(matrix.Get(entry.row, entry.col), 0.0);
    }
}

TEST_F(CooccurrenceBuilderTest, ThreadCountDoesNotChangeResult) {
    Corpus corpus = LargerCorpus();

    ThreadPool single(1);
    ThreadPool several(4);
    CooccurrenceMatrix expected = CooccurrenceBuilder(single).Build(corpus.pairs(), corpus.Size());
    CooccurrenceMatrix actual = CooccurrenceBuilder(several).Build(corpus.pairs(), corpus.Size());

    ASSERT_EQ(expected.NonZeroEntries(), actual.NonZeroEntries());
    for (const auto& entry : expected.NonZeroEntries()) {
        // 归约顺序不同，只允许浮点舍入误差
        EXPECT_NEAR(expected.Get(entry.row, entry.col), actual.Get(entry.row, entry.col), 1e-9);
    }
}

TEST_F(CooccurrenceBuilderTest, MoreThreadsThanPairs) {
    ThreadPool pool(8);
    std::vector<TokenPair> pairs = {{0, 1, 1}};
    CooccurrenceMatrix matrix = CooccurrenceBuilder(pool).Build(pairs, 2);
    EXPECT_DOUBLE_EQ(matrix.Get(0, 1), 1.0);
    EXPECT_DOUBLE_EQ(matrix.Get(1, 0), 1.0);
}

TEST_F(CooccurrenceBuilderTest, OutOfVocabularyIdFailsFast) {
    ThreadPool pool(2);
    std::vector<TokenPair> pairs = {{0, 1, 1}, {1, 3, 1}};
    EXPECT_THROW(CooccurrenceBuilder(pool).Build(pairs, 3), std::out_of_range);

    std::vector<TokenPair> negative = {{-1, 0, 1}};
    EXPECT_THROW(CooccurrenceBuilder(pool).Build(negative, 3), std::out_of_range);
}

TEST_F(CooccurrenceBuilderTest, NonPositiveDistanceRejected) {
    ThreadPool pool(1);
    std::vector<TokenPair> pairs = {{0, 1, 0}};
    EXPECT_THROW(CooccurrenceBuilder(pool).Build(pairs, 2), std::invalid_argument);
}
