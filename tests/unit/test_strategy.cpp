#include <gtest/gtest.h>
#include "vouchrun/strategy.h"
#include <stdexcept>

namespace vouchrun {
namespace {

Bytes u64_bytes(uint64_t value) {
    Bytes out;
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
    }
    return out;
}

Bytes range_bytes(size_t count) {
    Bytes data(count);
    for (size_t i = 0; i < count; ++i) {
        data[i] = static_cast<uint8_t>(i);
    }
    return data;
}

// ============================================================================
// Registry
// ============================================================================

TEST(StrategyRegistryTest, BuiltinsAreRegistered) {
    StrategyRegistry registry;
    register_builtin_strategies(registry);

    EXPECT_EQ(registry.split_ids(),
              (std::vector<std::string>{"equal-parts", "fixed-size", "matrix-rows"}));
    EXPECT_EQ(registry.merge_ids(),
              (std::vector<std::string>{"concat", "matrix-rows", "sum-u64"}));
    EXPECT_NE(registry.find_split("fixed-size"), nullptr);
    EXPECT_NE(registry.find_merge("sum-u64"), nullptr);
}

TEST(StrategyRegistryTest, UnknownIdReturnsNull) {
    StrategyRegistry registry;
    register_builtin_strategies(registry);

    EXPECT_EQ(registry.find_split("nope"), nullptr);
    EXPECT_EQ(registry.find_merge("nope"), nullptr);
}

TEST(StrategyRegistryTest, RegisterReplacesExisting) {
    StrategyRegistry registry;
    registry.register_split("chunks", std::make_shared<FixedSizeSplit>(4));
    registry.register_split("chunks", std::make_shared<FixedSizeSplit>(2));

    auto chunks = registry.find_split("chunks")->split(range_bytes(4));

    EXPECT_EQ(chunks.size(), 2u);
}

// ============================================================================
// Splits
// ============================================================================

TEST(SplitStrategyTest, FixedSizeChunks) {
    FixedSizeSplit split(4);

    auto chunks = split.split(range_bytes(10));

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0], (Bytes{0, 1, 2, 3}));
    EXPECT_EQ(chunks[1], (Bytes{4, 5, 6, 7}));
    EXPECT_EQ(chunks[2], (Bytes{8, 9}));
}

TEST(SplitStrategyTest, EqualPartsNearEqualSizes) {
    EqualPartsSplit split(4);

    auto chunks = split.split(range_bytes(10));

    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[0].size(), 3u);
    EXPECT_EQ(chunks[3].size(), 1u);
}

TEST(SplitStrategyTest, EqualPartsNeverProducesEmptyChunks) {
    EqualPartsSplit split(4);

    auto chunks = split.split(range_bytes(2));

    ASSERT_EQ(chunks.size(), 2u);
    for (const auto& chunk : chunks) {
        EXPECT_FALSE(chunk.empty());
    }
}

TEST(SplitStrategyTest, SplitThenConcatRestoresInput) {
    Bytes input = range_bytes(1000);
    ConcatMerge concat;

    EXPECT_EQ(concat.merge(FixedSizeSplit(64).split(input)), input);
    EXPECT_EQ(concat.merge(EqualPartsSplit(7).split(input)), input);
}

TEST(SplitStrategyTest, EmptyInputIsSplitError) {
    EXPECT_THROW(FixedSizeSplit(4).split({}), SplitError);
    EXPECT_THROW(EqualPartsSplit(4).split({}), SplitError);
}

TEST(SplitStrategyTest, ZeroParametersRejected) {
    EXPECT_THROW(FixedSizeSplit(0), std::invalid_argument);
    EXPECT_THROW(EqualPartsSplit(0), std::invalid_argument);
    EXPECT_THROW(MatrixRowBlockSplit(0), std::invalid_argument);
}

// ============================================================================
// Matrices
// ============================================================================

class MatrixStrategyTest : public ::testing::Test {
protected:
    Matrix a{3, 2, {1, 2, 3, 4, 5, 6}};
    Matrix b{2, 2, {7, 8, 9, 10}};

    Bytes input() const {
        Bytes out = a.encode();
        b.append_to(out);
        return out;
    }
};

TEST_F(MatrixStrategyTest, EncodeAndRead) {
    Bytes encoded = a.encode();
    Matrix decoded;
    size_t offset = 0;

    ASSERT_TRUE(Matrix::read(encoded, offset, decoded));
    EXPECT_EQ(offset, encoded.size());
    EXPECT_EQ(decoded.rows, 3);
    EXPECT_EQ(decoded.cols, 2);
    EXPECT_EQ(decoded.at(2, 1), 6);
}

TEST_F(MatrixStrategyTest, ReadRejectsTruncatedData) {
    Bytes encoded = a.encode();
    encoded.pop_back();
    Matrix decoded;
    size_t offset = 0;

    EXPECT_FALSE(Matrix::read(encoded, offset, decoded));
    EXPECT_EQ(offset, 0u);
}

TEST_F(MatrixStrategyTest, ReadRejectsHugeDimensions) {
    Bytes encoded = u64_bytes(1ULL << 40);
    Bytes cols = u64_bytes(1ULL << 40);
    encoded.insert(encoded.end(), cols.begin(), cols.end());
    Matrix decoded;
    size_t offset = 0;

    EXPECT_FALSE(Matrix::read(encoded, offset, decoded));
}

TEST_F(MatrixStrategyTest, RowBlocksCarryAllOfB) {
    MatrixRowBlockSplit split(2);

    auto chunks = split.split(input());

    // 3 rows in blocks of 2
    ASSERT_EQ(chunks.size(), 2u);

    Matrix block;
    Matrix rhs;
    size_t offset = 0;
    ASSERT_TRUE(Matrix::read(chunks[1], offset, block));
    ASSERT_TRUE(Matrix::read(chunks[1], offset, rhs));
    EXPECT_EQ(block.rows, 1);
    EXPECT_EQ(block.values, (std::vector<int64_t>{5, 6}));
    EXPECT_EQ(rhs.values, b.values);
}

TEST_F(MatrixStrategyTest, MismatchedDimensionsAreSplitError) {
    Matrix wrong{3, 2, {1, 2, 3, 4, 5, 6}};
    Bytes data = a.encode();
    wrong.append_to(data);

    EXPECT_THROW(MatrixRowBlockSplit(1).split(data), SplitError);
}

TEST_F(MatrixStrategyTest, MalformedInputIsSplitError) {
    EXPECT_THROW(MatrixRowBlockSplit(1).split(Bytes{1, 2, 3}), SplitError);

    Bytes trailing = input();
    trailing.push_back(0);
    EXPECT_THROW(MatrixRowBlockSplit(1).split(trailing), SplitError);
}

TEST_F(MatrixStrategyTest, MergeStacksRowBlocks) {
    Matrix top{1, 2, {1, 2}};
    Matrix bottom{2, 2, {3, 4, 5, 6}};
    MatrixRowBlockMerge merge;

    Bytes merged = merge.merge({top.encode(), bottom.encode()});

    Matrix c;
    size_t offset = 0;
    ASSERT_TRUE(Matrix::read(merged, offset, c));
    EXPECT_EQ(c.rows, 3);
    EXPECT_EQ(c.cols, 2);
    EXPECT_EQ(c.values, (std::vector<int64_t>{1, 2, 3, 4, 5, 6}));
}

TEST_F(MatrixStrategyTest, MergeRejectsInconsistentBlocks) {
    MatrixRowBlockMerge merge;
    Matrix two{1, 2, {1, 2}};
    Matrix three{1, 3, {1, 2, 3}};

    EXPECT_THROW(merge.merge({two.encode(), three.encode()}), MergeError);
    EXPECT_THROW(merge.merge({Bytes{1, 2}}), MergeError);
    EXPECT_THROW(merge.merge({}), MergeError);
}

// ============================================================================
// Merges
// ============================================================================

TEST(MergeStrategyTest, ConcatPreservesOrder) {
    ConcatMerge merge;

    EXPECT_EQ(merge.merge({Bytes{1}, Bytes{}, Bytes{2, 3}}), (Bytes{1, 2, 3}));
}

TEST(MergeStrategyTest, SumU64AddsOutputs) {
    SumU64Merge merge;

    EXPECT_EQ(merge.merge({u64_bytes(40), u64_bytes(2)}), u64_bytes(42));
}

TEST(MergeStrategyTest, SumU64Wraps) {
    SumU64Merge merge;

    EXPECT_EQ(merge.merge({u64_bytes(~0ULL), u64_bytes(2)}), u64_bytes(1));
}

TEST(MergeStrategyTest, SumU64RejectsWrongWidth) {
    SumU64Merge merge;

    EXPECT_THROW(merge.merge({u64_bytes(1), Bytes{1, 2, 3}}), MergeError);
}

} // namespace
} // namespace vouchrun
