#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "vouchrun/types.h"

namespace vouchrun {

// Partitions a job input into ordered task inputs. Throws SplitError.
class SplitStrategy {
public:
    virtual ~SplitStrategy() = default;
    virtual std::vector<Bytes> split(const Bytes& input) const = 0;
};

// Combines task outputs, given in ordinal order. Throws MergeError.
class MergeStrategy {
public:
    virtual ~MergeStrategy() = default;
    virtual Bytes merge(const std::vector<Bytes>& outputs) const = 0;
};

// Split and merge capabilities looked up by ID
class StrategyRegistry {
public:
    // Replaces any strategy already registered under the ID
    void register_split(const std::string& id, std::shared_ptr<const SplitStrategy> strategy);
    void register_merge(const std::string& id, std::shared_ptr<const MergeStrategy> strategy);

    // nullptr when unknown
    std::shared_ptr<const SplitStrategy> find_split(const std::string& id) const;
    std::shared_ptr<const MergeStrategy> find_merge(const std::string& id) const;

    std::vector<std::string> split_ids() const;
    std::vector<std::string> merge_ids() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const SplitStrategy>> splits_;
    std::map<std::string, std::shared_ptr<const MergeStrategy>> merges_;
};

// Registers: splits "fixed-size", "equal-parts", "matrix-rows";
// merges "concat", "sum-u64", "matrix-rows"
void register_builtin_strategies(StrategyRegistry& registry);

// Consecutive chunks of at most chunk_bytes
class FixedSizeSplit : public SplitStrategy {
public:
    explicit FixedSizeSplit(size_t chunk_bytes);
    std::vector<Bytes> split(const Bytes& input) const override;

private:
    size_t chunk_bytes_;
};

// At most parts chunks of near-equal size
class EqualPartsSplit : public SplitStrategy {
public:
    explicit EqualPartsSplit(size_t parts);
    std::vector<Bytes> split(const Bytes& input) const override;

private:
    size_t parts_;
};

// Dense int64 matrix, serialized as [rows][cols] values (little-endian)
struct Matrix {
    int64_t rows = 0;
    int64_t cols = 0;
    std::vector<int64_t> values;   // Row-major

    int64_t at(int64_t row, int64_t col) const { return values[row * cols + col]; }

    void append_to(Bytes& out) const;
    Bytes encode() const;

    // Reads one matrix at offset and advances it; false if malformed
    static bool read(const Bytes& data, size_t& offset, Matrix& out);
};

// Input A then B; each task gets block_rows rows of A plus all of B
class MatrixRowBlockSplit : public SplitStrategy {
public:
    explicit MatrixRowBlockSplit(size_t block_rows);
    std::vector<Bytes> split(const Bytes& input) const override;

private:
    size_t block_rows_;
};

class ConcatMerge : public MergeStrategy {
public:
    Bytes merge(const std::vector<Bytes>& outputs) const override;
};

// Each output is one little-endian u64; the result is their wrapping sum
class SumU64Merge : public MergeStrategy {
public:
    Bytes merge(const std::vector<Bytes>& outputs) const override;
};

// Stacks row blocks of C into one matrix
class MatrixRowBlockMerge : public MergeStrategy {
public:
    Bytes merge(const std::vector<Bytes>& outputs) const override;
};

} // namespace vouchrun
