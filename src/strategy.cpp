#include "vouchrun/strategy.h"
#include "constants.h"
#include <algorithm>
#include <stdexcept>

namespace vouchrun {

namespace {

void put_u64(Bytes& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
    }
}

bool get_u64(const Bytes& data, size_t& offset, uint64_t& value) {
    if (data.size() < offset || data.size() - offset < 8) {
        return false;
    }
    value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
    }
    offset += 8;
    return true;
}

} // namespace

// ============================================================================
// Registry
// ============================================================================

void StrategyRegistry::register_split(const std::string& id,
                                      std::shared_ptr<const SplitStrategy> strategy) {
    std::lock_guard<std::mutex> lock(mutex_);
    splits_[id] = std::move(strategy);
}

void StrategyRegistry::register_merge(const std::string& id,
                                      std::shared_ptr<const MergeStrategy> strategy) {
    std::lock_guard<std::mutex> lock(mutex_);
    merges_[id] = std::move(strategy);
}

std::shared_ptr<const SplitStrategy> StrategyRegistry::find_split(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = splits_.find(id);
    return it == splits_.end() ? nullptr : it->second;
}

std::shared_ptr<const MergeStrategy> StrategyRegistry::find_merge(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = merges_.find(id);
    return it == merges_.end() ? nullptr : it->second;
}

std::vector<std::string> StrategyRegistry::split_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : splits_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<std::string> StrategyRegistry::merge_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : merges_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void register_builtin_strategies(StrategyRegistry& registry) {
    registry.register_split("fixed-size", std::make_shared<FixedSizeSplit>(DEFAULT_FIXED_CHUNK_BYTES));
    registry.register_split("equal-parts", std::make_shared<EqualPartsSplit>(DEFAULT_EQUAL_PARTS));
    registry.register_split("matrix-rows", std::make_shared<MatrixRowBlockSplit>(DEFAULT_MATRIX_BLOCK_ROWS));
    registry.register_merge("concat", std::make_shared<ConcatMerge>());
    registry.register_merge("sum-u64", std::make_shared<SumU64Merge>());
    registry.register_merge("matrix-rows", std::make_shared<MatrixRowBlockMerge>());
}

// ============================================================================
// Byte splits
// ============================================================================

FixedSizeSplit::FixedSizeSplit(size_t chunk_bytes) : chunk_bytes_(chunk_bytes) {
    if (chunk_bytes_ == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

std::vector<Bytes> FixedSizeSplit::split(const Bytes& input) const {
    if (input.empty()) {
        throw SplitError("cannot split empty input");
    }
    std::vector<Bytes> chunks;
    for (size_t offset = 0; offset < input.size(); offset += chunk_bytes_) {
        size_t end = std::min(input.size(), offset + chunk_bytes_);
        chunks.emplace_back(input.begin() + offset, input.begin() + end);
    }
    return chunks;
}

EqualPartsSplit::EqualPartsSplit(size_t parts) : parts_(parts) {
    if (parts_ == 0) {
        throw std::invalid_argument("part count must be positive");
    }
}

std::vector<Bytes> EqualPartsSplit::split(const Bytes& input) const {
    if (input.empty()) {
        throw SplitError("cannot split empty input");
    }
    size_t chunk = (input.size() + parts_ - 1) / parts_;
    return FixedSizeSplit(chunk).split(input);
}

// ============================================================================
// Matrices
// ============================================================================

void Matrix::append_to(Bytes& out) const {
    put_u64(out, static_cast<uint64_t>(rows));
    put_u64(out, static_cast<uint64_t>(cols));
    for (int64_t value : values) {
        put_u64(out, static_cast<uint64_t>(value));
    }
}

Bytes Matrix::encode() const {
    Bytes out;
    out.reserve(16 + values.size() * 8);
    append_to(out);
    return out;
}

bool Matrix::read(const Bytes& data, size_t& offset, Matrix& out) {
    uint64_t rows = 0;
    uint64_t cols = 0;
    size_t at = offset;
    if (!get_u64(data, at, rows) || !get_u64(data, at, cols)) {
        return false;
    }
    // Dimensions are bounded by what the remaining bytes could hold
    uint64_t remaining = (data.size() - at) / 8;
    if (rows > remaining || cols > remaining || (cols != 0 && rows > remaining / cols)) {
        return false;
    }

    out.rows = static_cast<int64_t>(rows);
    out.cols = static_cast<int64_t>(cols);
    out.values.clear();
    out.values.reserve(rows * cols);
    for (uint64_t i = 0; i < rows * cols; ++i) {
        uint64_t value = 0;
        get_u64(data, at, value);
        out.values.push_back(static_cast<int64_t>(value));
    }
    offset = at;
    return true;
}

MatrixRowBlockSplit::MatrixRowBlockSplit(size_t block_rows) : block_rows_(block_rows) {
    if (block_rows_ == 0) {
        throw std::invalid_argument("block rows must be positive");
    }
}

std::vector<Bytes> MatrixRowBlockSplit::split(const Bytes& input) const {
    Matrix a;
    Matrix b;
    size_t offset = 0;
    if (!Matrix::read(input, offset, a) || !Matrix::read(input, offset, b)) {
        throw SplitError("input is not two encoded matrices");
    }
    if (offset != input.size()) {
        throw SplitError("trailing bytes after matrices");
    }
    if (a.cols != b.rows) {
        throw SplitError("inner dimensions differ: " + std::to_string(a.cols) +
                         " vs " + std::to_string(b.rows));
    }
    if (a.rows == 0) {
        throw SplitError("left matrix has no rows");
    }

    Bytes b_encoded = b.encode();
    std::vector<Bytes> chunks;
    for (int64_t first = 0; first < a.rows; first += static_cast<int64_t>(block_rows_)) {
        int64_t count = std::min<int64_t>(static_cast<int64_t>(block_rows_), a.rows - first);
        Matrix block;
        block.rows = count;
        block.cols = a.cols;
        block.values.assign(a.values.begin() + first * a.cols,
                            a.values.begin() + (first + count) * a.cols);

        Bytes chunk = block.encode();
        chunk.insert(chunk.end(), b_encoded.begin(), b_encoded.end());
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

// ============================================================================
// Merges
// ============================================================================

Bytes ConcatMerge::merge(const std::vector<Bytes>& outputs) const {
    Bytes merged;
    for (const auto& output : outputs) {
        merged.insert(merged.end(), output.begin(), output.end());
    }
    return merged;
}

Bytes SumU64Merge::merge(const std::vector<Bytes>& outputs) const {
    uint64_t total = 0;
    for (size_t i = 0; i < outputs.size(); ++i) {
        size_t offset = 0;
        uint64_t value = 0;
        if (outputs[i].size() != 8 || !get_u64(outputs[i], offset, value)) {
            throw MergeError("output " + std::to_string(i) + " is not a u64");
        }
        total += value;
    }
    Bytes merged;
    put_u64(merged, total);
    return merged;
}

Bytes MatrixRowBlockMerge::merge(const std::vector<Bytes>& outputs) const {
    if (outputs.empty()) {
        throw MergeError("no row blocks to merge");
    }

    Matrix merged;
    for (size_t i = 0; i < outputs.size(); ++i) {
        Matrix block;
        size_t offset = 0;
        if (!Matrix::read(outputs[i], offset, block) || offset != outputs[i].size()) {
            throw MergeError("output " + std::to_string(i) + " is not an encoded matrix");
        }
        if (i == 0) {
            merged.cols = block.cols;
        } else if (block.cols != merged.cols) {
            throw MergeError("row block " + std::to_string(i) + " has " +
                             std::to_string(block.cols) + " columns, expected " +
                             std::to_string(merged.cols));
        }
        merged.rows += block.rows;
        merged.values.insert(merged.values.end(), block.values.begin(), block.values.end());
    }
    return merged.encode();
}

} // namespace vouchrun
