#pragma once

#include <string>
#include <vector>

namespace vouchrun {

// Binary SHA-256 Merkle tree over hex digests.
// Parents are SHA256(hex(left) + hex(right)); a level with an odd number
// of nodes pairs its last node with itself.
class MerkleTree {
public:
    // Throws std::invalid_argument when leaves is empty
    explicit MerkleTree(std::vector<std::string> leaves);

    const std::string& root() const;
    size_t leaf_count() const;

    // Leaf count rounded up to a power of two (2^depth)
    size_t padded_width() const;

    // Sibling hashes from leaf to root. Throws std::out_of_range.
    std::vector<std::string> proof(size_t index) const;

    static bool verify_proof(const std::string& root,
                             const std::string& leaf,
                             size_t index,
                             const std::vector<std::string>& proof);

    static std::string hash_pair(const std::string& left, const std::string& right);

private:
    std::vector<std::vector<std::string>> levels_;  // levels_[0] = leaves
};

} // namespace vouchrun
