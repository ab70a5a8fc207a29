#include "merkle.h"
#include "hash_utils.h"
#include <stdexcept>

namespace vouchrun {

MerkleTree::MerkleTree(std::vector<std::string> leaves) {
    if (leaves.empty()) {
        throw std::invalid_argument("Merkle tree needs at least one leaf");
    }

    levels_.push_back(std::move(leaves));
    while (levels_.back().size() > 1) {
        const auto& level = levels_.back();
        std::vector<std::string> parents;
        parents.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            const auto& left = level[i];
            const auto& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
            parents.push_back(hash_pair(left, right));
        }
        levels_.push_back(std::move(parents));
    }
}

const std::string& MerkleTree::root() const {
    return levels_.back().front();
}

size_t MerkleTree::leaf_count() const {
    return levels_.front().size();
}

size_t MerkleTree::padded_width() const {
    return size_t(1) << (levels_.size() - 1);
}

std::vector<std::string> MerkleTree::proof(size_t index) const {
    if (index >= leaf_count()) {
        throw std::out_of_range("Merkle leaf index " + std::to_string(index) + " out of range");
    }

    std::vector<std::string> path;
    for (size_t depth = 0; depth + 1 < levels_.size(); ++depth) {
        const auto& level = levels_[depth];
        size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
        if (sibling >= level.size()) {
            sibling = index;
        }
        path.push_back(level[sibling]);
        index /= 2;
    }
    return path;
}

bool MerkleTree::verify_proof(const std::string& root,
                              const std::string& leaf,
                              size_t index,
                              const std::vector<std::string>& proof) {
    std::string hash = leaf;
    for (const auto& sibling : proof) {
        hash = (index % 2 == 0) ? hash_pair(hash, sibling) : hash_pair(sibling, hash);
        index /= 2;
    }
    return index == 0 && hash == root;
}

std::string MerkleTree::hash_pair(const std::string& left, const std::string& right) {
    return HashUtils::sha256_string(left + right);
}

} // namespace vouchrun
