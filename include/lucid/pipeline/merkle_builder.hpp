#pragma once

#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

namespace lucid::pipeline {

enum class SiblingSide : uint8_t {
    Left,
    Right
};

/// One level of an inclusion proof: the sibling digest and the side it sits on.
struct HashStep {
    Hash256 sibling{};
    SiblingSide side = SiblingSide::Right;

    bool operator==(const HashStep&) const = default;
};

/**
 * @brief Incremental binary Merkle tree over ciphertext hashes
 *
 * Inner node = H(left || right). A node without a partner on its level is
 * promoted to the next level unchanged. Leaves must arrive in index order.
 *
 * The root is folded from a forest of completed perfect subtrees (one per
 * set bit of the leaf count), so AddLeaf is O(1) amortized and the working
 * set is O(log n). Leaf digests are not kept; inclusion proofs are built by
 * the static ProofFor over the ordered leaf list of a sealed session.
 *
 * The tree of zero leaves has root H(""), the tree of one leaf has the
 * leaf itself as root.
 *
 * Thread-safe.
 */
class MerkleBuilder {
public:
    MerkleBuilder() = default;

    /// MerkleStateError unless @p index equals LeafCount() and the tree is
    /// not finalized.
    Result<Unit, PipelineFailure> AddLeaf(uint64_t index, const Hash256& leaf);

    /// MerkleStateError unless exactly @p expected_count leaves were added.
    /// Idempotent once it has succeeded.
    Result<Hash256, PipelineFailure> Finalize(uint64_t expected_count);

    [[nodiscard]] uint64_t LeafCount() const;

    /// Number of perfect subtrees currently held, popcount(LeafCount()).
    [[nodiscard]] size_t PeakCount() const;

    [[nodiscard]] bool IsFinalized() const;

    /// Root obtained by folding @p steps onto @p leaf.
    [[nodiscard]] static Hash256 RootFromProof(const Hash256& leaf, std::span<const HashStep> steps);

    [[nodiscard]] static bool VerifyProof(
        const Hash256& leaf,
        std::span<const HashStep> steps,
        const Hash256& expected_root);

    /// Inclusion proof of leaf @p index in the tree over @p leaves.
    /// MerkleStateError when @p index is out of range.
    [[nodiscard]] static Result<std::vector<HashStep>, PipelineFailure> ProofFor(
        std::span<const Hash256> leaves,
        uint64_t index);

    /// Level-by-level reference construction over a complete leaf list.
    [[nodiscard]] static Hash256 ComputeRoot(std::span<const Hash256> leaves);

    [[nodiscard]] static Hash256 EmptyRoot();

private:
    struct Peak {
        uint32_t height;
        Hash256 hash;
    };

    [[nodiscard]] Hash256 FoldPeaks() const;

    static Hash256 SubtreeRoot(std::span<const Hash256> leaves);
    static void CollectPath(std::span<const Hash256> leaves, uint64_t index, std::vector<HashStep>& path);

    mutable std::mutex lock_;
    std::vector<Peak> peaks_;
    uint64_t leaf_count_ = 0;
    bool finalized_ = false;
    Hash256 root_{};
};

}
