#include "lucid/pipeline/merkle_builder.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/core/format.hpp"

namespace lucid::pipeline {
using crypto::SodiumInterop;

namespace {
    /// Largest power of two strictly below n (n >= 2).
    uint64_t SplitPoint(const uint64_t n) {
        uint64_t k = 1;
        while (k * 2 < n) {
            k *= 2;
        }
        return k;
    }
}

Result<Unit, PipelineFailure> MerkleBuilder::AddLeaf(const uint64_t index, const Hash256& leaf) {
    std::lock_guard guard(lock_);
    if (finalized_) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::MerkleStateError(
                compat::format("Leaf {} added after the tree was finalized", index)));
    }
    if (index != leaf_count_) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::MerkleStateError(
                compat::format("Leaf {} arrived out of order, expected {}", index, leaf_count_)));
    }

    ++leaf_count_;
    peaks_.push_back(Peak{0, leaf});
    while (peaks_.size() >= 2 &&
           peaks_[peaks_.size() - 1].height == peaks_[peaks_.size() - 2].height) {
        const Peak right = peaks_.back();
        peaks_.pop_back();
        Peak& left = peaks_.back();
        left.hash = SodiumInterop::HashPair(left.hash, right.hash);
        ++left.height;
    }
    return Result<Unit, PipelineFailure>::Ok(unit);
}

Hash256 MerkleBuilder::FoldPeaks() const {
    if (peaks_.empty()) {
        return EmptyRoot();
    }
    // Smaller perfect subtrees sit to the right; an unpaired subtree is
    // carried up unchanged until it meets its left neighbour.
    Hash256 acc = peaks_.back().hash;
    for (size_t i = peaks_.size() - 1; i-- > 0;) {
        acc = SodiumInterop::HashPair(peaks_[i].hash, acc);
    }
    return acc;
}

Result<Hash256, PipelineFailure> MerkleBuilder::Finalize(const uint64_t expected_count) {
    std::lock_guard guard(lock_);
    if (leaf_count_ != expected_count) {
        return Result<Hash256, PipelineFailure>::Err(
            PipelineFailure::MerkleStateError(
                compat::format("Finalize expected {} leaves, have {}", expected_count, leaf_count_)));
    }
    if (!finalized_) {
        root_ = FoldPeaks();
        finalized_ = true;
    }
    return Result<Hash256, PipelineFailure>::Ok(root_);
}

uint64_t MerkleBuilder::LeafCount() const {
    std::lock_guard guard(lock_);
    return leaf_count_;
}

size_t MerkleBuilder::PeakCount() const {
    std::lock_guard guard(lock_);
    return peaks_.size();
}

bool MerkleBuilder::IsFinalized() const {
    std::lock_guard guard(lock_);
    return finalized_;
}

Result<std::vector<HashStep>, PipelineFailure> MerkleBuilder::ProofFor(
    std::span<const Hash256> leaves,
    const uint64_t index) {
    if (index >= leaves.size()) {
        return Result<std::vector<HashStep>, PipelineFailure>::Err(
            PipelineFailure::MerkleStateError(
                compat::format("No leaf {} in a tree of {} leaves", index, leaves.size())));
    }
    std::vector<HashStep> path;
    CollectPath(leaves, index, path);
    return Result<std::vector<HashStep>, PipelineFailure>::Ok(std::move(path));
}

void MerkleBuilder::CollectPath(
    std::span<const Hash256> leaves,
    const uint64_t index,
    std::vector<HashStep>& path) {
    if (leaves.size() <= 1) {
        return;
    }
    const uint64_t k = SplitPoint(leaves.size());
    if (index < k) {
        CollectPath(leaves.first(k), index, path);
        path.push_back(HashStep{SubtreeRoot(leaves.subspan(k)), SiblingSide::Right});
    } else {
        CollectPath(leaves.subspan(k), index - k, path);
        path.push_back(HashStep{SubtreeRoot(leaves.first(k)), SiblingSide::Left});
    }
}

Hash256 MerkleBuilder::SubtreeRoot(std::span<const Hash256> leaves) {
    if (leaves.empty()) {
        return EmptyRoot();
    }
    if (leaves.size() == 1) {
        return leaves.front();
    }
    const uint64_t k = SplitPoint(leaves.size());
    return SodiumInterop::HashPair(SubtreeRoot(leaves.first(k)), SubtreeRoot(leaves.subspan(k)));
}

Hash256 MerkleBuilder::RootFromProof(const Hash256& leaf, std::span<const HashStep> steps) {
    Hash256 acc = leaf;
    for (const auto& step : steps) {
        acc = step.side == SiblingSide::Left
            ? SodiumInterop::HashPair(step.sibling, acc)
            : SodiumInterop::HashPair(acc, step.sibling);
    }
    return acc;
}

bool MerkleBuilder::VerifyProof(
    const Hash256& leaf,
    std::span<const HashStep> steps,
    const Hash256& expected_root) {
    const Hash256 root = RootFromProof(leaf, steps);
    return SodiumInterop::ConstantTimeEquals(root, expected_root);
}

Hash256 MerkleBuilder::ComputeRoot(std::span<const Hash256> leaves) {
    if (leaves.empty()) {
        return EmptyRoot();
    }
    std::vector<Hash256> level(leaves.begin(), leaves.end());
    while (level.size() > 1) {
        std::vector<Hash256> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i + 1 < level.size(); i += 2) {
            next.push_back(SodiumInterop::HashPair(level[i], level[i + 1]));
        }
        if (level.size() % 2 == 1) {
            next.push_back(level.back());
        }
        level = std::move(next);
    }
    return level.front();
}

Hash256 MerkleBuilder::EmptyRoot() {
    return SodiumInterop::Hash({});
}

}
