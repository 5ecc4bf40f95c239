#pragma once

#include <libshieldpool/zkp/HashEngine.h>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace shieldpool {
namespace zkp {

/**
 * Membership proof for one leaf
 */
struct MerkleProof {
    FieldT leaf;
    std::uint64_t leafIndex = 0;
    std::vector<FieldT> pathElements;   // sibling hashes, leaf level first
    std::vector<std::uint8_t> pathIndices;  // 0 = node is left child, 1 = right
    FieldT root;
};

/**
 * Incremental Merkle Tree mirroring the pool's on-ledger commitment tree
 *
 * Append-only, Poseidon Hash2 for internal nodes, empty leaves are zero.
 * Insertion is O(depth) using the filled-subtree frontier; proof generation
 * recomputes the levels from the stored leaves.
 *
 * Not thread-safe. One owner (a wallet or a sync task) mutates it.
 */
class MerkleAccumulator {
public:
    static constexpr std::size_t MIN_DEPTH = 4;
    static constexpr std::size_t MAX_DEPTH = 24;
    static constexpr std::size_t DEFAULT_ROOT_HISTORY = 100;
    static constexpr std::size_t MIN_ROOT_HISTORY = 30;

    MerkleAccumulator(
        HashEngine const& hasher,
        std::size_t depth,
        std::size_t rootHistorySize = DEFAULT_ROOT_HISTORY);

    // Core operations
    std::uint64_t insert(FieldT const& leaf);
    MerkleProof generateProof(std::uint64_t leafIndex) const;
    bool verifyProof(MerkleProof const& proof) const;

    /**
     * True for the current root or a root still held in the local history.
     * The ledger keeps its own window and has the final say.
     */
    bool isKnownRoot(FieldT const& root) const;

    /** Root right after the given leaf was inserted, if still retained. */
    std::optional<FieldT> rootAtIndex(std::uint64_t leafIndex) const;

    /** Append every ledger leaf beyond the ones already held. */
    void sync(std::vector<FieldT> const& ledgerLeaves);

    // State
    FieldT const& root() const { return root_; }
    std::uint64_t size() const { return nextIndex_; }
    std::uint64_t capacity() const { return std::uint64_t{1} << depth_; }
    bool isFull() const { return nextIndex_ >= capacity(); }
    std::size_t depth() const { return depth_; }
    FieldT const& zero(std::size_t level) const { return zeros_.at(level); }
    std::deque<FieldT> const& rootHistory() const { return rootHistory_; }

    // Persistence: {depth, nextIndex, leaves, rootHistory, root}
    std::string serialize() const;

    /**
     * Rebuilds the frontier by replaying every leaf.
     * @throws std::invalid_argument if the stored root does not match
     */
    static MerkleAccumulator deserialize(HashEngine const& hasher, std::string const& text);

private:
    void recordRoot(FieldT const& previous);

    HashEngine const& hasher_;
    std::size_t depth_;
    std::size_t historySize_;

    std::uint64_t nextIndex_ = 0;
    std::vector<FieldT> zeros_;           // zeros_[i]: empty subtree of height i
    std::vector<FieldT> filledSubtrees_;  // last left-hand node per level
    std::vector<FieldT> leaves_;
    std::deque<FieldT> rootHistory_;      // roots before each retained insertion
    FieldT root_;
};

} // namespace zkp
} // namespace shieldpool
