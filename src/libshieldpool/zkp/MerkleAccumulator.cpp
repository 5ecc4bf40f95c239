#include "MerkleAccumulator.h"
#include "ZkError.h"
#include <xrpl/json/json_reader.h>
#include <xrpl/json/json_value.h>
#include <xrpl/json/to_string.h>
#include <algorithm>
#include <stdexcept>

namespace shieldpool {
namespace zkp {

MerkleAccumulator::MerkleAccumulator(
    HashEngine const& hasher,
    std::size_t depth,
    std::size_t rootHistorySize)
    : hasher_(hasher), depth_(depth), historySize_(rootHistorySize) {
    if (depth < MIN_DEPTH || depth > MAX_DEPTH) {
        throw std::invalid_argument(
            "Tree depth must be between " + std::to_string(MIN_DEPTH) + " and " +
            std::to_string(MAX_DEPTH));
    }
    if (rootHistorySize < MIN_ROOT_HISTORY) {
        throw std::invalid_argument(
            "Root history must hold at least " + std::to_string(MIN_ROOT_HISTORY) + " roots");
    }

    // Level 0 (leaves): empty leaf is zero
    // Higher levels: hash(zeros[i-1], zeros[i-1])
    zeros_.resize(depth_ + 1);
    zeros_[0] = FieldT::zero();
    for (std::size_t i = 1; i <= depth_; ++i)
        zeros_[i] = hasher_.hash2(zeros_[i - 1], zeros_[i - 1]);

    filledSubtrees_.assign(zeros_.begin(), zeros_.begin() + depth_);
    root_ = zeros_[depth_];
}

void MerkleAccumulator::recordRoot(FieldT const& previous) {
    rootHistory_.push_back(previous);
    while (rootHistory_.size() > historySize_)
        rootHistory_.pop_front();
}

std::uint64_t MerkleAccumulator::insert(FieldT const& leaf) {
    if (isFull())
        throw TreeFullError("Merkle tree is full");

    std::uint64_t const leafIndex = nextIndex_;
    std::uint64_t index = leafIndex;
    FieldT current = leaf;

    for (std::size_t level = 0; level < depth_; ++level) {
        if ((index & 1) == 0) {
            // Left child: the right sibling is still empty
            filledSubtrees_[level] = current;
            current = hasher_.hash2(current, zeros_[level]);
        } else {
            current = hasher_.hash2(filledSubtrees_[level], current);
        }
        index >>= 1;
    }

    leaves_.push_back(leaf);
    recordRoot(root_);
    root_ = current;
    ++nextIndex_;
    return leafIndex;
}

MerkleProof MerkleAccumulator::generateProof(std::uint64_t leafIndex) const {
    if (leafIndex >= nextIndex_)
        throw InvalidIndexError("Invalid leaf index: " + std::to_string(leafIndex));

    MerkleProof proof;
    proof.leaf = leaves_[leafIndex];
    proof.leafIndex = leafIndex;
    proof.root = root_;
    proof.pathElements.reserve(depth_);
    proof.pathIndices.reserve(depth_);

    // Only the populated prefix of each level is materialized; anything to
    // the right of it is the empty subtree of that height.
    std::vector<FieldT> level(leaves_.begin(), leaves_.end());
    std::uint64_t index = leafIndex;

    for (std::size_t height = 0; height < depth_; ++height) {
        std::uint64_t const sibling = index ^ 1;
        proof.pathElements.push_back(sibling < level.size() ? level[sibling] : zeros_[height]);
        proof.pathIndices.push_back(static_cast<std::uint8_t>(index & 1));

        std::vector<FieldT> parent;
        parent.reserve((level.size() + 1) / 2);
        for (std::size_t i = 0; i < level.size(); i += 2) {
            auto const& right = i + 1 < level.size() ? level[i + 1] : zeros_[height];
            parent.push_back(hasher_.hash2(level[i], right));
        }
        level.swap(parent);
        index >>= 1;
    }

    return proof;
}

bool MerkleAccumulator::verifyProof(MerkleProof const& proof) const {
    if (proof.pathElements.size() != depth_ || proof.pathIndices.size() != depth_)
        return false;

    FieldT current = proof.leaf;
    for (std::size_t i = 0; i < depth_; ++i) {
        switch (proof.pathIndices[i]) {
            case 0:
                current = hasher_.hash2(current, proof.pathElements[i]);
                break;
            case 1:
                current = hasher_.hash2(proof.pathElements[i], current);
                break;
            default:
                return false;
        }
    }
    return current == proof.root;
}

bool MerkleAccumulator::isKnownRoot(FieldT const& root) const {
    if (root == root_)
        return true;
    return std::find(rootHistory_.begin(), rootHistory_.end(), root) != rootHistory_.end();
}

std::optional<FieldT> MerkleAccumulator::rootAtIndex(std::uint64_t leafIndex) const {
    if (leafIndex >= nextIndex_)
        return std::nullopt;
    if (leafIndex + 1 == nextIndex_)
        return root_;

    // rootHistory_.back() is the root before the latest insertion, i.e. the
    // root right after leaf nextIndex_ - 2.
    std::uint64_t const age = nextIndex_ - 1 - leafIndex;
    if (age > rootHistory_.size())
        return std::nullopt;
    return rootHistory_[rootHistory_.size() - age];
}

void MerkleAccumulator::sync(std::vector<FieldT> const& ledgerLeaves) {
    for (std::size_t i = nextIndex_; i < ledgerLeaves.size(); ++i)
        insert(ledgerLeaves[i]);
}

std::string MerkleAccumulator::serialize() const {
    Json::Value json(Json::objectValue);
    json["depth"] = static_cast<Json::UInt>(depth_);
    json["rootHistorySize"] = static_cast<Json::UInt>(historySize_);
    json["nextIndex"] = std::to_string(nextIndex_);
    json["root"] = field::toDecimal(root_);

    Json::Value& leaves = json["leaves"] = Json::Value(Json::arrayValue);
    for (auto const& leaf : leaves_)
        leaves.append(field::toDecimal(leaf));

    Json::Value& history = json["rootHistory"] = Json::Value(Json::arrayValue);
    for (auto const& r : rootHistory_)
        history.append(field::toDecimal(r));

    return Json::to_string(json);
}

MerkleAccumulator MerkleAccumulator::deserialize(HashEngine const& hasher, std::string const& text) {
    Json::Value json;
    Json::Reader reader;
    if (!reader.parse(text, json) || !json.isObject())
        throw std::invalid_argument("merkle state: malformed JSON");

    auto const& leaves = json["leaves"];
    auto const& history = json["rootHistory"];
    if (!json["depth"].isIntegral() || !json["nextIndex"].isString() || !json["root"].isString() ||
        !leaves.isArray() || !history.isArray()) {
        throw std::invalid_argument("merkle state: missing fields");
    }

    std::size_t historySize = DEFAULT_ROOT_HISTORY;
    if (json.isMember("rootHistorySize") && json["rootHistorySize"].isIntegral())
        historySize = json["rootHistorySize"].asUInt();

    MerkleAccumulator tree(hasher, json["depth"].asUInt(), historySize);

    // filledSubtrees is derived state: replay rather than trust it
    for (Json::UInt i = 0; i < leaves.size(); ++i)
        tree.insert(field::fromDecimal(leaves[i].asString()));

    if (json["nextIndex"].asString() != std::to_string(tree.nextIndex_))
        throw std::invalid_argument("merkle state: nextIndex does not match leaves");
    if (field::fromDecimal(json["root"].asString()) != tree.root_)
        throw std::invalid_argument("merkle state: stored root does not match leaves");

    tree.rootHistory_.clear();
    for (Json::UInt i = 0; i < history.size(); ++i)
        tree.recordRoot(field::fromDecimal(history[i].asString()));

    return tree;
}

} // namespace zkp
} // namespace shieldpool
