#pragma once

#include <libshieldpool/zkp/FieldElement.h>
#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace shieldpool {
namespace zkp {

/**
 * Round constants and MDS matrix for one Poseidon width.
 */
struct PoseidonParameters {
    size_t width = 0;          // t = arity + 1
    size_t fullRounds = 0;
    size_t partialRounds = 0;
    std::vector<FieldT> roundConstants;        // (fullRounds + partialRounds) * width
    std::vector<std::vector<FieldT>> mds;      // width x width
};

/**
 * Poseidon hash over the BN254 scalar field
 *
 * x^5 S-box, 8 full rounds, partial rounds as in circomlib. Constants are
 * derived with the Grain LFSR from the Poseidon reference rather than
 * shipped as tables, then checked against pinned known answers before the
 * engine accepts any input.
 *
 * One engine is constructed at startup and handed by reference to every
 * component that hashes. It is immutable once initialized and can be used
 * from any thread.
 */
class HashEngine {
public:
    static constexpr char const* circomParameterSet = "poseidon-bn254-x5-circom-v1";

    explicit HashEngine(std::string parameterSet = circomParameterSet);

    HashEngine(HashEngine const&) = delete;
    HashEngine& operator=(HashEngine const&) = delete;

    /**
     * Derives the constants and runs the known-answer checks.
     *
     * Runs at most once; later calls return immediately.
     * @throws std::invalid_argument for an unknown parameter set
     * @throws std::runtime_error if a known answer does not match
     */
    void initialize();

    /** initialize() on a background thread. */
    std::future<void> initializeAsync();

    bool isInitialized() const { return initialized_.load(std::memory_order_acquire); }
    std::string const& parameterSet() const { return parameterSet_; }

    // All of these throw NotInitializedError before initialize() completes.
    FieldT hash2(FieldT const& a, FieldT const& b) const;
    FieldT hash4(FieldT const& a, FieldT const& b, FieldT const& c, FieldT const& d) const;
    FieldT hash(std::vector<FieldT> const& inputs) const;

    PoseidonParameters const& parameters(size_t arity) const;

private:
    void derive();
    void checkKnownAnswers() const;
    FieldT permute(PoseidonParameters const& params, std::vector<FieldT> const& inputs) const;

    std::string const parameterSet_;
    std::once_flag once_;
    std::atomic<bool> initialized_{false};

    PoseidonParameters t3_;
    PoseidonParameters t5_;
};

} // namespace zkp
} // namespace shieldpool
