#pragma once

#include <libshieldpool/zkp/FieldElement.h>
#include <libshieldpool/zkp/HashEngine.h>
#include <xrpl/basics/Blob.h>
#include <xrpl/json/json_value.h>
#include <cstdint>
#include <optional>
#include <string>

namespace shieldpool {
namespace zkp {

/**
 * Note structure
 * A note contains:
 * - secret: commitment randomness, never revealed
 * - nullifierSeed: revealed only through the nullifier hash
 * - amount: base units of the asset
 * - assetId: asset identifier as a field element
 * - commitment: Hash4(secret, nullifierSeed, amount, assetId)
 *
 * Deposit metadata is attached once the ledger confirms the deposit.
 */
struct Note {
    FieldT secret;
    FieldT nullifierSeed;
    std::uint64_t amount = 0;
    FieldT assetId;
    FieldT commitment;

    std::optional<std::uint64_t> leafIndex;
    std::optional<FieldT> depositRoot;
    std::optional<std::uint64_t> depositTimestamp;
    std::optional<std::string> depositReference;

    bool isDeposited() const { return leafIndex.has_value(); }
};

/**
 * Builds notes and derives everything that depends on the hash:
 * commitments, nullifier hashes, storage encoding and at-rest encryption.
 */
class NoteManager {
public:
    static constexpr unsigned pbkdf2Iterations = 100000;
    static constexpr std::size_t saltSize = 16;
    static constexpr std::size_t nonceSize = 12;
    static constexpr std::size_t tagSize = 16;
    static constexpr std::uint8_t encryptionVersion = 1;

    explicit NoteManager(HashEngine const& hasher);

    /** Fresh note with random secret and nullifier seed. */
    Note create(std::uint64_t amount, FieldT const& assetId) const;

    /**
     * Restore a note from backed-up secrets. The commitment is always
     * recomputed.
     *
     * @throws CommitmentMismatchError if expectedCommitment is given and
     *         differs from the recomputed one
     */
    Note fromRecovery(
        FieldT const& secret,
        FieldT const& nullifierSeed,
        std::uint64_t amount,
        FieldT const& assetId,
        std::optional<std::uint64_t> leafIndex = std::nullopt,
        std::optional<FieldT> depositRoot = std::nullopt,
        std::optional<FieldT> expectedCommitment = std::nullopt) const;

    FieldT computeCommitment(
        FieldT const& secret,
        FieldT const& nullifierSeed,
        std::uint64_t amount,
        FieldT const& assetId) const;

    /**
     * Hash2(Hash2(nullifierSeed, secret), leafIndex)
     *
     * @throws MissingLeafIndexError if the deposit is not confirmed yet
     */
    FieldT computeNullifierHash(Note const& note) const;

    /** Attach ledger position once the deposit is confirmed. */
    static void markDeposited(
        Note& note,
        std::uint64_t leafIndex,
        FieldT const& root,
        std::optional<std::uint64_t> timestamp = std::nullopt,
        std::optional<std::string> reference = std::nullopt);

    // Storage format: JSON object, field elements as decimal strings.
    Json::Value toJson(Note const& note) const;
    Note fromJson(Json::Value const& json) const;
    std::string serialize(Note const& note) const;
    Note deserialize(std::string const& text) const;

    /**
     * Encrypt a note under a passphrase.
     *
     * Layout: version || salt || nonce || ciphertext || tag, with
     * PBKDF2-HMAC-SHA256 key derivation and AES-256-GCM.
     */
    ripple::Blob encrypt(Note const& note, std::string const& passphrase) const;

    /** @throws DecryptionFailedError on any authentication failure */
    Note decrypt(ripple::Slice blob, std::string const& passphrase) const;

private:
    HashEngine const& hasher_;
};

} // namespace zkp
} // namespace shieldpool
