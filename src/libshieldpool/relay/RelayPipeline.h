#pragma once

#include <libshieldpool/ledger/Keypair.h>
#include <libshieldpool/ledger/Ledger.h>
#include <libshieldpool/ledger/WithdrawInstruction.h>
#include <libshieldpool/relay/ErrorClassifier.h>
#include <libshieldpool/relay/NullifierCache.h>
#include <libshieldpool/relay/RetryPolicy.h>
#include <libshieldpool/zkp/ProofVerifier.h>
#include <xrpl/basics/Expected.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>
#include <atomic>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace shieldpool {
namespace relay {

/** Withdrawal request exactly as the client sent it. */
struct WithdrawRequest
{
    std::string proofData;      // 512 hex chars
    std::string merkleRoot;     // 64 hex chars
    std::string nullifierHash;  // 64 hex chars
    std::string recipient;      // base58
    std::string amount;         // decimal base units
    std::string assetId;        // 64 hex chars
    std::string mint;           // base58

    /** Missing or non-string members become empty and fail validation. */
    static WithdrawRequest
    fromJson(Json::Value const& json);
};

struct WithdrawResult
{
    bool accepted = false;
    std::optional<std::string> signature;
    std::optional<std::string> error;
    std::optional<ErrorCategory> category;

    static WithdrawResult
    accept(std::string signature);

    static WithdrawResult
    reject(ErrorCategory category, std::string message);

    Json::Value
    toJson() const;
};

struct PipelineSetup
{
    std::uint16_t feeBps = 50;
    std::uint64_t minAmount = 1000000;
    std::uint64_t maxAmount = 1000000000000;
    std::set<ripple::uint256> supportedAssets;
};

/**
    Validates, verifies and submits withdrawals on behalf of clients.

    Each request runs through the stages in order and stops at the first
    rejection:

        validate -> asset gate -> local verify -> double spend -> submit

    Structural checks run before any cryptographic or network work. Only
    submission is retried. Safe to call from many threads at once.
*/
class RelayPipeline
{
public:
    RelayPipeline(
        PipelineSetup setup,
        zkp::ProofVerifier const& verifier,
        ledger::Ledger& ledger,
        ledger::Keypair const& operatorKey,
        ledger::PoolAddresses const& pool,
        NullifierCache& cache,
        RetryPolicy const& retry,
        beast::Journal journal);

    WithdrawResult
    process(WithdrawRequest const& request);

    /** floor(amount * feeBps / 10000) */
    std::uint64_t
    fee(std::uint64_t amount) const;

    PipelineSetup const&
    setup() const
    {
        return setup_;
    }

    ledger::Address const&
    operatorAddress() const
    {
        return operator_.publicKey();
    }

    bool
    proofVerificationEnabled() const
    {
        return verifier_.enabled();
    }

    std::uint64_t
    totalTransactions() const
    {
        return totalTransactions_.load();
    }

    std::uint64_t
    totalFeesEarned() const
    {
        return totalFeesEarned_.load();
    }

private:
    struct Rejection
    {
        ErrorCategory category;
        std::string message;
    };

    struct Validated
    {
        ripple::Blob proof;
        ripple::uint256 merkleRoot;
        ripple::uint256 nullifierHash;
        ripple::uint256 assetId;
        ledger::Address recipient;
        ledger::Address mint;
        std::uint64_t amount = 0;
        std::uint64_t fee = 0;
    };

    ripple::Expected<Validated, Rejection>
    validate(WithdrawRequest const& request) const;

    std::optional<Rejection>
    checkAsset(Validated const& v) const;

    std::optional<Rejection>
    verifyLocally(Validated const& v) const;

    std::optional<Rejection>
    checkDoubleSpend(Validated const& v);

    ripple::Expected<std::string, Rejection>
    submit(Validated const& v);

    void
    account(Validated const& v);

    PipelineSetup const setup_;
    zkp::ProofVerifier const& verifier_;
    ledger::Ledger& ledger_;
    ledger::Keypair const& operator_;
    ledger::PoolAddresses const& pool_;
    NullifierCache& cache_;
    RetryPolicy const& retry_;
    beast::Journal j_;

    std::atomic<std::uint64_t> totalTransactions_{0};
    std::atomic<std::uint64_t> totalFeesEarned_{0};
};

} // namespace relay
} // namespace shieldpool
