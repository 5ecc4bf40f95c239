#include "RelayPipeline.h"
#include <libshieldpool/zkp/AssetId.h>
#include <libshieldpool/zkp/ZkError.h>
#include <xrpl/basics/Log.h>
#include <xrpl/basics/StringUtilities.h>
#include <xrpl/basics/mulDiv.h>
#include <xrpl/beast/core/LexicalCast.h>
#include <algorithm>
#include <cctype>

namespace shieldpool {
namespace relay {

namespace {

bool
isHexOfLength(std::string const& s, std::size_t length)
{
    return s.size() == length && std::all_of(s.begin(), s.end(), [](unsigned char c) {
               return std::isxdigit(c) != 0;
           });
}

std::string
member(Json::Value const& json, char const* name)
{
    if (!json.isObject() || !json.isMember(name))
        return {};
    auto const& v = json[name];
    if (v.isString() || v.isIntegral())
        return v.asString();
    return {};
}

} // namespace

WithdrawRequest
WithdrawRequest::fromJson(Json::Value const& json)
{
    WithdrawRequest r;
    r.proofData = member(json, "proofData");
    r.merkleRoot = member(json, "merkleRoot");
    r.nullifierHash = member(json, "nullifierHash");
    r.recipient = member(json, "recipient");
    r.amount = member(json, "amount");
    r.assetId = member(json, "assetId");
    r.mint = member(json, "mint");
    return r;
}

WithdrawResult
WithdrawResult::accept(std::string signature)
{
    WithdrawResult r;
    r.accepted = true;
    r.signature = std::move(signature);
    return r;
}

WithdrawResult
WithdrawResult::reject(ErrorCategory category, std::string message)
{
    WithdrawResult r;
    r.category = category;
    r.error = std::move(message);
    return r;
}

Json::Value
WithdrawResult::toJson() const
{
    Json::Value json(Json::objectValue);
    json["success"] = accepted;
    if (signature)
        json["signature"] = *signature;
    if (error)
        json["error"] = *error;
    if (category)
        json["category"] = to_string(*category);
    return json;
}

RelayPipeline::RelayPipeline(
    PipelineSetup setup,
    zkp::ProofVerifier const& verifier,
    ledger::Ledger& ledger,
    ledger::Keypair const& operatorKey,
    ledger::PoolAddresses const& pool,
    NullifierCache& cache,
    RetryPolicy const& retry,
    beast::Journal journal)
    : setup_(std::move(setup))
    , verifier_(verifier)
    , ledger_(ledger)
    , operator_(operatorKey)
    , pool_(pool)
    , cache_(cache)
    , retry_(retry)
    , j_(journal)
{
}

std::uint64_t
RelayPipeline::fee(std::uint64_t amount) const
{
    // amount is capped well below the overflow point by validation
    return ripple::mulDiv(amount, setup_.feeBps, 10000).value_or(0);
}

ripple::Expected<RelayPipeline::Validated, RelayPipeline::Rejection>
RelayPipeline::validate(WithdrawRequest const& request) const
{
    auto reject = [this](char const* message) {
        JLOG(j_.debug()) << "rejected: " << message;
        return ripple::Unexpected(Rejection{ErrorCategory::Validation, message});
    };

    if (!isHexOfLength(request.proofData, 2 * zkp::ProofCodec::proofSize))
        return reject("Invalid proof data (must be 256 bytes hex)");
    if (!isHexOfLength(request.merkleRoot, 64))
        return reject("Invalid merkle root (must be 32 bytes hex)");
    if (!isHexOfLength(request.nullifierHash, 64))
        return reject("Invalid nullifier hash (must be 32 bytes hex)");
    if (!isHexOfLength(request.assetId, 64))
        return reject("Invalid asset ID (must be 32 bytes hex)");

    Validated v;
    auto const recipient = ledger::parseAddress(request.recipient);
    if (!recipient)
        return reject("Invalid recipient public key");
    v.recipient = *recipient;

    auto const mint = ledger::parseAddress(request.mint);
    if (!mint)
        return reject("Invalid mint public key");
    v.mint = *mint;

    if (request.amount.empty() || request.amount.size() > 20 ||
        !std::all_of(request.amount.begin(), request.amount.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        }) ||
        !beast::lexicalCastChecked(v.amount, request.amount) || v.amount == 0)
    {
        return reject("Invalid amount");
    }
    if (v.amount < setup_.minAmount)
        return reject("Amount below minimum withdrawal");
    if (v.amount > setup_.maxAmount)
        return reject("Amount above maximum withdrawal");

    // lengths and charset are checked above, so these cannot fail
    v.proof = *ripple::strUnHex(request.proofData);
    (void)v.merkleRoot.parseHex(request.merkleRoot);
    (void)v.nullifierHash.parseHex(request.nullifierHash);
    (void)v.assetId.parseHex(request.assetId);

    // zero is never a tree root or a nullifier the circuit can produce
    if (v.merkleRoot == beast::zero)
        return reject("Invalid merkle root (must be nonzero)");
    if (v.nullifierHash == beast::zero)
        return reject("Invalid nullifier hash (must be nonzero)");

    v.fee = fee(v.amount);
    return v;
}

std::optional<RelayPipeline::Rejection>
RelayPipeline::checkAsset(Validated const& v) const
{
    if (setup_.supportedAssets.count(v.assetId) == 0)
    {
        JLOG(j_.debug()) << "rejected: unsupported asset " << v.assetId;
        return Rejection{ErrorCategory::Validation, "Asset not supported by this relayer"};
    }
    if (zkp::deriveAssetId(ledger::slice(v.mint)) != v.assetId)
    {
        JLOG(j_.debug()) << "rejected: asset " << v.assetId << " does not belong to mint "
                         << ledger::toBase58(v.mint);
        return Rejection{ErrorCategory::Validation, "Asset ID does not match mint"};
    }
    return std::nullopt;
}

std::optional<RelayPipeline::Rejection>
RelayPipeline::verifyLocally(Validated const& v) const
{
    for (auto const* value : {&v.merkleRoot, &v.nullifierHash, &v.assetId})
    {
        if (!zkp::field::isCanonical(*value))
        {
            JLOG(j_.debug()) << "rejected: public input " << *value << " out of field";
            return Rejection{ErrorCategory::Validation, "Public input is not a field element"};
        }
    }

    zkp::Groth16Proof proof;
    try
    {
        proof = zkp::ProofCodec::deserialize(ripple::Slice(v.proof.data(), v.proof.size()));
    }
    catch (zkp::OutOfRangeError const& e)
    {
        JLOG(j_.debug()) << "rejected: " << e.what();
        return Rejection{ErrorCategory::Validation, "Invalid proof encoding"};
    }

    // Order fixed by the withdraw circuit.
    std::vector<zkp::FieldT> const inputs{
        zkp::field::fromUint256(v.merkleRoot),
        zkp::field::fromUint256(v.nullifierHash),
        zkp::field::fromUint256(v.assetId),
        zkp::addressToScalar(ledger::slice(v.recipient)),
        zkp::field::fromUint64(v.amount),
        zkp::addressToScalar(ledger::slice(operator_.publicKey())),
        zkp::field::fromUint64(v.fee),
        zkp::FieldT::zero(),
    };

    if (!verifier_.verify(proof, inputs))
    {
        JLOG(j_.debug()) << "rejected: proof for nullifier " << v.nullifierHash
                         << " failed verification";
        return Rejection{ErrorCategory::Validation, "Proof verification failed"};
    }
    return std::nullopt;
}

std::optional<RelayPipeline::Rejection>
RelayPipeline::checkDoubleSpend(Validated const& v)
{
    if (cache_.lookup(v.nullifierHash).has_value())
    {
        JLOG(j_.debug()) << "nullifier " << v.nullifierHash << " spent (cached)";
        return Rejection{ErrorCategory::StateConflict, "Nullifier already spent"};
    }

    try
    {
        if (ledger_.getAccount(pool_.nullifierMarker(v.nullifierHash)))
        {
            cache_.markSpent(v.nullifierHash);
            JLOG(j_.debug()) << "nullifier " << v.nullifierHash << " spent on ledger";
            return Rejection{ErrorCategory::StateConflict, "Nullifier already spent"};
        }
    }
    catch (ledger::LedgerError const& e)
    {
        auto const category = classify(e.what());
        JLOG(j_.warn()) << "nullifier status unavailable [" << to_string(category)
                        << "]: " << e.what();
        return Rejection{category, publicMessage(category)};
    }
    return std::nullopt;
}

ripple::Expected<std::string, RelayPipeline::Rejection>
RelayPipeline::submit(Validated const& v)
{
    ledger::WithdrawArgs args;
    args.proof = v.proof;
    args.merkleRoot = v.merkleRoot;
    args.nullifierHash = v.nullifierHash;
    args.recipient = v.recipient;
    args.amount = v.amount;
    args.assetId = v.assetId;
    args.relayerFee = v.fee;

    auto const instruction =
        ledger::makeWithdrawInstruction(pool_, operator_.publicKey(), v.mint, args);

    auto outcome = retry_.run([&] {
        auto const message = ledger::Message::compile(
            operator_.publicKey(), {instruction}, ledger_.latestBlockhash());
        auto const tx = ledger::signTransaction(message, operator_);
        return ledger_.submitTransaction(ripple::Slice(tx.wire.data(), tx.wire.size()));
    });

    if (!outcome)
    {
        auto const& failure = outcome.error();
        if (failure.category == ErrorCategory::Unknown)
        {
            JLOG(j_.error()) << "submission failed after " << failure.attempts
                             << " attempts: " << failure.message;
        }
        else
        {
            JLOG(j_.warn()) << "submission failed [" << to_string(failure.category)
                            << "] after " << failure.attempts << " attempts: " << failure.message;
        }
        return ripple::Unexpected(Rejection{failure.category, publicMessage(failure.category)});
    }
    return std::move(*outcome);
}

void
RelayPipeline::account(Validated const& v)
{
    ++totalTransactions_;
    totalFeesEarned_ += v.fee;
    cache_.markSpent(v.nullifierHash);
}

WithdrawResult
RelayPipeline::process(WithdrawRequest const& request)
{
    auto const validated = validate(request);
    if (!validated)
        return WithdrawResult::reject(validated.error().category, validated.error().message);
    auto const& v = *validated;

    if (auto const r = checkAsset(v))
        return WithdrawResult::reject(r->category, r->message);

    if (auto const r = verifyLocally(v))
        return WithdrawResult::reject(r->category, r->message);

    if (auto const r = checkDoubleSpend(v))
        return WithdrawResult::reject(r->category, r->message);

    auto signature = submit(v);
    if (!signature)
        return WithdrawResult::reject(signature.error().category, signature.error().message);

    account(v);
    JLOG(j_.info()) << "withdrawal " << *signature << ": " << v.amount << " to "
                    << ledger::toBase58(v.recipient) << ", fee " << v.fee;
    return WithdrawResult::accept(std::move(*signature));
}

} // namespace relay
} // namespace shieldpool
