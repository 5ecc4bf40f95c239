#include "Note.h"
#include "ZkError.h"
#include <xrpl/beast/core/LexicalCast.h>
#include <xrpl/json/json_reader.h>
#include <xrpl/json/to_string.h>
#include <algorithm>

namespace shieldpool {
namespace zkp {

namespace {

std::string requireString(Json::Value const& json, char const* key) {
    if (!json.isMember(key) || !json[key].isString())
        throw std::invalid_argument(std::string("note: missing field ") + key);
    return json[key].asString();
}

std::uint64_t parseUint64(std::string const& text, char const* what) {
    std::uint64_t value = 0;
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; }) ||
        !beast::lexicalCastChecked(value, text)) {
        throw std::invalid_argument(std::string("note: invalid ") + what);
    }
    return value;
}

} // namespace

NoteManager::NoteManager(HashEngine const& hasher) : hasher_(hasher) {}

FieldT NoteManager::computeCommitment(
    FieldT const& secret,
    FieldT const& nullifierSeed,
    std::uint64_t amount,
    FieldT const& assetId) const {
    return hasher_.hash4(secret, nullifierSeed, field::fromUint64(amount), assetId);
}

Note NoteManager::create(std::uint64_t amount, FieldT const& assetId) const {
    Note note;
    note.secret = field::random();
    note.nullifierSeed = field::random();
    note.amount = amount;
    note.assetId = assetId;
    note.commitment = computeCommitment(note.secret, note.nullifierSeed, amount, assetId);
    return note;
}

Note NoteManager::fromRecovery(
    FieldT const& secret,
    FieldT const& nullifierSeed,
    std::uint64_t amount,
    FieldT const& assetId,
    std::optional<std::uint64_t> leafIndex,
    std::optional<FieldT> depositRoot,
    std::optional<FieldT> expectedCommitment) const {
    Note note;
    note.secret = secret;
    note.nullifierSeed = nullifierSeed;
    note.amount = amount;
    note.assetId = assetId;
    note.commitment = computeCommitment(secret, nullifierSeed, amount, assetId);
    note.leafIndex = leafIndex;
    note.depositRoot = std::move(depositRoot);

    if (expectedCommitment && *expectedCommitment != note.commitment) {
        throw CommitmentMismatchError("recovered note does not match its commitment");
    }
    return note;
}

FieldT NoteManager::computeNullifierHash(Note const& note) const {
    if (!note.leafIndex)
        throw MissingLeafIndexError("nullifier hash needs the note's leaf index");

    auto const inner = hasher_.hash2(note.nullifierSeed, note.secret);
    return hasher_.hash2(inner, field::fromUint64(*note.leafIndex));
}

void NoteManager::markDeposited(
    Note& note,
    std::uint64_t leafIndex,
    FieldT const& root,
    std::optional<std::uint64_t> timestamp,
    std::optional<std::string> reference) {
    note.leafIndex = leafIndex;
    note.depositRoot = root;
    note.depositTimestamp = timestamp;
    note.depositReference = std::move(reference);
}

Json::Value NoteManager::toJson(Note const& note) const {
    Json::Value json(Json::objectValue);
    json["secret"] = field::toDecimal(note.secret);
    json["nullifierSeed"] = field::toDecimal(note.nullifierSeed);
    json["amount"] = std::to_string(note.amount);
    json["assetId"] = field::toDecimal(note.assetId);
    json["commitment"] = field::toDecimal(note.commitment);

    if (note.leafIndex)
        json["leafIndex"] = std::to_string(*note.leafIndex);
    if (note.depositRoot)
        json["depositRoot"] = field::toDecimal(*note.depositRoot);
    if (note.depositTimestamp)
        json["depositTimestamp"] = std::to_string(*note.depositTimestamp);
    if (note.depositReference)
        json["depositReference"] = *note.depositReference;
    return json;
}

Note NoteManager::fromJson(Json::Value const& json) const {
    if (!json.isObject())
        throw std::invalid_argument("note: expected an object");

    std::optional<std::uint64_t> leafIndex;
    if (json.isMember("leafIndex"))
        leafIndex = parseUint64(requireString(json, "leafIndex"), "leafIndex");

    std::optional<FieldT> depositRoot;
    if (json.isMember("depositRoot"))
        depositRoot = field::fromDecimal(requireString(json, "depositRoot"));

    // The stored commitment is only used as a check, never trusted.
    auto note = fromRecovery(
        field::fromDecimal(requireString(json, "secret")),
        field::fromDecimal(requireString(json, "nullifierSeed")),
        parseUint64(requireString(json, "amount"), "amount"),
        field::fromDecimal(requireString(json, "assetId")),
        leafIndex,
        depositRoot,
        field::fromDecimal(requireString(json, "commitment")));

    if (json.isMember("depositTimestamp"))
        note.depositTimestamp =
            parseUint64(requireString(json, "depositTimestamp"), "depositTimestamp");
    if (json.isMember("depositReference"))
        note.depositReference = requireString(json, "depositReference");

    return note;
}

std::string NoteManager::serialize(Note const& note) const {
    return Json::to_string(toJson(note));
}

Note NoteManager::deserialize(std::string const& text) const {
    Json::Value json;
    Json::Reader reader;
    if (!reader.parse(text, json))
        throw std::invalid_argument("note: malformed JSON");
    return fromJson(json);
}

} // namespace zkp
} // namespace shieldpool
