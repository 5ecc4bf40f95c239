#include "NoteStore.h"
#include <xrpl/json/json_reader.h>
#include <xrpl/json/to_string.h>
#include <limits>
#include <stdexcept>

namespace shieldpool {
namespace zkp {

NoteStore::NoteStore(NoteManager const& notes) : manager_(notes) {}

void NoteStore::add(Note const& note) {
    auto const key = field::toUint256(note.commitment);
    if (!notes_.emplace(key, note).second)
        throw std::invalid_argument("note already stored");
}

std::optional<Note> NoteStore::get(FieldT const& commitment) const {
    auto const it = notes_.find(field::toUint256(commitment));
    if (it == notes_.end())
        return std::nullopt;
    return it->second;
}

bool NoteStore::remove(FieldT const& commitment) {
    return notes_.erase(field::toUint256(commitment)) != 0;
}

std::vector<Note> NoteStore::getByAsset(FieldT const& assetId) const {
    std::vector<Note> result;
    for (auto const& [key, note] : notes_) {
        if (note.assetId == assetId)
            result.push_back(note);
    }
    return result;
}

std::uint64_t NoteStore::getBalance(FieldT const& assetId) const {
    std::uint64_t total = 0;
    for (auto const& [key, note] : notes_) {
        if (note.assetId != assetId)
            continue;
        if (note.amount > std::numeric_limits<std::uint64_t>::max() - total)
            throw std::overflow_error("note balance overflows 64 bits");
        total += note.amount;
    }
    return total;
}

std::string NoteStore::serialize() const {
    Json::Value json(Json::objectValue);
    json["version"] = 1;
    Json::Value& list = json["notes"] = Json::Value(Json::arrayValue);
    for (auto const& [key, note] : notes_)
        list.append(manager_.toJson(note));
    return Json::to_string(json);
}

NoteStore NoteStore::deserialize(NoteManager const& notes, std::string const& text) {
    Json::Value json;
    Json::Reader reader;
    if (!reader.parse(text, json) || !json.isObject())
        throw std::invalid_argument("note store: malformed JSON");

    if (!json.isMember("version") || !json["version"].isIntegral() || json["version"].asInt() != 1)
        throw std::invalid_argument("note store: unsupported version");

    auto const& list = json["notes"];
    if (!list.isArray())
        throw std::invalid_argument("note store: missing notes");

    NoteStore store(notes);
    for (Json::UInt i = 0; i < list.size(); ++i)
        store.add(notes.fromJson(list[i]));
    return store;
}

} // namespace zkp
} // namespace shieldpool
