#pragma once

#include <libshieldpool/zkp/Note.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shieldpool {
namespace zkp {

/**
 * Local wallet storage for unspent notes, keyed by commitment.
 *
 * A note leaves the store only through remove(), which callers invoke after
 * the ledger has confirmed the spend.
 */
class NoteStore {
public:
    explicit NoteStore(NoteManager const& notes);

    /** @throws std::invalid_argument if a note with the same commitment exists */
    void add(Note const& note);

    std::optional<Note> get(FieldT const& commitment) const;

    /** @return false if no such note */
    bool remove(FieldT const& commitment);

    std::vector<Note> getByAsset(FieldT const& assetId) const;

    /** @throws std::overflow_error if the sum does not fit 64 bits */
    std::uint64_t getBalance(FieldT const& assetId) const;

    std::size_t size() const { return notes_.size(); }
    bool empty() const { return notes_.empty(); }

    std::string serialize() const;

    /** Every note is re-validated (commitment recomputed) on load. */
    static NoteStore deserialize(NoteManager const& notes, std::string const& text);

private:
    NoteManager const& manager_;
    std::map<uint256, Note> notes_;
};

} // namespace zkp
} // namespace shieldpool
