#pragma once

#include <libshieldpool/ledger/Transaction.h>
#include <xrpl/basics/Blob.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace shieldpool {
namespace ledger {

/**
    A failure reported by, or on the way to, the remote ledger.

    The message carries the remote text verbatim so the relay can classify
    it; it is never shown to HTTP clients.
*/
class LedgerError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct AccountInfo
{
    Address owner;
    std::uint64_t lamports = 0;
    ripple::Blob data;
};

/**
    Narrow read/submit view of the ledger that runs the pool program.

    Implementations must be safe to call from several worker threads.
*/
class Ledger
{
public:
    virtual ~Ledger() = default;

    /**
        Sends a signed transaction and waits until it is confirmed.

        @return the base58 transaction signature
        @throws LedgerError on rejection, timeout or transport failure
    */
    virtual std::string
    submitTransaction(ripple::Slice wire) = 0;

    /** Empty when the account does not exist. @throws LedgerError */
    virtual std::optional<AccountInfo>
    getAccount(Address const& address) = 0;

    /** @throws LedgerError */
    virtual Blockhash
    latestBlockhash() = 0;
};

} // namespace ledger
} // namespace shieldpool
