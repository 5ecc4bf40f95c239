#pragma once

#include <libshieldpool/ledger/Ledger.h>
#include <libshieldpool/ledger/RpcClient.h>
#include <xrpl/beast/utility/Journal.h>
#include <chrono>
#include <string>

namespace shieldpool {
namespace ledger {

/**
    Ledger backed by a Solana JSON-RPC node.
*/
class SolanaLedger : public Ledger
{
public:
    struct Setup
    {
        std::string commitment = "confirmed";
        std::chrono::milliseconds confirmTimeout{30000};
        std::chrono::milliseconds pollInterval{500};
    };

    SolanaLedger(RpcClient& rpc, Setup setup, beast::Journal journal);

    std::string
    submitTransaction(ripple::Slice wire) override;

    std::optional<AccountInfo>
    getAccount(Address const& address) override;

    Blockhash
    latestBlockhash() override;

private:
    // True once the status reaches the configured commitment.
    bool
    reached(std::string const& status) const;

    RpcClient& rpc_;
    Setup const setup_;
    beast::Journal j_;
};

} // namespace ledger
} // namespace shieldpool
