#pragma once

#include <libshieldpool/ledger/Keypair.h>
#include <xrpl/basics/Blob.h>
#include <cstdint>
#include <vector>

namespace shieldpool {
namespace ledger {

using Blockhash = Address;

struct AccountMeta
{
    Address pubkey;
    bool isSigner = false;
    bool isWritable = false;
};

struct Instruction
{
    Address programId;
    std::vector<AccountMeta> accounts;
    ripple::Blob data;
};

/** Appends the compact-u16 length prefix used throughout the wire format. */
void
appendCompactU16(ripple::Blob& out, std::size_t value);

/**
    Legacy transaction message.

    Account keys are ordered writable signers (fee payer first), read-only
    signers, writable non-signers, then read-only non-signers; every
    instruction refers to them by index.
*/
class Message
{
public:
    struct CompiledInstruction
    {
        std::uint8_t programIdIndex = 0;
        std::vector<std::uint8_t> accountIndices;
        ripple::Blob data;
    };

    /** @throws std::invalid_argument if more than 256 distinct accounts */
    static Message
    compile(
        Address const& payer,
        std::vector<Instruction> const& instructions,
        Blockhash const& recentBlockhash);

    ripple::Blob
    serialize() const;

    std::uint8_t numRequiredSignatures = 0;
    std::uint8_t numReadonlySigned = 0;
    std::uint8_t numReadonlyUnsigned = 0;
    std::vector<Address> accountKeys;
    Blockhash recentBlockhash;
    std::vector<CompiledInstruction> instructions;
};

struct SignedTransaction
{
    ripple::Blob wire;
    Signature signature;  // first signature; identifies the transaction
};

/**
    Signs a message whose only required signer is the payer.

    @throws std::invalid_argument if the message needs other signers or the
            key is not the fee payer
*/
SignedTransaction
signTransaction(Message const& message, Keypair const& payer);

} // namespace ledger
} // namespace shieldpool
