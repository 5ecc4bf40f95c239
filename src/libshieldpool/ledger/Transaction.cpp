#include "Transaction.h"
#include <algorithm>
#include <stdexcept>

namespace shieldpool {
namespace ledger {

void
appendCompactU16(ripple::Blob& out, std::size_t value)
{
    if (value > 0xffff)
        throw std::invalid_argument("compact-u16 value out of range");

    for (;;)
    {
        std::uint8_t byte = value & 0x7f;
        value >>= 7;
        if (value == 0)
        {
            out.push_back(byte);
            return;
        }
        out.push_back(byte | 0x80);
    }
}

Message
Message::compile(
    Address const& payer,
    std::vector<Instruction> const& instructions,
    Blockhash const& recentBlockhash)
{
    // Merge every reference to the same key, keeping first-seen order.
    std::vector<AccountMeta> metas;
    auto merge = [&metas](Address const& key, bool signer, bool writable) {
        auto it = std::find_if(metas.begin(), metas.end(), [&](AccountMeta const& m) {
            return m.pubkey == key;
        });
        if (it == metas.end())
        {
            metas.push_back({key, signer, writable});
            return;
        }
        it->isSigner = it->isSigner || signer;
        it->isWritable = it->isWritable || writable;
    };

    merge(payer, true, true);
    for (auto const& ix : instructions)
    {
        for (auto const& meta : ix.accounts)
            merge(meta.pubkey, meta.isSigner, meta.isWritable);
        merge(ix.programId, false, false);
    }

    auto rank = [](AccountMeta const& m) {
        if (m.isSigner)
            return m.isWritable ? 0 : 1;
        return m.isWritable ? 2 : 3;
    };
    // stable: payer stays first among writable signers
    std::stable_sort(metas.begin(), metas.end(), [&](AccountMeta const& a, AccountMeta const& b) {
        return rank(a) < rank(b);
    });

    if (metas.size() > 256)
        throw std::invalid_argument("transaction references too many accounts");

    Message msg;
    msg.recentBlockhash = recentBlockhash;
    for (auto const& m : metas)
    {
        msg.accountKeys.push_back(m.pubkey);
        if (m.isSigner)
        {
            ++msg.numRequiredSignatures;
            if (!m.isWritable)
                ++msg.numReadonlySigned;
        }
        else if (!m.isWritable)
        {
            ++msg.numReadonlyUnsigned;
        }
    }

    auto indexOf = [&msg](Address const& key) {
        auto const it = std::find(msg.accountKeys.begin(), msg.accountKeys.end(), key);
        return static_cast<std::uint8_t>(it - msg.accountKeys.begin());
    };

    for (auto const& ix : instructions)
    {
        CompiledInstruction compiled;
        compiled.programIdIndex = indexOf(ix.programId);
        for (auto const& meta : ix.accounts)
            compiled.accountIndices.push_back(indexOf(meta.pubkey));
        compiled.data = ix.data;
        msg.instructions.push_back(std::move(compiled));
    }
    return msg;
}

ripple::Blob
Message::serialize() const
{
    ripple::Blob out;
    out.push_back(numRequiredSignatures);
    out.push_back(numReadonlySigned);
    out.push_back(numReadonlyUnsigned);

    appendCompactU16(out, accountKeys.size());
    for (auto const& key : accountKeys)
        out.insert(out.end(), key.begin(), key.end());

    out.insert(out.end(), recentBlockhash.begin(), recentBlockhash.end());

    appendCompactU16(out, instructions.size());
    for (auto const& ix : instructions)
    {
        out.push_back(ix.programIdIndex);
        appendCompactU16(out, ix.accountIndices.size());
        out.insert(out.end(), ix.accountIndices.begin(), ix.accountIndices.end());
        appendCompactU16(out, ix.data.size());
        out.insert(out.end(), ix.data.begin(), ix.data.end());
    }
    return out;
}

SignedTransaction
signTransaction(Message const& message, Keypair const& payer)
{
    if (message.numRequiredSignatures != 1)
        throw std::invalid_argument("only payer-signed transactions are supported");
    if (message.accountKeys.empty() || message.accountKeys.front() != payer.publicKey())
        throw std::invalid_argument("signing key is not the fee payer");

    auto const body = message.serialize();

    SignedTransaction tx;
    tx.signature = payer.sign(ripple::Slice(body.data(), body.size()));

    appendCompactU16(tx.wire, 1);
    tx.wire.insert(tx.wire.end(), tx.signature.begin(), tx.signature.end());
    tx.wire.insert(tx.wire.end(), body.begin(), body.end());
    return tx;
}

} // namespace ledger
} // namespace shieldpool
