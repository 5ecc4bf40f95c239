#include "Note.h"
#include "ZkError.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <array>
#include <memory>

namespace shieldpool {
namespace zkp {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

constexpr std::size_t keySize = 32;
constexpr std::size_t headerSize = 1 + NoteManager::saltSize + NoteManager::nonceSize;

// Wipes the derived key when it goes out of scope.
struct DerivedKey {
    std::array<std::uint8_t, keySize> bytes{};
    ~DerivedKey() { OPENSSL_cleanse(bytes.data(), bytes.size()); }
};

void deriveKey(std::string const& passphrase, std::uint8_t const* salt, DerivedKey& key) {
    if (PKCS5_PBKDF2_HMAC(
            passphrase.data(),
            static_cast<int>(passphrase.size()),
            salt,
            static_cast<int>(NoteManager::saltSize),
            static_cast<int>(NoteManager::pbkdf2Iterations),
            EVP_sha256(),
            static_cast<int>(key.bytes.size()),
            key.bytes.data()) != 1) {
        throw std::runtime_error("note encryption: key derivation failed");
    }
}

} // namespace

ripple::Blob NoteManager::encrypt(Note const& note, std::string const& passphrase) const {
    std::string plaintext = serialize(note);

    ripple::Blob out(headerSize + plaintext.size() + tagSize);
    out[0] = encryptionVersion;
    std::uint8_t* salt = out.data() + 1;
    std::uint8_t* nonce = salt + saltSize;
    std::uint8_t* ciphertext = out.data() + headerSize;

    if (RAND_bytes(salt, static_cast<int>(saltSize + nonceSize)) != 1)
        throw std::runtime_error("note encryption: RAND_bytes failed");

    DerivedKey key;
    deriveKey(passphrase, salt, key);

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    int len = 0;
    bool ok = ctx &&
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.bytes.data(), nonce) == 1 &&
        // the header is authenticated but not encrypted
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, out.data(), static_cast<int>(headerSize)) == 1 &&
        EVP_EncryptUpdate(
            ctx.get(),
            ciphertext,
            &len,
            reinterpret_cast<std::uint8_t const*>(plaintext.data()),
            static_cast<int>(plaintext.size())) == 1 &&
        EVP_EncryptFinal_ex(ctx.get(), ciphertext + len, &len) == 1 &&
        EVP_CIPHER_CTX_ctrl(
            ctx.get(),
            EVP_CTRL_GCM_GET_TAG,
            static_cast<int>(tagSize),
            ciphertext + plaintext.size()) == 1;

    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    if (!ok)
        throw std::runtime_error("note encryption: cipher failure");

    return out;
}

Note NoteManager::decrypt(ripple::Slice blob, std::string const& passphrase) const {
    if (blob.size() < headerSize + tagSize)
        throw DecryptionFailedError("encrypted note is truncated");
    if (blob[0] != encryptionVersion)
        throw DecryptionFailedError("unsupported encrypted note version");

    std::uint8_t const* salt = blob.data() + 1;
    std::uint8_t const* nonce = salt + saltSize;
    std::uint8_t const* ciphertext = blob.data() + headerSize;
    std::size_t const ciphertextSize = blob.size() - headerSize - tagSize;
    // EVP_CTRL_GCM_SET_TAG takes a non-const buffer
    std::array<std::uint8_t, tagSize> tag;
    std::copy(ciphertext + ciphertextSize, ciphertext + ciphertextSize + tagSize, tag.begin());

    DerivedKey key;
    deriveKey(passphrase, salt, key);

    std::string plaintext(ciphertextSize, '\0');
    auto* plain = reinterpret_cast<std::uint8_t*>(plaintext.data());

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    int len = 0;
    bool const ok = ctx &&
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.bytes.data(), nonce) == 1 &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, blob.data(), static_cast<int>(headerSize)) == 1 &&
        EVP_DecryptUpdate(ctx.get(), plain, &len, ciphertext, static_cast<int>(ciphertextSize)) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tagSize), tag.data()) == 1 &&
        EVP_DecryptFinal_ex(ctx.get(), plain + len, &len) == 1;

    if (!ok) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw DecryptionFailedError("encrypted note failed authentication");
    }

    try {
        auto note = deserialize(plaintext);
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return note;
    } catch (std::exception const& e) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw DecryptionFailedError(std::string("decrypted payload is not a note: ") + e.what());
    }
}

} // namespace zkp
} // namespace shieldpool
