#include "recdecrypt/crypto.hpp"

#include "recdecrypt/constants.hpp"
#include "recdecrypt/crypto_utils.hpp"
#include "recdecrypt/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <stdexcept>

namespace recdecrypt::crypto {

namespace {

using detail::UniqueCipherCtx;
using detail::UniquePKEY;
using detail::UniquePKEYCtx;

const std::uint8_t kEmptyInput[1] = {0};

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

const std::uint8_t* DataOrEmpty(const Bytes& data) {
    return data.empty() ? kEmptyInput : data.data();
}

UniquePKEY LoadPrivate(const Bytes& private_key) {
    if (private_key.size() != constants::kX25519KeyLen) {
        throw KeyFormatError("X25519 private key must be 32 bytes");
    }
    UniquePKEY key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, private_key.data(), private_key.size()));
    if (!key) {
        throw KeyFormatError("X25519 private key rejected");
    }
    return key;
}

UniquePKEY LoadPublic(const Bytes& public_key) {
    if (public_key.size() != constants::kX25519KeyLen) {
        throw KeyFormatError("X25519 public key must be 32 bytes");
    }
    UniquePKEY key(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, public_key.data(), public_key.size()));
    if (!key) {
        throw KeyFormatError("X25519 public key rejected");
    }
    return key;
}

Bytes RawPublic(EVP_PKEY* key) {
    Bytes out(constants::kX25519KeyLen);
    std::size_t len = out.size();
    Ensure(EVP_PKEY_get_raw_public_key(key, out.data(), &len) == 1, "X25519 public key export failed");
    out.resize(len);
    return out;
}

}  // namespace

Bytes HmacSha256(const Bytes& key, const Bytes& data) {
    unsigned int out_len = EVP_MAX_MD_SIZE;
    Bytes out(out_len);
    if (!HMAC(EVP_sha256(), DataOrEmpty(key), static_cast<int>(key.size()), DataOrEmpty(data),
              data.size(), out.data(), &out_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    out.resize(out_len);
    return out;
}

Bytes HkdfExtract(const Bytes& salt, const Bytes& ikm) {
    if (salt.empty()) {
        return HmacSha256(Bytes(constants::kHashLen, 0), ikm);
    }
    return HmacSha256(salt, ikm);
}

Bytes HkdfExpand(const Bytes& prk, const Bytes& info, std::size_t length) {
    if (length > 255 * constants::kHashLen) {
        throw std::runtime_error("HKDF expand length too large");
    }
    Bytes out;
    out.reserve(length);
    Bytes block;
    std::uint8_t counter = 1;
    while (out.size() < length) {
        Bytes input = block;
        detail::AppendBytes(input, info);
        input.push_back(counter);
        block = HmacSha256(prk, input);
        std::size_t take = std::min(block.size(), length - out.size());
        out.insert(out.end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(take));
        ++counter;
    }
    return out;
}

Bytes ChaCha20Poly1305Seal(const Bytes& key, const Bytes& nonce, const Bytes& plaintext, const Bytes& aad) {
    if (key.size() != constants::kAeadKeyLen) {
        throw std::runtime_error("ChaCha20-Poly1305 expects 32-byte key");
    }
    if (nonce.size() != constants::kAeadNonceLen) {
        throw std::runtime_error("ChaCha20-Poly1305 expects 12-byte nonce");
    }
    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("ChaCha20-Poly1305 context allocation failed");
    }
    Bytes out(plaintext.size() + constants::kAeadTagLen);
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) == 1,
           "ChaCha20-Poly1305 init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) == 1,
           "ChaCha20-Poly1305 set iv length failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) == 1,
           "ChaCha20-Poly1305 set key failed");
    if (!aad.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), static_cast<int>(aad.size())) == 1,
               "ChaCha20-Poly1305 aad failed");
    }
    if (!plaintext.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), out.data(), &out_len, plaintext.data(),
                                 static_cast<int>(plaintext.size())) == 1,
               "ChaCha20-Poly1305 encrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1,
           "ChaCha20-Poly1305 final failed");
    total_len += out_len;
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(constants::kAeadTagLen),
                               out.data() + total_len) == 1,
           "ChaCha20-Poly1305 get tag failed");
    out.resize(static_cast<std::size_t>(total_len) + constants::kAeadTagLen);
    return out;
}

Bytes ChaCha20Poly1305Open(const Bytes& key, const Bytes& nonce, const Bytes& blob, const Bytes& aad) {
    if (key.size() != constants::kAeadKeyLen) {
        throw std::runtime_error("ChaCha20-Poly1305 expects 32-byte key");
    }
    if (nonce.size() != constants::kAeadNonceLen) {
        throw std::runtime_error("ChaCha20-Poly1305 expects 12-byte nonce");
    }
    if (blob.size() < constants::kAeadTagLen) {
        throw DecryptionError("ciphertext shorter than the authentication tag");
    }
    const std::size_t cipher_len = blob.size() - constants::kAeadTagLen;
    Bytes tag(blob.end() - static_cast<std::ptrdiff_t>(constants::kAeadTagLen), blob.end());

    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("ChaCha20-Poly1305 context allocation failed");
    }
    Bytes plaintext(cipher_len);
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) == 1,
           "ChaCha20-Poly1305 init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) == 1,
           "ChaCha20-Poly1305 set iv length failed");
    Ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) == 1,
           "ChaCha20-Poly1305 set key failed");
    if (!aad.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), static_cast<int>(aad.size())) == 1,
               "ChaCha20-Poly1305 aad failed");
    }
    if (cipher_len > 0) {
        Ensure(EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, blob.data(),
                                 static_cast<int>(cipher_len)) == 1,
               "ChaCha20-Poly1305 decrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
           "ChaCha20-Poly1305 set tag failed");
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw DecryptionError("ciphertext authentication failed");
    }
    total_len += out_len;
    plaintext.resize(static_cast<std::size_t>(total_len));
    return plaintext;
}

X25519KeyPair X25519Generate() {
    UniquePKEYCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));
    if (!ctx) {
        throw std::runtime_error("Failed to initialize X25519 keygen");
    }
    Ensure(EVP_PKEY_keygen_init(ctx.get()) == 1, "Failed to init X25519 keygen");
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || !raw) {
        throw std::runtime_error("Failed to generate X25519 key");
    }
    UniquePKEY key(raw);

    X25519KeyPair pair;
    pair.private_key.resize(constants::kX25519KeyLen);
    std::size_t len = pair.private_key.size();
    Ensure(EVP_PKEY_get_raw_private_key(key.get(), pair.private_key.data(), &len) == 1,
           "X25519 private key export failed");
    pair.private_key.resize(len);
    pair.public_key = RawPublic(key.get());
    return pair;
}

Bytes X25519PublicFromPrivate(const Bytes& private_key) {
    UniquePKEY key = LoadPrivate(private_key);
    return RawPublic(key.get());
}

Bytes X25519Derive(const Bytes& private_key, const Bytes& peer_public_key) {
    UniquePKEY priv = LoadPrivate(private_key);
    UniquePKEY peer = LoadPublic(peer_public_key);
    UniquePKEYCtx ctx(EVP_PKEY_CTX_new(priv.get(), nullptr));
    if (!ctx) {
        throw std::runtime_error("Failed to init X25519 ctx");
    }
    Ensure(EVP_PKEY_derive_init(ctx.get()) == 1, "Failed to init X25519 derive");
    if (EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) != 1) {
        throw KeyFormatError("X25519 peer key rejected");
    }
    std::size_t len = 0;
    Ensure(EVP_PKEY_derive(ctx.get(), nullptr, &len) == 1 && len > 0, "Failed to size X25519 shared secret");
    Bytes shared(len);
    // OpenSSL refuses an all-zero result, which is how small-order peer points surface.
    if (EVP_PKEY_derive(ctx.get(), shared.data(), &len) != 1) {
        throw KeyFormatError("X25519 key agreement failed");
    }
    shared.resize(len);
    return shared;
}

}  // namespace recdecrypt::crypto
