#include "recdecrypt/hpke.hpp"

#include "recdecrypt/constants.hpp"
#include "recdecrypt/crypto.hpp"
#include "recdecrypt/crypto_utils.hpp"
#include "recdecrypt/encoding.hpp"
#include "recdecrypt/errors.hpp"

#include <openssl/crypto.h>

#include <limits>
#include <stdexcept>
#include <utility>

namespace recdecrypt::hpke {

namespace {

using crypto::detail::AppendBytes;
using crypto::detail::AppendU16Be;

Bytes Label(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

Bytes KemSuiteId() {
    Bytes id = Label("KEM");
    AppendU16Be(id, constants::kKemX25519HkdfSha256);
    return id;
}

Bytes HpkeSuiteId() {
    Bytes id = Label("HPKE");
    AppendU16Be(id, constants::kKemX25519HkdfSha256);
    AppendU16Be(id, constants::kKdfHkdfSha256);
    AppendU16Be(id, constants::kAeadChaCha20Poly1305);
    return id;
}

Bytes LabeledExtract(const Bytes& suite_id, const Bytes& salt, std::string_view label, const Bytes& ikm) {
    Bytes labeled = Label(constants::kHpkeVersionLabel);
    AppendBytes(labeled, suite_id);
    AppendBytes(labeled, Label(label));
    AppendBytes(labeled, ikm);
    return crypto::HkdfExtract(salt, labeled);
}

Bytes LabeledExpand(const Bytes& suite_id,
                    const Bytes& prk,
                    std::string_view label,
                    const Bytes& info,
                    std::size_t length) {
    Bytes labeled;
    AppendU16Be(labeled, static_cast<std::uint16_t>(length));
    AppendBytes(labeled, Label(constants::kHpkeVersionLabel));
    AppendBytes(labeled, suite_id);
    AppendBytes(labeled, Label(label));
    AppendBytes(labeled, info);
    return crypto::HkdfExpand(prk, labeled, length);
}

Bytes ExtractAndExpand(const Bytes& dh, const Bytes& kem_context) {
    const Bytes suite = KemSuiteId();
    Bytes eae_prk = LabeledExtract(suite, {}, "eae_prk", dh);
    return LabeledExpand(suite, eae_prk, "shared_secret", kem_context, constants::kHashLen);
}

Context KeySchedule(const Bytes& shared_secret, const Bytes& info) {
    const Bytes suite = HpkeSuiteId();
    Bytes psk_id_hash = LabeledExtract(suite, {}, "psk_id_hash", {});
    Bytes info_hash = LabeledExtract(suite, {}, "info_hash", info);

    Bytes key_schedule_context;
    key_schedule_context.push_back(constants::kHpkeModeBase);
    AppendBytes(key_schedule_context, psk_id_hash);
    AppendBytes(key_schedule_context, info_hash);

    Bytes secret = LabeledExtract(suite, shared_secret, "secret", {});
    Bytes key = LabeledExpand(suite, secret, "key", key_schedule_context, constants::kAeadKeyLen);
    Bytes base_nonce = LabeledExpand(suite, secret, "base_nonce", key_schedule_context, constants::kAeadNonceLen);
    OPENSSL_cleanse(secret.data(), secret.size());
    return Context(std::move(key), std::move(base_nonce));
}

}  // namespace

KeyPair GenerateKeyPair() {
    crypto::X25519KeyPair raw = crypto::X25519Generate();
    KeyPair pair;
    pair.private_key = encoding::Base64Encode(raw.private_key);
    pair.public_key = encoding::Base64Encode(raw.public_key);
    OPENSSL_cleanse(raw.private_key.data(), raw.private_key.size());
    return pair;
}

Bytes DecodePrivateKey(std::string_view base64_text) {
    bool ok = false;
    Bytes key = encoding::Base64Decode(encoding::Trim(base64_text), &ok);
    if (!ok) {
        throw KeyDecodeError("invalid base64 private key");
    }
    if (key.size() != constants::kX25519KeyLen) {
        throw KeyFormatError("invalid private key: expected 32 bytes, got " + std::to_string(key.size()));
    }
    return key;
}

Bytes DecodePublicKey(std::string_view base64_text) {
    bool ok = false;
    Bytes key = encoding::Base64Decode(encoding::Trim(base64_text), &ok);
    if (!ok) {
        throw KeyDecodeError("invalid base64 public key");
    }
    if (key.size() != constants::kX25519KeyLen) {
        throw KeyFormatError("invalid public key: expected 32 bytes, got " + std::to_string(key.size()));
    }
    return key;
}

Bytes DecodeEncapsulatedKey(std::string_view hex_text) {
    bool ok = false;
    Bytes key = encoding::HexDecode(encoding::Trim(hex_text), &ok);
    if (!ok) {
        throw KeyDecodeError("invalid hex encapsulated key");
    }
    if (key.size() != constants::kX25519KeyLen) {
        throw KeyFormatError("invalid encapsulated key: expected 32 bytes, got " + std::to_string(key.size()));
    }
    return key;
}

Context::Context(Bytes key, Bytes base_nonce)
    : key_(std::move(key)),
      base_nonce_(std::move(base_nonce)) {
    if (key_.size() != constants::kAeadKeyLen || base_nonce_.size() != constants::kAeadNonceLen) {
        throw std::runtime_error("Invalid HPKE context parameters");
    }
}

Bytes Context::ComputeNonce() const {
    Bytes nonce = base_nonce_;
    for (std::size_t i = 0; i < 8; ++i) {
        nonce[nonce.size() - 1 - i] ^= static_cast<std::uint8_t>((sequence_ >> (8 * i)) & 0xFF);
    }
    return nonce;
}

void Context::IncrementSequence() {
    if (sequence_ == std::numeric_limits<std::uint64_t>::max()) {
        throw std::runtime_error("HPKE sequence number overflow");
    }
    ++sequence_;
}

Bytes Context::Seal(const Bytes& plaintext, const Bytes& aad) {
    Bytes ciphertext = crypto::ChaCha20Poly1305Seal(key_, ComputeNonce(), plaintext, aad);
    IncrementSequence();
    return ciphertext;
}

Bytes Context::Open(const Bytes& ciphertext, const Bytes& aad) {
    Bytes plaintext = crypto::ChaCha20Poly1305Open(key_, ComputeNonce(), ciphertext, aad);
    IncrementSequence();
    return plaintext;
}

SenderSetup SetupBaseSender(const Bytes& recipient_public_key, const Bytes& info) {
    if (recipient_public_key.size() != constants::kX25519KeyLen) {
        throw KeyFormatError("invalid recipient public key");
    }
    crypto::X25519KeyPair ephemeral = crypto::X25519Generate();
    Bytes dh = crypto::X25519Derive(ephemeral.private_key, recipient_public_key);
    OPENSSL_cleanse(ephemeral.private_key.data(), ephemeral.private_key.size());

    Bytes kem_context = ephemeral.public_key;
    AppendBytes(kem_context, recipient_public_key);
    Bytes shared_secret = ExtractAndExpand(dh, kem_context);
    Context context = KeySchedule(shared_secret, info);
    OPENSSL_cleanse(shared_secret.data(), shared_secret.size());
    return SenderSetup{ephemeral.public_key, std::move(context)};
}

Context SetupBaseReceiver(const Bytes& encapsulated_key, const Bytes& recipient_private_key, const Bytes& info) {
    if (encapsulated_key.size() != constants::kX25519KeyLen) {
        throw KeyFormatError("invalid encapsulated key");
    }
    Bytes dh = crypto::X25519Derive(recipient_private_key, encapsulated_key);
    Bytes kem_context = encapsulated_key;
    AppendBytes(kem_context, crypto::X25519PublicFromPrivate(recipient_private_key));
    Bytes shared_secret = ExtractAndExpand(dh, kem_context);
    Context context = KeySchedule(shared_secret, info);
    OPENSSL_cleanse(shared_secret.data(), shared_secret.size());
    return context;
}

}  // namespace recdecrypt::hpke
