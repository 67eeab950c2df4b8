#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace recdecrypt::hpke {

using Bytes = std::vector<std::uint8_t>;

// RFC 9180 base mode with DHKEM(X25519, HKDF-SHA256), HKDF-SHA256 and
// ChaCha20-Poly1305. This is the only suite recordings are produced with.

struct KeyPair {
    std::string private_key;  // base64 of the raw 32-byte scalar
    std::string public_key;   // base64 of the raw 32-byte point
};

KeyPair GenerateKeyPair();

// Text to raw key bytes. Bad base64/hex throws KeyDecodeError, a key of
// the wrong size throws KeyFormatError.
Bytes DecodePrivateKey(std::string_view base64_text);
Bytes DecodePublicKey(std::string_view base64_text);
Bytes DecodeEncapsulatedKey(std::string_view hex_text);

// Encryption context shared by both ends. Every Seal/Open consumes one
// sequence number; a failed Open leaves the sequence untouched.
class Context {
public:
    Context(Bytes key, Bytes base_nonce);

    Bytes Seal(const Bytes& plaintext, const Bytes& aad = {});
    Bytes Open(const Bytes& ciphertext, const Bytes& aad = {});

    std::uint64_t sequence() const noexcept { return sequence_; }

private:
    Bytes ComputeNonce() const;
    void IncrementSequence();

    Bytes key_;
    Bytes base_nonce_;
    std::uint64_t sequence_ = 0;
};

struct SenderSetup {
    Bytes encapsulated_key;
    Context context;
};

SenderSetup SetupBaseSender(const Bytes& recipient_public_key, const Bytes& info = {});
Context SetupBaseReceiver(const Bytes& encapsulated_key, const Bytes& recipient_private_key, const Bytes& info = {});

}  // namespace recdecrypt::hpke
