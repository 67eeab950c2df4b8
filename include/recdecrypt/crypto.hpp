#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace recdecrypt::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes HmacSha256(const Bytes& key, const Bytes& data);

// RFC 5869. An empty salt is replaced by HashLen zero bytes.
Bytes HkdfExtract(const Bytes& salt, const Bytes& ikm);
Bytes HkdfExpand(const Bytes& prk, const Bytes& info, std::size_t length);

// Output is ciphertext || 16-byte tag.
Bytes ChaCha20Poly1305Seal(const Bytes& key, const Bytes& nonce, const Bytes& plaintext, const Bytes& aad);
// Throws DecryptionError when the tag does not verify; nothing is returned in that case.
Bytes ChaCha20Poly1305Open(const Bytes& key, const Bytes& nonce, const Bytes& blob, const Bytes& aad);

struct X25519KeyPair {
    Bytes private_key;
    Bytes public_key;
};

X25519KeyPair X25519Generate();
// Throws KeyFormatError on a key of the wrong size.
Bytes X25519PublicFromPrivate(const Bytes& private_key);
Bytes X25519Derive(const Bytes& private_key, const Bytes& peer_public_key);

}  // namespace recdecrypt::crypto
