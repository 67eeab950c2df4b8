#pragma once

#include <stdexcept>
#include <string>

namespace recdecrypt {

// Base of every error raised while decoding a recording.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Private or encapsulated key text is not valid base64/hex.
class KeyDecodeError : public Error {
public:
    using Error::Error;
};

// Key bytes decoded but the KEM rejected them.
class KeyFormatError : public Error {
public:
    using Error::Error;
};

class IOError : public Error {
public:
    using Error::Error;
};

// AEAD open failed: tampered or truncated ciphertext, or the wrong key.
class DecryptionError : public Error {
public:
    using Error::Error;
};

class FrameTooSmallError : public Error {
public:
    using Error::Error;
};

class UnknownSourceError : public Error {
public:
    using Error::Error;
};

// Replay requested on a recording without an allocated terminal.
class NoPtyError : public Error {
public:
    using Error::Error;
};

class MetadataError : public Error {
public:
    using Error::Error;
};

class ArchiveError : public Error {
public:
    using Error::Error;
};

}  // namespace recdecrypt
