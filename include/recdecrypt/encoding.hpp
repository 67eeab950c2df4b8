#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace recdecrypt::encoding {

using Bytes = std::vector<std::uint8_t>;

// Standard alphabet, padded output.
std::string Base64Encode(const Bytes& data);

// Strict decoding: standard alphabet only, '=' padding only at the end,
// no embedded whitespace. On failure returns an empty vector and sets *ok.
Bytes Base64Decode(std::string_view input, bool* ok = nullptr);

std::string HexEncode(const Bytes& data);
// Accepts upper and lower case digits; odd length is an error.
Bytes HexDecode(std::string_view input, bool* ok = nullptr);

std::string_view Trim(std::string_view input);

}  // namespace recdecrypt::encoding
