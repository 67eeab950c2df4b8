#include "recdecrypt/encoding.hpp"

#include <array>
#include <cctype>

namespace recdecrypt::encoding {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char kHexDigits[] = "0123456789abcdef";
constexpr std::uint8_t kInvalid = 0xFF;

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(kInvalid);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

std::uint8_t HexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return static_cast<std::uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<std::uint8_t>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<std::uint8_t>(ch - 'A' + 10);
    }
    return kInvalid;
}

Bytes Fail(bool* ok) {
    if (ok) {
        *ok = false;
    }
    return {};
}

}  // namespace

std::string Base64Encode(const Bytes& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    std::size_t i = 0;
    while (i + 2 < data.size()) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        out.push_back(kEncTable[(triple >> 12) & 0x3F]);
        out.push_back(kEncTable[(triple >> 6) & 0x3F]);
        out.push_back(kEncTable[triple & 0x3F]);
        i += 3;
    }
    if (i < data.size()) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) {
            triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        out.push_back(kEncTable[(triple >> 12) & 0x3F]);
        out.push_back(i + 1 < data.size() ? kEncTable[(triple >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

Bytes Base64Decode(std::string_view input, bool* ok) {
    std::size_t padding = 0;
    while (padding < input.size() && padding < 2 && input[input.size() - 1 - padding] == '=') {
        ++padding;
    }
    std::string_view body = input.substr(0, input.size() - padding);
    if (padding > 0 && input.size() % 4 != 0) {
        return Fail(ok);
    }
    if (body.size() % 4 == 1) {
        return Fail(ok);
    }

    Bytes out;
    out.reserve((body.size() / 4) * 3 + 2);
    std::uint32_t val = 0;
    int valb = -8;
    for (unsigned char c : body) {
        std::uint8_t decoded = kDecTable[c];
        if (decoded == kInvalid) {
            return Fail(ok);
        }
        val = ((val << 6) | decoded) & 0xFFFFFFu;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    // Leftover bits of the final quantum must be zero.
    if (valb > -8 && (val & ((1u << (valb + 8)) - 1u)) != 0) {
        return Fail(ok);
    }
    if (ok) {
        *ok = true;
    }
    return out;
}

std::string HexEncode(const Bytes& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

Bytes HexDecode(std::string_view input, bool* ok) {
    if (input.size() % 2 != 0) {
        return Fail(ok);
    }
    Bytes out;
    out.reserve(input.size() / 2);
    for (std::size_t i = 0; i < input.size(); i += 2) {
        std::uint8_t hi = HexValue(input[i]);
        std::uint8_t lo = HexValue(input[i + 1]);
        if (hi == kInvalid || lo == kInvalid) {
            return Fail(ok);
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    if (ok) {
        *ok = true;
    }
    return out;
}

std::string_view Trim(std::string_view input) {
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return input.substr(start, end - start);
}

}  // namespace recdecrypt::encoding
