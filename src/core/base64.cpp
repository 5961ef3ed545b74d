#include "filest/core/base64.hpp"

#include <array>
#include <cstdint>

namespace filest {
namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<std::int8_t, 256> make_decode_table() {
    std::array<std::int8_t, 256> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
    }
    table[static_cast<unsigned char>('=')] = -2;
    return table;
}

} // namespace

std::string base64_encode(const std::string& data) {
    std::string output;
    output.reserve(((data.size() + 2) / 3) * 4);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (unsigned char byte : data) {
        buffer = (buffer << 8u) | byte;
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            output.push_back(kAlphabet[(buffer >> bits) & 0x3Fu]);
        }
    }
    if (bits > 0) {
        buffer <<= (6 - bits);
        output.push_back(kAlphabet[buffer & 0x3Fu]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

std::optional<std::string> base64_decode(const std::string& input) {
    static const auto table = make_decode_table();

    std::string output;
    output.reserve((input.size() * 3) / 4);

    std::uint32_t accumulator = 0;
    int bits = 0;
    for (char ch : input) {
        const int value = table[static_cast<unsigned char>(ch)];
        if (value == -1) {
            return std::nullopt;
        }
        if (value == -2) {
            break;
        }
        accumulator = (accumulator << 6u) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            output.push_back(static_cast<char>((accumulator >> bits) & 0xFFu));
        }
    }
    return output;
}

} // namespace filest
