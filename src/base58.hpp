// SPDX-License-Identifier: MIT

// src/base58.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace geyser_pipe {

inline constexpr std::string_view kBase58Alphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Encode raw bytes (public keys, signatures) with the Bitcoin/Solana base58
// alphabet. Leading zero bytes become leading '1's.
inline std::string EncodeBase58(std::string_view bytes) {
    std::size_t zeros = 0;
    while (zeros < bytes.size() && bytes[zeros] == '\0') {
        ++zeros;
    }

    // log(256) / log(58) ~= 1.37
    std::vector<uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1, 0);
    std::size_t length = 0;
    for (std::size_t i = zeros; i < bytes.size(); ++i) {
        uint32_t carry = static_cast<uint8_t>(bytes[i]);
        std::size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend();
             ++it, ++j) {
            carry += 256u * *it;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string out(zeros, '1');
    out.reserve(zeros + static_cast<std::size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) {
        out.push_back(kBase58Alphabet[*it]);
    }
    return out;
}

}  // namespace geyser_pipe
