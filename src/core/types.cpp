// COMMONIP - Core Types Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include "commonip/core/types.h"

#include <stdexcept>

namespace commonip {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";

    std::string result;
    result.reserve(SIZE * 2);
    for (size_t i = 0; i < SIZE; ++i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }
    return result;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length");
    }

    auto nibble = [](char c) -> Byte {
        if (c >= '0' && c <= '9') return static_cast<Byte>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<Byte>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<Byte>(c - 'A' + 10);
        throw std::invalid_argument("Invalid hex character");
    };

    BaseHash result;
    for (size_t i = 0; i < SIZE; ++i) {
        result.data_[i] = static_cast<Byte>((nibble(digits[2 * i]) << 4) |
                                            nibble(digits[2 * i + 1]));
    }
    return result;
}

template class BaseHash<256>;
template class BaseHash<160>;

} // namespace commonip
