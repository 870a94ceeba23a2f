// =============================================================================
// types.cpp - Address Encoding, Wide Integer Formatting, Error Names
// =============================================================================

#include "lendcore/types.hpp"
#include <algorithm>

namespace lendcore {

namespace addresses {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(const Address& addr) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.empty() || hex.size() > 40) return std::nullopt;

    // Left-pad odd lengths and short inputs
    std::string padded(40 - hex.size(), '0');
    padded.append(hex.data(), hex.size());

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(padded[2 * i]);
        int lo = hex_value(padded[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK:                        return "OK";
        case NOT_FOUND:                 return "NOT_FOUND";
        case MARKET_NOT_FOUND:          return "MARKET_NOT_FOUND";
        case UNAUTHORIZED:              return "UNAUTHORIZED";
        case INSUFFICIENT_COLLATERAL:   return "INSUFFICIENT_COLLATERAL";
        case ARITHMETIC_OVERFLOW:       return "ARITHMETIC_OVERFLOW";
        case INVALID_AMOUNT:            return "INVALID_AMOUNT";
        case INVALID_PARAMS:            return "INVALID_PARAMS";
        case INVALID_PRICE:             return "INVALID_PRICE";
        case RESOLUTION_DEPTH_EXCEEDED: return "RESOLUTION_DEPTH_EXCEEDED";
        case ALREADY_INITIALIZED:       return "ALREADY_INITIALIZED";
        case NOT_INITIALIZED:           return "NOT_INITIALIZED";
        case INVARIANT_VIOLATION:       return "INVARIANT_VIOLATION";
        default:                        return "UNKNOWN_ERROR";
    }
}

} // namespace errors

} // namespace lendcore
