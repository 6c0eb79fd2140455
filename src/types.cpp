// =============================================================================
// types.cpp - Address and amount formatting
// =============================================================================

#include "backstop/types.hpp"

#include <algorithm>

namespace backstop {

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
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Address> address_from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string i128_to_string(I128 v) {
    if (v == 0) return "0";

    bool neg = v < 0;
    // Negate through U128 so I128 min does not overflow
    U128 u = neg ? U128(0) - static_cast<U128>(v) : static_cast<U128>(v);

    std::string out;
    while (u != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (neg) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<I128> i128_from_string(std::string_view text) {
    if (text.empty()) return std::nullopt;

    bool neg = false;
    if (text[0] == '-') {
        neg = true;
        text.remove_prefix(1);
        if (text.empty()) return std::nullopt;
    }

    I128 v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        if (__builtin_mul_overflow(v, 10, &v) ||
            __builtin_add_overflow(v, c - '0', &v)) {
            return std::nullopt;
        }
    }
    return neg ? -v : v;
}

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case errors::INSUFFICIENT_UNQUEUED_SHARES: return "INSUFFICIENT_UNQUEUED_SHARES";
        case errors::INSUFFICIENT_BACKSTOP_BALANCE: return "INSUFFICIENT_BACKSTOP_BALANCE";
        case errors::NOT_MATURED: return "NOT_MATURED";
        case errors::ENTRY_NOT_FOUND: return "ENTRY_NOT_FOUND";
        case errors::UNAUTHORIZED: return "UNAUTHORIZED";
        case errors::TRANSFER_FAILED: return "TRANSFER_FAILED";
        case errors::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case errors::QUEUE_FULL: return "QUEUE_FULL";
        case errors::POOL_NOT_FOUND: return "POOL_NOT_FOUND";
        case errors::POOL_ALREADY_REGISTERED: return "POOL_ALREADY_REGISTERED";
        case errors::CORRUPT_STATE: return "CORRUPT_STATE";
        default: return "UNKNOWN";
    }
}

} // namespace backstop
