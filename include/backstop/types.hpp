#ifndef BACKSTOP_TYPES_HPP
#define BACKSTOP_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>
#include <optional>

namespace backstop {

// =============================================================================
// Addresses (EVM-style 20-byte identifiers for users, pools and the backstop)
// =============================================================================

using Address = std::array<uint8_t, 20>;

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 1469598103934665603ULL;  // FNV-1a
        for (auto b : a) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

inline bool is_zero_address(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// Helper to build short test/simulation addresses: 0x00..00<id>
constexpr Address address_from_id(uint32_t id) {
    Address addr = {};
    addr[16] = static_cast<uint8_t>((id >> 24) & 0xFF);
    addr[17] = static_cast<uint8_t>((id >> 16) & 0xFF);
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without the "0x" prefix; 40 hex digits required
std::optional<Address> address_from_hex(std::string_view text);

// =============================================================================
// Amounts
// =============================================================================

// Token and share amounts are non-negative 128-bit integers. Signed storage
// keeps underflow detectable: a counter that would go below zero is an error.
using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);

std::string i128_to_string(I128 v);
std::optional<I128> i128_from_string(std::string_view text);

// Seconds since the epoch
using Timestamp = uint64_t;

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_AMOUNT = -1;
constexpr int32_t INSUFFICIENT_UNQUEUED_SHARES = -2;
constexpr int32_t INSUFFICIENT_BACKSTOP_BALANCE = -3;
constexpr int32_t NOT_MATURED = -4;
constexpr int32_t ENTRY_NOT_FOUND = -5;
constexpr int32_t UNAUTHORIZED = -6;
constexpr int32_t TRANSFER_FAILED = -7;
constexpr int32_t ARITHMETIC_OVERFLOW = -8;
constexpr int32_t QUEUE_FULL = -9;
constexpr int32_t POOL_NOT_FOUND = -10;
constexpr int32_t POOL_ALREADY_REGISTERED = -11;
constexpr int32_t CORRUPT_STATE = -12;
}

const char* error_name(int32_t code);

} // namespace backstop

#endif // BACKSTOP_TYPES_HPP
