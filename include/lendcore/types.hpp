#ifndef LENDCORE_TYPES_HPP
#define LENDCORE_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <functional>
#include <utility>

namespace lendcore {

// =============================================================================
// Addresses (20-byte keys for assets and accounts)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Render as 0x-prefixed lowercase hex
std::string to_hex(const Address& addr);

// Parse 0x-prefixed (or bare) hex. Shorter inputs are left-padded with zeros.
std::optional<Address> from_hex(std::string_view hex);

// Address with the low 8 bytes set from an integer (tests, configs)
constexpr Address from_u64(uint64_t v) {
    Address addr = {};
    for (int i = 19; i >= 12; --i) {
        addr[i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
    return addr;
}

inline uint64_t hash(const Address& addr) {
    uint64_t h = 0;
    for (auto b : addr) h = h * 31 + b;
    return h;
}

} // namespace addresses

// =============================================================================
// Wide Integers
// =============================================================================

using U128 = unsigned __int128;

constexpr U128 U128_MAX = ~static_cast<U128>(0);

std::string to_string(U128 v);

// Checked arithmetic: return false on wrap, leaving out untouched
namespace checked {

inline bool add(U128 a, U128 b, U128& out) {
    U128 r;
    if (__builtin_add_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

inline bool mul(U128 a, U128 b, U128& out) {
    U128 r;
    if (__builtin_mul_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

inline bool add(uint64_t a, uint64_t b, uint64_t& out) {
    uint64_t r;
    if (__builtin_add_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

} // namespace checked

// =============================================================================
// Permille (1000 = 100%)
// =============================================================================

constexpr uint64_t PERMILLE = 1000;

// Health factor of an account with no debt
constexpr U128 HEALTH_FACTOR_MAX = U128_MAX;

// Minimum health factor a borrow must leave behind
constexpr U128 HEALTH_FACTOR_MIN = PERMILLE;

// =============================================================================
// Asset Identifier
// =============================================================================

struct AssetId {
    Address addr;

    AssetId() : addr{} {}
    explicit AssetId(const Address& a) : addr(a) {}

    static AssetId from_u64(uint64_t v) { return AssetId(addresses::from_u64(v)); }

    std::string to_string() const { return addresses::to_hex(addr); }

    bool operator==(const AssetId& other) const { return addr == other.addr; }
    bool operator!=(const AssetId& other) const { return addr != other.addr; }
    bool operator<(const AssetId& other) const { return addr < other.addr; }
};

// =============================================================================
// Account Identifier (verified caller identity)
// =============================================================================

struct Account {
    Address addr;

    Account() : addr{} {}
    explicit Account(const Address& a) : addr(a) {}

    static Account from_u64(uint64_t v) { return Account(addresses::from_u64(v)); }

    std::string to_string() const { return addresses::to_hex(addr); }

    bool operator==(const Account& other) const { return addr == other.addr; }
    bool operator!=(const Account& other) const { return addr != other.addr; }
    bool operator<(const Account& other) const { return addr < other.addr; }
};

// Handle of a registered external price provider
using ProviderRef = uint64_t;

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t NOT_FOUND = -1;
constexpr int32_t MARKET_NOT_FOUND = -2;
constexpr int32_t UNAUTHORIZED = -3;
constexpr int32_t INSUFFICIENT_COLLATERAL = -4;
constexpr int32_t ARITHMETIC_OVERFLOW = -5;
constexpr int32_t INVALID_AMOUNT = -10;
constexpr int32_t INVALID_PARAMS = -11;
constexpr int32_t INVALID_PRICE = -12;
constexpr int32_t RESOLUTION_DEPTH_EXCEEDED = -20;
constexpr int32_t ALREADY_INITIALIZED = -30;
constexpr int32_t NOT_INITIALIZED = -31;
constexpr int32_t INVARIANT_VIOLATION = -40;

const char* to_string(int32_t code);
}

// =============================================================================
// Result (status code + value)
// =============================================================================

template <typename T>
struct Result {
    int32_t status;
    T value;

    static Result success(T v) { return Result{errors::OK, std::move(v)}; }
    static Result failure(int32_t code) { return Result{code, T{}}; }

    bool ok() const { return status == errors::OK; }
};

} // namespace lendcore

// Hash support for unordered containers
namespace std {

template <>
struct hash<lendcore::AssetId> {
    size_t operator()(const lendcore::AssetId& a) const noexcept {
        return static_cast<size_t>(lendcore::addresses::hash(a.addr));
    }
};

template <>
struct hash<lendcore::Account> {
    size_t operator()(const lendcore::Account& a) const noexcept {
        return static_cast<size_t>(lendcore::addresses::hash(a.addr));
    }
};

} // namespace std

#endif // LENDCORE_TYPES_HPP
