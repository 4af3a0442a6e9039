#ifndef ARBSCAN_TYPES_HPP
#define ARBSCAN_TYPES_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace arbscan {

// =============================================================================
// EVM Addresses (20 bytes)
// =============================================================================

using Address = std::array<uint8_t, 20>;

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 0;
        for (uint8_t b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// Address whose low 8 bytes hold `low` (big-endian), rest zero
constexpr Address make_address(uint64_t low) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((low >> (8 * i)) & 0xFF);
    }
    return addr;
}

inline bool is_zero_address(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// Accepts "0x"-prefixed or bare 40 hex digits, any case.
// Throws std::invalid_argument on malformed input.
Address parse_address(std::string_view hex);

// Lowercase, "0x"-prefixed
std::string to_hex(const Address& addr);

// Even-length hex blob, "0x" optional. Throws std::invalid_argument.
std::vector<uint8_t> parse_hex_bytes(std::string_view hex);

// =============================================================================
// Wide Integers
// =============================================================================

using U256 = boost::multiprecision::uint256_t;
using U512 = boost::multiprecision::uint512_t;
using I256 = boost::multiprecision::int256_t;

// Q64.96 scaling factor and the 128-bit ceiling used for V3 sanity checks
inline const U256 Q96 = U256(1) << 96;
inline const U256 U128_MAX = (U256(1) << 128) - 1;
inline const U256 U256_MAX = ~U256(0);

// Decimal or "0x" hex. Throws std::invalid_argument on bad digits or overflow.
U256 parse_u256(std::string_view text);

// Big-endian unsigned word (at most 32 bytes)
U256 u256_from_be(const uint8_t* data, size_t len);

// Big-endian two's-complement 256-bit word
I256 i256_from_be(const uint8_t* data);

inline double to_double(const U256& v) {
    return v.convert_to<double>();
}

// =============================================================================
// Token / Pool Identity
// =============================================================================

using TokenId = uint32_t;

enum class PoolType : uint8_t {
    V2,  // constant product, fee in bps
    V3   // concentrated liquidity, fee in pips
};

const char* to_string(PoolType type) noexcept;

// "V2"/"v2"/"V3"/"v3". Throws std::invalid_argument otherwise.
PoolType parse_pool_type(std::string_view text);

namespace fees {

constexpr uint32_t V2_DENOMINATOR = 10000;     // basis points
constexpr uint32_t V3_DENOMINATOR = 1000000;   // pips
constexpr uint32_t DEFAULT_V2_BPS = 25;
constexpr uint32_t DEFAULT_V3_PIPS = 2500;

} // namespace fees

inline int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace arbscan

#endif // ARBSCAN_TYPES_HPP
