// =============================================================================
// types.cpp - Address and 256-bit integer parsing
// =============================================================================

#include "arbscan/types.hpp"

#include <stdexcept>

namespace arbscan {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view strip_0x(std::string_view s) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
    }
    return s;
}

constexpr char HEX_DIGITS[] = "0123456789abcdef";

} // anonymous namespace

Address parse_address(std::string_view hex) {
    std::string_view digits = strip_0x(hex);
    if (digits.size() != 40) {
        throw std::invalid_argument("invalid address length: " + std::string(hex));
    }

    Address addr{};
    for (size_t i = 0; i < 20; ++i) {
        int hi = hex_value(digits[2 * i]);
        int lo = hex_value(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid address digit: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> parse_hex_bytes(std::string_view hex) {
    std::string_view digits = strip_0x(hex);
    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("odd-length hex data");
    }

    std::vector<uint8_t> bytes(digits.size() / 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        int hi = hex_value(digits[2 * i]);
        int lo = hex_value(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in data");
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return bytes;
}

U256 parse_u256(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty integer literal");
    }

    bool is_hex = text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
    U512 value = 0;

    if (is_hex) {
        std::string_view digits = strip_0x(text);
        for (char c : digits) {
            int v = hex_value(c);
            if (v < 0) {
                throw std::invalid_argument("invalid hex digit in: " + std::string(text));
            }
            value = (value << 4) | v;
            if (value > U512(U256_MAX)) {
                throw std::invalid_argument("integer exceeds 256 bits: " + std::string(text));
            }
        }
    } else {
        for (char c : text) {
            if (c < '0' || c > '9') {
                throw std::invalid_argument("invalid decimal digit in: " + std::string(text));
            }
            value = value * 10 + (c - '0');
            if (value > U512(U256_MAX)) {
                throw std::invalid_argument("integer exceeds 256 bits: " + std::string(text));
            }
        }
    }
    return static_cast<U256>(value);
}

U256 u256_from_be(const uint8_t* data, size_t len) {
    if (len > 32) {
        throw std::invalid_argument("word wider than 32 bytes");
    }
    U256 value = 0;
    for (size_t i = 0; i < len; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

I256 i256_from_be(const uint8_t* data) {
    U256 raw = u256_from_be(data, 32);
    if ((data[0] & 0x80) == 0) {
        return static_cast<I256>(raw);
    }
    // Negative: magnitude is the two's complement
    U256 magnitude = ~raw + 1;
    return -static_cast<I256>(magnitude);
}

const char* to_string(PoolType type) noexcept {
    switch (type) {
        case PoolType::V2: return "V2";
        case PoolType::V3: return "V3";
    }
    return "unknown";
}

PoolType parse_pool_type(std::string_view text) {
    if (text == "V2" || text == "v2") return PoolType::V2;
    if (text == "V3" || text == "v3") return PoolType::V3;
    throw std::invalid_argument("unknown pool version: " + std::string(text));
}

} // namespace arbscan
