// =============================================================================
// amm_math.cpp - Exact integer hop math for v2 and v3 pools
// =============================================================================

#include "arbscan/amm_math.hpp"

#include <cmath>

namespace arbscan {

namespace {

// Wide enough for every intermediate product of 256-bit operands
using U1024 = boost::multiprecision::uint1024_t;

const U1024 WIDE_U256_MAX = U1024(U256_MAX);

inline U1024 wide(const U256& v) { return U1024(v); }

inline U1024 div_up(const U1024& num, const U1024& den) {
    U1024 q = num / den;
    if (q * den != num) q += 1;
    return q;
}

inline std::optional<U256> narrow(const U1024& v) {
    if (v > WIDE_U256_MAX) return std::nullopt;
    return static_cast<U256>(v);
}

bool v3_inputs_valid(const U256& sqrt_price_x96, const U256& liquidity, uint32_t fee_pips) {
    if (liquidity == 0 || sqrt_price_x96 == 0) return false;
    if (liquidity > U128_MAX || sqrt_price_x96 > U128_MAX) return false;
    return fee_pips < fees::V3_DENOMINATOR;
}

} // anonymous namespace

// =============================================================================
// v2
// =============================================================================

namespace v2_math {

std::optional<U256> get_amount_out(const U256& amount_in, const U256& reserve_in,
                                   const U256& reserve_out, uint32_t fee_bps) {
    if (reserve_in == 0 || reserve_out == 0 || fee_bps >= fees::V2_DENOMINATOR) {
        return std::nullopt;
    }

    U1024 in_with_fee = wide(amount_in) * (fees::V2_DENOMINATOR - fee_bps);
    U1024 numerator = in_with_fee * wide(reserve_out);
    U1024 denominator = wide(reserve_in) * fees::V2_DENOMINATOR + in_with_fee;
    return narrow(numerator / denominator);
}

std::optional<U256> get_amount_in(const U256& amount_out, const U256& reserve_in,
                                  const U256& reserve_out, uint32_t fee_bps) {
    if (reserve_in == 0 || reserve_out == 0 || fee_bps >= fees::V2_DENOMINATOR) {
        return std::nullopt;
    }
    if (amount_out >= reserve_out) {
        return std::nullopt;  // insufficient liquidity
    }

    U1024 numerator = wide(reserve_in) * wide(amount_out) * fees::V2_DENOMINATOR;
    U1024 denominator = wide(reserve_out - amount_out) * (fees::V2_DENOMINATOR - fee_bps);
    return narrow(numerator / denominator + 1);
}

} // namespace v2_math

// =============================================================================
// v3
// =============================================================================

namespace v3_math {

std::optional<U256> swap_exact_in(const U256& amount_in, const U256& sqrt_price_x96,
                                  const U256& liquidity, uint32_t fee_pips, bool zero_for_one) {
    if (!v3_inputs_valid(sqrt_price_x96, liquidity, fee_pips)) {
        return std::nullopt;
    }

    const U1024 sqrt_p = wide(sqrt_price_x96);
    const U1024 liq = wide(liquidity);
    const U1024 liq_x96 = liq << 96;

    // Fee comes off the input before the price moves
    U1024 amount = wide(amount_in) * (fees::V3_DENOMINATOR - fee_pips) / fees::V3_DENOMINATOR;

    U1024 amount_out;
    if (zero_for_one) {
        // token0 in: sqrtNew = L*Q96*sqrtP / (L*Q96 + amount*sqrtP), rounded up
        U1024 sqrt_new = div_up(liq_x96 * sqrt_p, liq_x96 + amount * sqrt_p);
        // token1 out = L * (sqrtP - sqrtNew) / Q96, rounded down
        amount_out = (liq * (sqrt_p - sqrt_new)) >> 96;
    } else {
        // token1 in: sqrtNew = sqrtP + amount*Q96/L, rounded down
        U1024 sqrt_new = sqrt_p + (amount << 96) / liq;
        // token0 out = L*Q96*(sqrtNew - sqrtP) / (sqrtNew * sqrtP), rounded down
        amount_out = liq_x96 * (sqrt_new - sqrt_p) / (sqrt_new * sqrt_p);
    }

    if (amount_out > wide(amount_in) * MAX_AMOUNT_RATIO) {
        return std::nullopt;
    }
    return narrow(amount_out);
}

std::optional<U256> swap_exact_out(const U256& amount_out, const U256& sqrt_price_x96,
                                   const U256& liquidity, uint32_t fee_pips, bool zero_for_one) {
    if (!v3_inputs_valid(sqrt_price_x96, liquidity, fee_pips)) {
        return std::nullopt;
    }
    if (amount_out > liquidity) {
        return std::nullopt;
    }

    const U1024 sqrt_p = wide(sqrt_price_x96);
    const U1024 liq = wide(liquidity);
    const U1024 liq_x96 = liq << 96;
    const U1024 out = wide(amount_out);

    U1024 amount_net;
    if (zero_for_one) {
        // token1 out lowers the price by ceil(out*Q96/L)
        U1024 delta = div_up(out << 96, liq);
        if (delta >= sqrt_p) return std::nullopt;
        U1024 sqrt_new = sqrt_p - delta;
        // token0 in = L*Q96*(sqrtP - sqrtNew) / (sqrtNew * sqrtP), rounded up
        amount_net = div_up(liq_x96 * (sqrt_p - sqrt_new), sqrt_new * sqrt_p);
    } else {
        // token0 out raises the price to L*Q96*sqrtP / (L*Q96 - out*sqrtP), rounded up
        U1024 product = out * sqrt_p;
        if (product >= liq_x96) return std::nullopt;
        U1024 sqrt_new = div_up(liq_x96 * sqrt_p, liq_x96 - product);
        // token1 in = L * (sqrtNew - sqrtP) / Q96, rounded up
        amount_net = div_up(liq * (sqrt_new - sqrt_p), U1024(1) << 96);
    }

    // Gross up for the fee, then one extra unit
    U1024 amount_in = div_up(amount_net * fees::V3_DENOMINATOR,
                             U1024(fees::V3_DENOMINATOR - fee_pips)) + 1;

    if (amount_in > out * MAX_AMOUNT_RATIO) {
        return std::nullopt;
    }
    auto result = narrow(amount_in);
    if (!result) {
        return std::nullopt;
    }
    // The forward step yields at least amount_out, so its ratio bound can trip
    // even when amount_out itself is within 1000x of the input
    if (!swap_exact_in(*result, sqrt_price_x96, liquidity, fee_pips, zero_for_one)) {
        return std::nullopt;
    }
    return result;
}

double sqrt_price_to_price(const U256& sqrt_price_x96) {
    double ratio = to_double(sqrt_price_x96) / to_double(Q96);
    return ratio * ratio;
}

} // namespace v3_math

} // namespace arbscan
