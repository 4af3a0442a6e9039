#ifndef ARBSCAN_AMM_MATH_HPP
#define ARBSCAN_AMM_MATH_HPP

#include <optional>

#include "types.hpp"

namespace arbscan {

// =============================================================================
// Constant-Product (Uniswap v2) Hop Math
// =============================================================================
//
// Fees are in basis points over 10000. All functions return nullopt instead of
// a wrong number: zero reserves, a fee of 100%, draining the pool or a result
// wider than 256 bits.

namespace v2_math {

// amountIn * (10000-f) * reserveOut / (reserveIn * 10000 + amountIn * (10000-f))
std::optional<U256> get_amount_out(const U256& amount_in, const U256& reserve_in,
                                   const U256& reserve_out, uint32_t fee_bps);

// reserveIn * amountOut * 10000 / ((reserveOut - amountOut) * (10000-f)) + 1
std::optional<U256> get_amount_in(const U256& amount_out, const U256& reserve_in,
                                  const U256& reserve_out, uint32_t fee_bps);

} // namespace v2_math

// =============================================================================
// Concentrated-Liquidity (Uniswap v3) Single-Step Math
// =============================================================================
//
// Closed-form swap within the current tick range (no tick crossing). Fees are
// in pips over 1e6. Prices move toward the trader's disadvantage on rounding,
// so exact_out followed by exact_in with the returned amount yields at least
// the requested output.
//
// Rejected inputs: zero liquidity or price, liquidity or price above 2^128-1,
// outputs above 1000x the input (exact_in), inputs above 1000x the output
// (exact_out), and exact_out inputs that exact_in would itself reject.

namespace v3_math {

constexpr uint32_t MAX_AMOUNT_RATIO = 1000;

std::optional<U256> swap_exact_in(const U256& amount_in, const U256& sqrt_price_x96,
                                  const U256& liquidity, uint32_t fee_pips, bool zero_for_one);

std::optional<U256> swap_exact_out(const U256& amount_out, const U256& sqrt_price_x96,
                                   const U256& liquidity, uint32_t fee_pips, bool zero_for_one);

// Price of token0 in token1 (reporting only)
double sqrt_price_to_price(const U256& sqrt_price_x96);

} // namespace v3_math

} // namespace arbscan

#endif // ARBSCAN_AMM_MATH_HPP
