#ifndef ARBSCAN_SIMULATOR_HPP
#define ARBSCAN_SIMULATOR_HPP

#include <optional>
#include <vector>

#include "pool_cache.hpp"
#include "route.hpp"
#include "tax.hpp"
#include "token_index.hpp"

namespace arbscan {

struct SimulationConfig {
    std::optional<uint32_t> v2_fee_bps;        // replaces each v2 pool's own fee when set
    const TokenTaxTable* taxes = nullptr;      // no taxes when null
};

// =============================================================================
// SwapSimulator - per-hop and per-route amounts with fee and token tax
// =============================================================================
//
// Tax model: a token's sell tax shrinks what actually reaches the pool when the
// token is deposited, its buy tax shrinks what the trader receives when it is
// withdrawn. Reverse (exact-output) walks gross amounts up with ceiling
// division, so a 100% tax on the way back is infeasible.
//
// Route amount arrays are router style: amounts[0] is sent into the first
// pool, amounts[i] is the net balance of hops[i] after hop i-1.

class SwapSimulator {
public:
    SwapSimulator(const PoolStateCache& cache, const TokenIndex& index,
                  SimulationConfig config = {});

    // Amount received for depositing `amount_in` of `token_in`
    std::optional<U256> hop_exact_in(const PoolState& pool, const Address& token_in,
                                     const U256& amount_in) const;

    // Amount of the other token to send so that `amount_out` of `token_out` arrives
    std::optional<U256> hop_exact_out(const PoolState& pool, const Address& token_out,
                                      const U256& amount_out) const;

    // Forward walk from hops[0]
    std::optional<std::vector<U256>> simulate_sell_path_amounts(const RoutePath& route,
                                                                const U256& amount_in) const;

    // Reverse walk from hops.back(), ending with amounts.back() == amount_out
    std::optional<std::vector<U256>> simulate_buy_path_amounts(const RoutePath& route,
                                                               const U256& amount_out) const;

    const SimulationConfig& config() const noexcept { return config_; }

private:
    uint32_t effective_fee(const PoolState& pool) const;
    uint32_t sell_keep(const Address& token) const;
    uint32_t buy_keep(const Address& token) const;

    const PoolStateCache& cache_;
    const TokenIndex& index_;
    SimulationConfig config_;
};

} // namespace arbscan

#endif // ARBSCAN_SIMULATOR_HPP
