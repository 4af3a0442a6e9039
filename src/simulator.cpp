#include "arbscan/simulator.hpp"

#include "arbscan/amm_math.hpp"

namespace arbscan {

namespace {

constexpr uint32_t PPM = fees::V3_DENOMINATOR;

inline U256 apply_keep(const U256& amount, uint32_t keep) {
    if (keep == PPM) return amount;
    return static_cast<U256>(U512(amount) * keep / PPM);
}

// Smallest gross amount whose kept part is at least `net`
inline std::optional<U256> gross_up(const U256& net, uint32_t keep) {
    if (keep == PPM) return net;
    if (keep == 0) return std::nullopt;
    U512 num = U512(net) * PPM;
    U512 q = num / keep;
    if (q * keep != num) q += 1;
    if (q > U512(U256_MAX)) return std::nullopt;
    return static_cast<U256>(q);
}

} // anonymous namespace

SwapSimulator::SwapSimulator(const PoolStateCache& cache, const TokenIndex& index,
                             SimulationConfig config)
    : cache_(cache), index_(index), config_(config) {}

uint32_t SwapSimulator::effective_fee(const PoolState& pool) const {
    if (pool.type() == PoolType::V2 && config_.v2_fee_bps) {
        return *config_.v2_fee_bps;
    }
    return pool.fee;
}

uint32_t SwapSimulator::sell_keep(const Address& token) const {
    if (config_.taxes == nullptr) return PPM;
    auto info = config_.taxes->get(token);
    return info ? keep_ppm(info->sell_tax) : PPM;
}

uint32_t SwapSimulator::buy_keep(const Address& token) const {
    if (config_.taxes == nullptr) return PPM;
    auto info = config_.taxes->get(token);
    return info ? keep_ppm(info->buy_tax) : PPM;
}

// =============================================================================
// Single Hop
// =============================================================================

std::optional<U256> SwapSimulator::hop_exact_in(const PoolState& pool, const Address& token_in,
                                                const U256& amount_in) const {
    if (token_in != pool.token0 && token_in != pool.token1) {
        return std::nullopt;
    }
    bool zero_for_one = token_in == pool.token0;
    const Address& token_out = zero_for_one ? pool.token1 : pool.token0;

    U256 deposited = apply_keep(amount_in, sell_keep(token_in));
    uint32_t fee = effective_fee(pool);

    std::optional<U256> pool_out;
    if (const Reserves* r = pool.reserves()) {
        const U256& reserve_in = zero_for_one ? r->reserve0 : r->reserve1;
        const U256& reserve_out = zero_for_one ? r->reserve1 : r->reserve0;
        pool_out = v2_math::get_amount_out(deposited, reserve_in, reserve_out, fee);
    } else {
        const ConcentratedState* cl = pool.concentrated();
        pool_out = v3_math::swap_exact_in(deposited, cl->sqrt_price_x96, cl->liquidity, fee, zero_for_one);
    }
    if (!pool_out) return std::nullopt;

    return apply_keep(*pool_out, buy_keep(token_out));
}

std::optional<U256> SwapSimulator::hop_exact_out(const PoolState& pool, const Address& token_out,
                                                 const U256& amount_out) const {
    if (token_out != pool.token0 && token_out != pool.token1) {
        return std::nullopt;
    }
    bool zero_for_one = token_out == pool.token1;
    const Address& token_in = zero_for_one ? pool.token0 : pool.token1;

    auto withdrawn = gross_up(amount_out, buy_keep(token_out));
    if (!withdrawn) return std::nullopt;
    uint32_t fee = effective_fee(pool);

    std::optional<U256> pool_in;
    if (const Reserves* r = pool.reserves()) {
        const U256& reserve_in = zero_for_one ? r->reserve0 : r->reserve1;
        const U256& reserve_out = zero_for_one ? r->reserve1 : r->reserve0;
        pool_in = v2_math::get_amount_in(*withdrawn, reserve_in, reserve_out, fee);
    } else {
        const ConcentratedState* cl = pool.concentrated();
        pool_in = v3_math::swap_exact_out(*withdrawn, cl->sqrt_price_x96, cl->liquidity, fee, zero_for_one);
    }
    if (!pool_in) return std::nullopt;

    return gross_up(*pool_in, sell_keep(token_in));
}

// =============================================================================
// Route Walks
// =============================================================================

std::optional<std::vector<U256>> SwapSimulator::simulate_sell_path_amounts(
    const RoutePath& route, const U256& amount_in) const {

    if (route.hops.size() != route.pools.size() + 1) return std::nullopt;

    std::vector<U256> amounts;
    amounts.reserve(route.hops.size());
    amounts.push_back(amount_in);

    for (size_t i = 0; i < route.pools.size(); ++i) {
        auto pool = cache_.find(route.pools[i]);
        if (!pool) return std::nullopt;

        const Address& token_in = index_.resolve(route.hops[i]);
        const Address& token_out = index_.resolve(route.hops[i + 1]);
        if (token_out != (token_in == pool->token0 ? pool->token1 : pool->token0)) {
            return std::nullopt;
        }

        auto out = hop_exact_in(*pool, token_in, amounts.back());
        if (!out) return std::nullopt;
        amounts.push_back(*out);
    }
    return amounts;
}

std::optional<std::vector<U256>> SwapSimulator::simulate_buy_path_amounts(
    const RoutePath& route, const U256& amount_out) const {

    if (route.hops.size() != route.pools.size() + 1) return std::nullopt;

    std::vector<U256> amounts(route.hops.size());
    amounts.back() = amount_out;

    for (size_t i = route.pools.size(); i-- > 0;) {
        auto pool = cache_.find(route.pools[i]);
        if (!pool) return std::nullopt;

        const Address& token_in = index_.resolve(route.hops[i]);
        const Address& token_out = index_.resolve(route.hops[i + 1]);
        if (token_in != (token_out == pool->token0 ? pool->token1 : pool->token0)) {
            return std::nullopt;
        }

        auto in = hop_exact_out(*pool, token_out, amounts[i + 1]);
        if (!in) return std::nullopt;
        amounts[i] = *in;
    }
    return amounts;
}

} // namespace arbscan
