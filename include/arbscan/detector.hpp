#ifndef ARBSCAN_DETECTOR_HPP
#define ARBSCAN_DETECTOR_HPP

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "route_cache.hpp"
#include "simulator.hpp"

namespace arbscan {

// =============================================================================
// Detection Types
// =============================================================================

// A pool paid out `amount` of `token`; the detector tries to trade the same size
struct TriggerEvent {
    Address pool{};
    Address token{};
    U256 amount = 0;
    uint64_t block_number = 0;
    std::string tx_hash;
};

struct SimulatedRoute {
    RoutePath buy_path;                 // base -> changed token
    RoutePath sell_path;                // changed token -> base
    std::vector<U256> buy_amounts;
    std::vector<U256> sell_amounts;
    std::vector<U256> merged_amounts;   // buy_amounts ++ sell_amounts[1..]
    U256 profit = 0;                    // saturating
    double profit_percentage = 0.0;

    const U256& amount_in() const { return merged_amounts.front(); }
    const U256& amount_out() const { return merged_amounts.back(); }
    TokenId base_token() const { return buy_path.hops.front(); }
};

struct ArbitrageOpportunity {
    TriggerEvent trigger;
    std::vector<SimulatedRoute> profitable_routes;
    std::optional<SimulatedRoute> best_route;     // highest profit percentage
    U256 estimated_profit = 0;
    int64_t latency_us = 0;
    int64_t detected_at_ms = 0;
};

struct DetectorStats {
    uint64_t detections = 0;
    uint64_t candidate_routes = 0;
    uint64_t simulated_routes = 0;
    uint64_t failed_simulations = 0;
    uint64_t profitable_routes = 0;
    uint64_t opportunities = 0;
};

// Profit (saturating) and percentage of the merged amounts; the percentage is 0
// when the input is zero
std::pair<U256, double> compute_profit(const U256& amount_in, const U256& amount_out);

// =============================================================================
// ArbitrageDetector
// =============================================================================
//
// Stateless apart from counters; safe to call from several subscriptions at once.

class ArbitrageDetector {
public:
    ArbitrageDetector(const TokenIndex& index,
                      const RouteCache& routes,
                      const PoolStateCache& cache,
                      const TokenTaxTable* taxes,
                      DetectorConfig config = {});

    // Non-copyable
    ArbitrageDetector(const ArbitrageDetector&) = delete;
    ArbitrageDetector& operator=(const ArbitrageDetector&) = delete;

    std::optional<ArbitrageOpportunity> detect(const TriggerEvent& trigger);

    // Simulate one candidate; nullopt when a hop fails or the route loses money
    std::optional<SimulatedRoute> evaluate(const RoutePath& route, TokenId token,
                                           const U256& amount) const;

    [[nodiscard]] DetectorStats stats() const noexcept;
    [[nodiscard]] const DetectorConfig& config() const noexcept { return config_; }
    [[nodiscard]] const SwapSimulator& simulator() const noexcept { return simulator_; }

private:
    std::vector<std::optional<SimulatedRoute>> evaluate_all(
        const std::vector<const RoutePath*>& routes, TokenId token, const U256& amount) const;

    const TokenIndex& index_;
    const RouteCache& routes_;
    SwapSimulator simulator_;
    DetectorConfig config_;
    size_t workers_;

    std::atomic<uint64_t> detections_{0};
    std::atomic<uint64_t> candidate_routes_{0};
    mutable std::atomic<uint64_t> simulated_routes_{0};
    mutable std::atomic<uint64_t> failed_simulations_{0};
    std::atomic<uint64_t> profitable_routes_{0};
    std::atomic<uint64_t> opportunities_{0};
};

} // namespace arbscan

#endif // ARBSCAN_DETECTOR_HPP
