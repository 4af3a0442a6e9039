// =============================================================================
// detector.cpp - Route filtering, leg simulation and ranking
// =============================================================================

#include "arbscan/detector.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

#include <spdlog/spdlog.h>

namespace arbscan {

std::pair<U256, double> compute_profit(const U256& amount_in, const U256& amount_out) {
    U256 profit = amount_out > amount_in ? U256(amount_out - amount_in) : U256(0);
    double percentage = 0.0;
    if (amount_in > 0) {
        percentage = to_double(profit) / to_double(amount_in) * 100.0;
    }
    return {profit, percentage};
}

ArbitrageDetector::ArbitrageDetector(const TokenIndex& index,
                                     const RouteCache& routes,
                                     const PoolStateCache& cache,
                                     const TokenTaxTable* taxes,
                                     DetectorConfig config)
    : index_(index)
    , routes_(routes)
    , simulator_(cache, index, SimulationConfig{config.v2_fee_override, taxes})
    , config_(std::move(config))
    , workers_(config_.workers != 0 ? config_.workers
                                    : std::max(1u, std::thread::hardware_concurrency())) {}

// =============================================================================
// Single Route
// =============================================================================

std::optional<SimulatedRoute> ArbitrageDetector::evaluate(const RoutePath& route, TokenId token,
                                                          const U256& amount) const {
    simulated_routes_.fetch_add(1, std::memory_order_relaxed);

    auto legs = split_route_around_token(route, token);
    if (!legs) return std::nullopt;

    SimulatedRoute result;
    result.buy_path = std::move(legs->first);
    result.sell_path = std::move(legs->second);

    auto buy_amounts = simulator_.simulate_buy_path_amounts(result.buy_path, amount);
    auto sell_amounts = buy_amounts
        ? simulator_.simulate_sell_path_amounts(result.sell_path, amount)
        : std::nullopt;
    if (!buy_amounts || !sell_amounts) {
        failed_simulations_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    result.buy_amounts = std::move(*buy_amounts);
    result.sell_amounts = std::move(*sell_amounts);
    result.merged_amounts = result.buy_amounts;
    result.merged_amounts.insert(result.merged_amounts.end(),
                                 result.sell_amounts.begin() + 1, result.sell_amounts.end());

    const U256& amount_in = result.amount_in();
    const U256& amount_out = result.amount_out();
    if (amount_in == 0 || amount_out == 0 || amount_out <= amount_in) {
        return std::nullopt;
    }

    auto [profit, percentage] = compute_profit(amount_in, amount_out);
    if (profit < config_.min_profit) return std::nullopt;

    // Reject results that only a broken pool state could produce
    if (percentage > config_.max_profit_percentage) {
        spdlog::debug("Dropping route with implausible profit {:.2f}%", percentage);
        return std::nullopt;
    }

    result.profit = profit;
    result.profit_percentage = percentage;
    return result;
}

// =============================================================================
// Parallel Evaluation
// =============================================================================

std::vector<std::optional<SimulatedRoute>> ArbitrageDetector::evaluate_all(
    const std::vector<const RoutePath*>& routes, TokenId token, const U256& amount) const {

    std::vector<std::optional<SimulatedRoute>> results(routes.size());
    size_t per_task = std::max<size_t>(1, config_.routes_per_task);

    if (routes.size() <= per_task || workers_ <= 1) {
        for (size_t i = 0; i < routes.size(); ++i) {
            results[i] = evaluate(*routes[i], token, amount);
        }
        return results;
    }

    size_t tasks = std::min(workers_, (routes.size() + per_task - 1) / per_task);
    size_t chunk = (routes.size() + tasks - 1) / tasks;

    std::vector<std::future<void>> futures;
    futures.reserve(tasks);
    for (size_t t = 0; t < tasks; ++t) {
        size_t begin = t * chunk;
        size_t end = std::min(routes.size(), begin + chunk);
        if (begin >= end) break;

        // Each task owns a disjoint slice of `results`
        futures.push_back(std::async(std::launch::async, [&, begin, end]() {
            for (size_t i = begin; i < end; ++i) {
                results[i] = evaluate(*routes[i], token, amount);
            }
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
    return results;
}

// =============================================================================
// Detection Pass
// =============================================================================

std::optional<ArbitrageOpportunity> ArbitrageDetector::detect(const TriggerEvent& trigger) {
    auto start = std::chrono::steady_clock::now();
    detections_.fetch_add(1, std::memory_order_relaxed);

    auto token = index_.find(trigger.token);
    if (!token) {
        spdlog::debug("Trigger token {} is not indexed", to_hex(trigger.token));
        return std::nullopt;
    }
    if (trigger.amount == 0) {
        return std::nullopt;
    }

    std::vector<const RoutePath*> candidates;
    for (const auto& route : routes_.routes_for(*token)) {
        if (route.uses_pool(trigger.pool)) {
            candidates.push_back(&route);
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    candidate_routes_.fetch_add(candidates.size(), std::memory_order_relaxed);

    auto results = evaluate_all(candidates, *token, trigger.amount);

    ArbitrageOpportunity opportunity;
    for (auto& result : results) {
        if (result) {
            opportunity.profitable_routes.push_back(std::move(*result));
        }
    }
    if (opportunity.profitable_routes.empty()) {
        return std::nullopt;
    }
    profitable_routes_.fetch_add(opportunity.profitable_routes.size(), std::memory_order_relaxed);

    // Percentages compare across base tokens; absolute profits do not
    auto best = std::max_element(
        opportunity.profitable_routes.begin(), opportunity.profitable_routes.end(),
        [](const SimulatedRoute& a, const SimulatedRoute& b) {
            return a.profit_percentage < b.profit_percentage;
        });

    opportunity.trigger = trigger;
    opportunity.best_route = *best;
    opportunity.estimated_profit = best->profit;
    opportunity.detected_at_ms = now_ms();
    opportunity.latency_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();

    opportunities_.fetch_add(1, std::memory_order_relaxed);
    return opportunity;
}

DetectorStats ArbitrageDetector::stats() const noexcept {
    DetectorStats s;
    s.detections = detections_.load(std::memory_order_relaxed);
    s.candidate_routes = candidate_routes_.load(std::memory_order_relaxed);
    s.simulated_routes = simulated_routes_.load(std::memory_order_relaxed);
    s.failed_simulations = failed_simulations_.load(std::memory_order_relaxed);
    s.profitable_routes = profitable_routes_.load(std::memory_order_relaxed);
    s.opportunities = opportunities_.load(std::memory_order_relaxed);
    return s;
}

} // namespace arbscan
