#include "arbscan/reporter.hpp"

#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace arbscan {

using json = nlohmann::json;

namespace {

json amounts_to_json(const std::vector<U256>& amounts) {
    json out = json::array();
    for (const auto& a : amounts) out.push_back(a.str());
    return out;
}

} // anonymous namespace

// =============================================================================
// StaticPriceTable
// =============================================================================

StaticPriceTable::StaticPriceTable(const std::vector<KnownPrice>& prices) {
    for (const auto& p : prices) {
        set(p.address, p.usd);
    }
}

void StaticPriceTable::set(const Address& token, double usd) {
    prices_[token] = usd;
}

std::optional<double> StaticPriceTable::usd_price(const Address& token) const {
    auto it = prices_.find(token);
    if (it == prices_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// OpportunityReporter
// =============================================================================

OpportunityReporter::OpportunityReporter(const TokenIndex& index, const Config& config,
                                         const PriceLookup& prices)
    : index_(index), config_(config), prices_(prices) {
    const std::string& path = config_.reporting.opportunity_log;
    if (!path.empty()) {
        log_file_.open(path, std::ios::app);
        if (!log_file_.is_open()) {
            throw std::runtime_error("Cannot open opportunity log: " + path);
        }
    }
}

std::string OpportunityReporter::label(const Address& token) const {
    if (const BaseToken* base = config_.base_token_by_address(token)) {
        return base->symbol;
    }
    return to_hex(token);
}

uint8_t OpportunityReporter::decimals(const Address& token) const {
    const BaseToken* base = config_.base_token_by_address(token);
    return base ? base->decimals : 18;
}

std::string OpportunityReporter::describe_route(const SimulatedRoute& route) const {
    std::string out;
    const auto& hops = route.buy_path.hops;
    for (size_t i = 0; i < hops.size(); ++i) {
        if (i != 0) out += " -> ";
        out += label(index_.resolve(hops[i]));
    }
    // sell_path starts where buy_path ends
    for (size_t i = 1; i < route.sell_path.hops.size(); ++i) {
        out += " -> ";
        out += label(index_.resolve(route.sell_path.hops[i]));
    }
    return out;
}

std::optional<double> OpportunityReporter::profit_usd(const SimulatedRoute& route) const {
    const Address& base = index_.resolve(route.base_token());
    auto price = prices_.usd_price(base);
    if (!price) return std::nullopt;
    return to_double(route.profit) / std::pow(10.0, decimals(base)) * *price;
}

json OpportunityReporter::to_json(const ArbitrageOpportunity& opportunity) const {
    const TriggerEvent& trigger = opportunity.trigger;
    json record = {
        {"detected_at_ms", opportunity.detected_at_ms},
        {"latency_us", opportunity.latency_us},
        {"block_number", trigger.block_number},
        {"tx_hash", trigger.tx_hash},
        {"pool", to_hex(trigger.pool)},
        {"token", to_hex(trigger.token)},
        {"amount", trigger.amount.str()},
        {"profitable_routes", opportunity.profitable_routes.size()},
        {"estimated_profit", opportunity.estimated_profit.str()}
    };

    if (opportunity.best_route) {
        const SimulatedRoute& best = *opportunity.best_route;
        json pools = json::array();
        for (const auto& p : best.buy_path.pools) pools.push_back(to_hex(p));
        for (const auto& p : best.sell_path.pools) pools.push_back(to_hex(p));

        json tokens = json::array();
        for (TokenId id : best.buy_path.hops) tokens.push_back(to_hex(index_.resolve(id)));
        for (size_t i = 1; i < best.sell_path.hops.size(); ++i) {
            tokens.push_back(to_hex(index_.resolve(best.sell_path.hops[i])));
        }

        record["best_route"] = {
            {"base_token", to_hex(index_.resolve(best.base_token()))},
            {"tokens", std::move(tokens)},
            {"pools", std::move(pools)},
            {"amounts", amounts_to_json(best.merged_amounts)},
            {"profit", best.profit.str()},
            {"profit_percentage", best.profit_percentage}
        };
        if (auto usd = profit_usd(best)) {
            record["profit_usd"] = *usd;
        }
    }
    return record;
}

void OpportunityReporter::report(const ArbitrageOpportunity& opportunity) {
    reported_.fetch_add(1, std::memory_order_relaxed);
    if (!opportunity.best_route) return;

    const SimulatedRoute& best = *opportunity.best_route;
    auto usd = profit_usd(best);
    if (!usd) {
        unpriced_.fetch_add(1, std::memory_order_relaxed);
    }

    bool worth_reporting = usd ? *usd >= config_.reporting.min_profit_usd
                               : best.profit >= config_.reporting.min_profit_wei;

    std::string route = describe_route(best);
    if (worth_reporting) {
        above_threshold_.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("Opportunity {} | +{:.4f}% | ${:.4f} | {} routes | block {} | {} us",
                     route, best.profit_percentage, usd.value_or(0.0),
                     opportunity.profitable_routes.size(),
                     opportunity.trigger.block_number, opportunity.latency_us);
    } else {
        spdlog::debug("Opportunity {} | +{:.4f}% | profit {} raw | below threshold",
                      route, best.profit_percentage, best.profit.str());
    }

    if (log_file_.is_open()) {
        log_file_ << to_json(opportunity).dump() << '\n';
        log_file_.flush();
        if (!log_file_) {
            spdlog::error("Failed writing opportunity log {}", config_.reporting.opportunity_log);
            log_file_.clear();
        }
    }
}

ReporterStats OpportunityReporter::stats() const {
    ReporterStats s;
    s.reported = reported_.load(std::memory_order_relaxed);
    s.above_threshold = above_threshold_.load(std::memory_order_relaxed);
    s.unpriced = unpriced_.load(std::memory_order_relaxed);
    return s;
}

// =============================================================================
// ReportingWorker
// =============================================================================

ReportingWorker::ReportingWorker(OpportunityChannel& channel, OpportunityReporter& reporter,
                                 std::chrono::milliseconds poll_interval)
    : channel_(channel) {
    thread_ = std::thread([&channel, &reporter, poll_interval]() {
        while (!channel.drained()) {
            if (auto opportunity = channel.pop(poll_interval)) {
                reporter.report(*opportunity);
            }
        }
    });
}

ReportingWorker::~ReportingWorker() {
    stop();
}

void ReportingWorker::stop() {
    channel_.close();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace arbscan
