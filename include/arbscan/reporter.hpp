#ifndef ARBSCAN_REPORTER_HPP
#define ARBSCAN_REPORTER_HPP

#include <atomic>
#include <chrono>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "channel.hpp"
#include "config.hpp"
#include "detector.hpp"
#include "token_index.hpp"

namespace arbscan {

// =============================================================================
// Price Lookup
// =============================================================================

class PriceLookup {
public:
    virtual ~PriceLookup() = default;

    // USD per whole token, nullopt when unknown
    virtual std::optional<double> usd_price(const Address& token) const = 0;
};

class StaticPriceTable : public PriceLookup {
public:
    StaticPriceTable() = default;
    explicit StaticPriceTable(const std::vector<KnownPrice>& prices);

    void set(const Address& token, double usd);
    std::optional<double> usd_price(const Address& token) const override;

    size_t size() const { return prices_.size(); }

private:
    std::unordered_map<Address, double, AddressHash> prices_;
};

// =============================================================================
// OpportunityReporter
// =============================================================================
//
// Runs on the channel consumer thread. Opportunities worth at least
// min_profit_usd (or min_profit_wei when the base token has no price) are
// logged at info, the rest at debug. Every opportunity is appended to the
// JSONL log when one is configured.

struct ReporterStats {
    uint64_t reported = 0;
    uint64_t above_threshold = 0;
    uint64_t unpriced = 0;
};

class OpportunityReporter {
public:
    // Throws std::runtime_error when the opportunity log cannot be opened
    OpportunityReporter(const TokenIndex& index, const Config& config, const PriceLookup& prices);

    // Non-copyable
    OpportunityReporter(const OpportunityReporter&) = delete;
    OpportunityReporter& operator=(const OpportunityReporter&) = delete;

    void report(const ArbitrageOpportunity& opportunity);

    // Profit of the route valued in USD via its base token
    std::optional<double> profit_usd(const SimulatedRoute& route) const;

    nlohmann::json to_json(const ArbitrageOpportunity& opportunity) const;

    // "WBNB -> 0xabc.. -> WBNB"
    std::string describe_route(const SimulatedRoute& route) const;

    [[nodiscard]] ReporterStats stats() const;

private:
    std::string label(const Address& token) const;
    uint8_t decimals(const Address& token) const;

    const TokenIndex& index_;
    const Config& config_;
    const PriceLookup& prices_;
    std::ofstream log_file_;

    std::atomic<uint64_t> reported_{0};
    std::atomic<uint64_t> above_threshold_{0};
    std::atomic<uint64_t> unpriced_{0};
};

// =============================================================================
// ReportingWorker - channel consumer thread
// =============================================================================
//
// Feeds every opportunity popped from the channel to the reporter. stop() and
// the destructor close the channel, let the thread drain it and join.

class ReportingWorker {
public:
    ReportingWorker(OpportunityChannel& channel, OpportunityReporter& reporter,
                    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200));
    ~ReportingWorker();

    // Non-copyable
    ReportingWorker(const ReportingWorker&) = delete;
    ReportingWorker& operator=(const ReportingWorker&) = delete;

    void stop();

private:
    OpportunityChannel& channel_;
    std::thread thread_;
};

} // namespace arbscan

#endif // ARBSCAN_REPORTER_HPP
