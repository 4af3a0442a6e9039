// arbscan - real-time cyclic arbitrage scanner for constant-product and
// concentrated-liquidity pools.
//
// Loads the pool and token-tax feeds, builds every cycle through the base
// tokens, subscribes to Sync/Swap logs and reports the profitable cycles each
// state change opens up.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "arbscan/channel.hpp"
#include "arbscan/config.hpp"
#include "arbscan/detector.hpp"
#include "arbscan/events.hpp"
#include "arbscan/ingestion.hpp"
#include "arbscan/log.hpp"
#include "arbscan/pool_feed.hpp"
#include "arbscan/reporter.hpp"
#include "arbscan/route_cache.hpp"
#include "arbscan/rpc_preload.hpp"
#include "arbscan/tax.hpp"
#include "arbscan/token_index.hpp"
#include "arbscan/ws_subscription.hpp"

using namespace arbscan;
using std::chrono::steady_clock;

namespace {

std::atomic<bool> g_shutdown{false};

void handle_signal(int) {
    g_shutdown.store(true);
}

constexpr auto HEARTBEAT_INTERVAL = std::chrono::seconds(30);
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(200);

//------------------------------------------------------------------------------
// Command Line
//------------------------------------------------------------------------------

struct CliOptions {
    std::optional<std::string> config_path;
    std::vector<std::string> pool_files;
    std::optional<std::string> tax_file;
    std::optional<std::string> ws_url;
    std::optional<std::string> rpc_url;
    std::optional<std::string> log_level;
    bool no_preload = false;
    bool build_routes_only = false;
};

void print_usage(const char* prog) {
    std::cout << "arbscan - cyclic arbitrage scanner\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>     JSON config file\n"
              << "  -p, --pools <files>     Pool feed JSONL, comma separated or repeated\n"
              << "  -t, --taxes <file>      Token tax JSONL\n"
              << "      --ws-url <url>      Node websocket endpoint\n"
              << "      --rpc-url <url>     Node HTTP JSON-RPC endpoint\n"
              << "  -l, --log-level <lvl>   trace|debug|info|warn|error|critical|off\n"
              << "      --no-preload        Skip the eth_call state snapshot\n"
              << "      --build-routes-only Build the route cache, print stats and exit\n"
              << "  -h, --help              Show this help message\n";
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    auto value_of = [&](int& i, const std::string& arg) -> std::string {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            std::exit(1);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            opts.config_path = value_of(i, arg);
        } else if (arg == "-p" || arg == "--pools") {
            for (auto& f : split_list(value_of(i, arg))) opts.pool_files.push_back(std::move(f));
        } else if (arg == "-t" || arg == "--taxes") {
            opts.tax_file = value_of(i, arg);
        } else if (arg == "--ws-url") {
            opts.ws_url = value_of(i, arg);
        } else if (arg == "--rpc-url") {
            opts.rpc_url = value_of(i, arg);
        } else if (arg == "-l" || arg == "--log-level") {
            opts.log_level = value_of(i, arg);
        } else if (arg == "--no-preload") {
            opts.no_preload = true;
        } else if (arg == "--build-routes-only") {
            opts.build_routes_only = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return opts;
}

Config load_config(const CliOptions& opts) {
    Config config = opts.config_path ? Config::from_file(*opts.config_path) : Config();

    if (!opts.pool_files.empty()) config.with_pool_files(opts.pool_files);
    if (opts.tax_file) config.with_tax_file(*opts.tax_file);
    if (opts.ws_url) config.with_ws_url(*opts.ws_url);
    if (opts.rpc_url) config.with_rpc_url(*opts.rpc_url);
    if (opts.log_level) config.with_log_level(*opts.log_level);
    if (opts.no_preload) config.without_preload();

    config.validate();
    return config;
}

//------------------------------------------------------------------------------
// Supervisor
//------------------------------------------------------------------------------

// Remembers when the oldest unrecovered failure happened
class FailureTracker {
public:
    void record(const std::string& name, const Error& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!since_) since_ = steady_clock::now();
        spdlog::error("Subsystem {} down: {} (code {})", name, error.message, error.code);
    }

    bool due(std::chrono::milliseconds delay) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return since_ && steady_clock::now() - *since_ >= delay;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        since_.reset();
    }

private:
    mutable std::mutex mutex_;
    std::optional<steady_clock::time_point> since_;
};

void log_heartbeat(const PoolStateCache& cache, const RouteCache& routes,
                   const ArbitrageDetector& detector, const IngestionLoop& loop,
                   const OpportunityReporter& reporter, const OpportunityChannel& channel) {
    auto d = detector.stats();
    auto i = loop.stats();
    auto r = reporter.stats();

    spdlog::info("Heartbeat | pools {} | routes {} | events {} (bad {}, unknown pool {}) | "
                 "triggers {} | simulated {} | opportunities {} | reported {} (>= threshold {}) | "
                 "queued {} | reconnects {}",
                 cache.size(), routes.stats().unique_routes, i.events_received, i.decode_errors,
                 i.unknown_pools, i.triggers, d.simulated_routes, d.opportunities,
                 r.reported, r.above_threshold, channel.size(), i.reconnects);

    for (const auto& [name, state] : loop.states()) {
        spdlog::debug("  subscription {}: {}", name, to_string(state));
    }
}

EventSourceFactory ws_factory(const Config& config, std::vector<std::string> topics) {
    WsSubscriptionConfig ws;
    ws.url = config.network.ws_url;
    ws.topics = std::move(topics);
    ws.connect_timeout = config.ingestion.connect_timeout;

    return [ws]() -> std::unique_ptr<EventSource> {
        return std::make_unique<WsLogSubscription>(ws);
    };
}

int run(const Config& config, bool build_routes_only) {
    // Feeds
    PoolFeed feed = load_pool_feed(config.data.pool_files, config);
    TokenTaxTable taxes = TokenTaxTable::load_jsonl(config.data.tax_file);
    spdlog::info("Loaded {} pools ({} malformed, {} duplicates)",
                 feed.pools.size(), feed.skipped, feed.duplicates);

    TokenIndex index = TokenIndex::from_pools(feed.pools);
    PoolStateCache cache;
    seed_cache(feed.pools, cache);

    // Routes
    std::vector<TokenId> base_ids = resolve_base_tokens(index, config.base_tokens);
    RouteCache routes = RouteCache::build(index, feed.pools, base_ids, taxes, config.routes);
    const RouteCacheStats& rs = routes.stats();
    for (const auto& [hops, count] : rs.routes_by_hops) {
        spdlog::info("  {}-hop routes: {}", hops, count);
    }

    if (build_routes_only) {
        std::cout << "tokens: " << index.size() << "\n"
                  << "base tokens: " << rs.base_tokens << "\n"
                  << "indexed tokens: " << rs.indexed_tokens << "\n"
                  << "excluded tokens: " << rs.excluded_tokens << "\n"
                  << "unique routes: " << rs.unique_routes << "\n"
                  << "build ms: " << rs.build_ms << "\n";
        return 0;
    }

    if (config.data.preload) {
        RpcStatePreloader preloader(config.network.rpc_url, config.data.preload_batch,
                                    config.data.preload_concurrency);
        preloader.preload(feed.pools, cache);
    }

    // Pipeline
    ArbitrageDetector detector(index, routes, cache, &taxes, config.detector);
    OpportunityChannel channel(config.ingestion.channel_capacity);
    StaticPriceTable prices(config.known_prices);
    OpportunityReporter reporter(index, config, prices);

    // Declared before the loop so unwinding stops ingestion first
    ReportingWorker consumer(channel, reporter, POLL_INTERVAL);

    FailureTracker failures;
    IngestionLoop loop(cache, detector, channel, config.ingestion);
    if (config.ingestion.subscribe_v2) {
        loop.add_subscription("v2-sync", ws_factory(config, subscription_topics(true, false)));
    }
    if (config.ingestion.subscribe_v3) {
        loop.add_subscription("v3-swap", ws_factory(config, subscription_topics(false, true)));
    }
    loop.on_failure([&failures](const std::string& name, const Error& error) {
        failures.record(name, error);
    });
    loop.start();
    spdlog::info("Scanning {} routes over {} pools", rs.unique_routes, cache.size());

    auto last_beat = steady_clock::now();
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(POLL_INTERVAL);

        if (steady_clock::now() - last_beat < HEARTBEAT_INTERVAL) continue;
        last_beat = steady_clock::now();

        log_heartbeat(cache, routes, detector, loop, reporter, channel);
        if (failures.due(config.ingestion.supervisor_restart_delay)) {
            size_t restarted = loop.restart_failed();
            spdlog::warn("Supervisor restarted {} subscription(s)", restarted);
            failures.clear();
        }
    }

    spdlog::info("Shutting down");
    loop.stop();
    consumer.stop();
    log_heartbeat(cache, routes, detector, loop, reporter, channel);
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts = parse_args(argc, argv);

    Config config;
    try {
        config = load_config(opts);
        init_logging(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        return run(config, opts.build_routes_only);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
}
