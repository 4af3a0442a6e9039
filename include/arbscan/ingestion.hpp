#ifndef ARBSCAN_INGESTION_HPP
#define ARBSCAN_INGESTION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "channel.hpp"
#include "config.hpp"
#include "detector.hpp"
#include "event_source.hpp"
#include "pool_cache.hpp"

namespace arbscan {

enum class SubscriptionState : uint8_t {
    Idle,
    Connecting,
    Streaming,
    Backoff,
    Failed,      // retries exhausted, thread has exited
    Stopped
};

const char* to_string(SubscriptionState state) noexcept;

// min(base * 2^attempt, max)
std::chrono::milliseconds backoff_delay(const IngestionConfig& config, uint32_t attempt);

struct IngestionStats {
    uint64_t events_received = 0;
    uint64_t decode_errors = 0;
    uint64_t ignored_logs = 0;        // untracked topics, removed logs
    uint64_t unknown_pools = 0;
    uint64_t state_updates = 0;
    uint64_t triggers = 0;
    uint64_t opportunities = 0;
    uint64_t dropped_opportunities = 0;
    uint64_t reconnects = 0;
    uint64_t failures = 0;
};

// =============================================================================
// IngestionLoop - one thread per subscription
// =============================================================================
//
// Each thread connects its source, then for every log: decode, update the
// cache, derive the trigger, detect, push. Transport loss reconnects with
// capped exponential back-off; after max_retries consecutive failures the
// subscription goes Failed and the failure callback runs on its thread, so the
// callback must not call restart_failed() itself.

class IngestionLoop {
public:
    using FailureCallback = std::function<void(const std::string& name, const Error& error)>;

    IngestionLoop(PoolStateCache& cache,
                  ArbitrageDetector& detector,
                  OpportunityChannel& channel,
                  IngestionConfig config = {});
    ~IngestionLoop();

    // Non-copyable
    IngestionLoop(const IngestionLoop&) = delete;
    IngestionLoop& operator=(const IngestionLoop&) = delete;

    // Register before start()
    void add_subscription(std::string name, EventSourceFactory factory);

    void on_failure(FailureCallback callback);

    void start();

    // Wakes back-off sleeps, lets in-flight detections finish and joins.
    // Does not close the channel.
    void stop();

    // Relaunch every Failed subscription; returns how many were restarted
    size_t restart_failed();

    // Decode and process one log object on the calling thread
    void handle_log(const nlohmann::json& log);

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] std::vector<std::pair<std::string, SubscriptionState>> states() const;
    [[nodiscard]] IngestionStats stats() const;

private:
    struct Subscription {
        std::string name;
        EventSourceFactory factory;
        std::atomic<SubscriptionState> state{SubscriptionState::Idle};
        std::unique_ptr<std::thread> thread;
    };

    void run(Subscription& sub);
    void launch(Subscription& sub);

    // False when woken by stop()
    bool sleep_for(std::chrono::milliseconds delay);

    PoolStateCache& cache_;
    ArbitrageDetector& detector_;
    OpportunityChannel& channel_;
    IngestionConfig config_;

    std::atomic<bool> running_{false};
    mutable std::mutex subs_mutex_;
    std::vector<std::unique_ptr<Subscription>> subs_;

    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;

    std::mutex callback_mutex_;
    FailureCallback failure_callback_;

    std::atomic<uint64_t> events_received_{0};
    std::atomic<uint64_t> decode_errors_{0};
    std::atomic<uint64_t> ignored_logs_{0};
    std::atomic<uint64_t> unknown_pools_{0};
    std::atomic<uint64_t> state_updates_{0};
    std::atomic<uint64_t> triggers_{0};
    std::atomic<uint64_t> opportunities_{0};
    std::atomic<uint64_t> dropped_opportunities_{0};
    std::atomic<uint64_t> reconnects_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace arbscan

#endif // ARBSCAN_INGESTION_HPP
