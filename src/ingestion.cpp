// =============================================================================
// ingestion.cpp - Subscription threads, reconnect policy, per-log pipeline
// =============================================================================

#include "arbscan/ingestion.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "arbscan/events.hpp"

namespace arbscan {

using json = nlohmann::json;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

const char* to_string(SubscriptionState state) noexcept {
    switch (state) {
        case SubscriptionState::Idle: return "idle";
        case SubscriptionState::Connecting: return "connecting";
        case SubscriptionState::Streaming: return "streaming";
        case SubscriptionState::Backoff: return "backoff";
        case SubscriptionState::Failed: return "failed";
        case SubscriptionState::Stopped: return "stopped";
    }
    return "unknown";
}

milliseconds backoff_delay(const IngestionConfig& config, uint32_t attempt) {
    // Past 2^30 the cap has long been reached
    uint32_t shift = std::min<uint32_t>(attempt, 30);
    auto scaled = config.backoff_base.count() * (int64_t{1} << shift);
    if (config.backoff_base.count() != 0 &&
        scaled / config.backoff_base.count() != (int64_t{1} << shift)) {
        return config.backoff_max;
    }
    return std::min(milliseconds(scaled), config.backoff_max);
}

IngestionLoop::IngestionLoop(PoolStateCache& cache,
                             ArbitrageDetector& detector,
                             OpportunityChannel& channel,
                             IngestionConfig config)
    : cache_(cache)
    , detector_(detector)
    , channel_(channel)
    , config_(std::move(config)) {}

IngestionLoop::~IngestionLoop() {
    stop();
}

void IngestionLoop::add_subscription(std::string name, EventSourceFactory factory) {
    auto sub = std::make_unique<Subscription>();
    sub->name = std::move(name);
    sub->factory = std::move(factory);

    std::lock_guard<std::mutex> lock(subs_mutex_);
    subs_.push_back(std::move(sub));
}

void IngestionLoop::on_failure(FailureCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    failure_callback_ = std::move(callback);
}

void IngestionLoop::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    std::lock_guard<std::mutex> lock(subs_mutex_);
    for (auto& sub : subs_) {
        launch(*sub);
    }
}

void IngestionLoop::launch(Subscription& sub) {
    sub.state = SubscriptionState::Connecting;
    sub.thread = std::make_unique<std::thread>(&IngestionLoop::run, this, std::ref(sub));
}

void IngestionLoop::stop() {
    running_.store(false);
    {
        // Orders the flag against a sleeper's predicate check
        std::lock_guard<std::mutex> lock(sleep_mutex_);
    }
    sleep_cv_.notify_all();

    std::vector<std::unique_ptr<std::thread>> threads;
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        for (auto& sub : subs_) {
            if (sub->thread) threads.push_back(std::move(sub->thread));
        }
    }
    for (auto& t : threads) {
        if (t->joinable()) t->join();
    }

    std::lock_guard<std::mutex> lock(subs_mutex_);
    for (auto& sub : subs_) {
        sub->state = SubscriptionState::Stopped;
    }
}

size_t IngestionLoop::restart_failed() {
    if (!running_.load()) {
        return 0;
    }

    size_t restarted = 0;
    std::lock_guard<std::mutex> lock(subs_mutex_);
    for (auto& sub : subs_) {
        if (sub->state.load() != SubscriptionState::Failed) continue;

        if (sub->thread && sub->thread->joinable()) {
            sub->thread->join();
        }
        spdlog::info("Restarting subscription {}", sub->name);
        launch(*sub);
        ++restarted;
    }
    return restarted;
}

bool IngestionLoop::sleep_for(milliseconds delay) {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, delay, [this]() { return !running_.load(); });
    return running_.load();
}

// =============================================================================
// Subscription Thread
// =============================================================================

void IngestionLoop::run(Subscription& sub) {
    uint32_t attempt = 0;
    const milliseconds poll = std::min(config_.receive_timeout, config_.idle_timeout);

    while (running_.load()) {
        sub.state = SubscriptionState::Connecting;

        Error err;
        bool delivered = false;
        std::unique_ptr<EventSource> source = sub.factory();

        if (!source) {
            err = Error{error_code::CONNECT_FAILED, "no event source"};
        } else {
            err = source->connect();
        }

        if (!err) {
            sub.state = SubscriptionState::Streaming;
            spdlog::info("Subscription {} streaming from {}", sub.name, source->describe());
            auto last_event = steady_clock::now();

            while (running_.load()) {
                auto received = source->receive(poll);
                if (!received) {
                    err = received.error;
                    break;
                }
                if (!received.value) {
                    if (steady_clock::now() - last_event >= config_.idle_timeout) {
                        err = Error{error_code::IDLE_TIMEOUT, "no events within idle timeout"};
                        break;
                    }
                    continue;
                }

                last_event = steady_clock::now();
                delivered = true;
                handle_log(*received.value);
            }
        }

        if (source) {
            source->close();
        }
        if (!running_.load()) {
            break;
        }

        if (delivered) {
            attempt = 0;
        }
        if (attempt >= config_.max_retries) {
            sub.state = SubscriptionState::Failed;
            failures_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("Subscription {} failed after {} retries: {}",
                          sub.name, config_.max_retries, err.message);

            FailureCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = failure_callback_;
            }
            if (callback) {
                callback(sub.name, err);
            }
            return;
        }

        milliseconds delay = backoff_delay(config_, attempt);
        ++attempt;
        reconnects_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("Subscription {} lost ({}), reconnecting in {} ms (attempt {}/{})",
                     sub.name, err.message, delay.count(), attempt, config_.max_retries);

        sub.state = SubscriptionState::Backoff;
        if (!sleep_for(delay)) {
            break;
        }
    }

    sub.state = SubscriptionState::Stopped;
}

// =============================================================================
// Per-Log Pipeline
// =============================================================================

void IngestionLoop::handle_log(const json& log) {
    events_received_.fetch_add(1, std::memory_order_relaxed);

    std::optional<StateChangeEvent> event;
    try {
        event = decode_log(log);
    } catch (const DecodeError& e) {
        decode_errors_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("Skipping malformed log: {}", e.what());
        return;
    } catch (const nlohmann::json::exception& e) {
        decode_errors_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("Skipping malformed log: {}", e.what());
        return;
    }
    if (!event) {
        ignored_logs_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    auto previous = cache_.update(event->pool, event->update);
    if (!previous) {
        unknown_pools_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Event for untracked pool {}", to_hex(event->pool));
        return;
    }
    state_updates_.fetch_add(1, std::memory_order_relaxed);

    auto trigger = derive_trigger(*event, *previous);
    if (!trigger) {
        return;
    }
    triggers_.fetch_add(1, std::memory_order_relaxed);

    auto opportunity = detector_.detect(*trigger);
    if (!opportunity) {
        spdlog::debug("No opportunity for {} on pool {}",
                      to_hex(trigger->token), to_hex(trigger->pool));
        return;
    }

    opportunities_.fetch_add(1, std::memory_order_relaxed);
    if (!channel_.push(std::move(*opportunity))) {
        dropped_opportunities_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Opportunity channel closed, dropping result");
    }
}

std::vector<std::pair<std::string, SubscriptionState>> IngestionLoop::states() const {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    std::vector<std::pair<std::string, SubscriptionState>> out;
    out.reserve(subs_.size());
    for (const auto& sub : subs_) {
        out.emplace_back(sub->name, sub->state.load());
    }
    return out;
}

IngestionStats IngestionLoop::stats() const {
    IngestionStats s;
    s.events_received = events_received_.load(std::memory_order_relaxed);
    s.decode_errors = decode_errors_.load(std::memory_order_relaxed);
    s.ignored_logs = ignored_logs_.load(std::memory_order_relaxed);
    s.unknown_pools = unknown_pools_.load(std::memory_order_relaxed);
    s.state_updates = state_updates_.load(std::memory_order_relaxed);
    s.triggers = triggers_.load(std::memory_order_relaxed);
    s.opportunities = opportunities_.load(std::memory_order_relaxed);
    s.dropped_opportunities = dropped_opportunities_.load(std::memory_order_relaxed);
    s.reconnects = reconnects_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    return s;
}

} // namespace arbscan
