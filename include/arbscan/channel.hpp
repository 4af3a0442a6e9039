#ifndef ARBSCAN_CHANNEL_HPP
#define ARBSCAN_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "detector.hpp"

namespace arbscan {

// =============================================================================
// OpportunityChannel - bounded multi-producer queue
// =============================================================================
//
// Producers block while the queue is full. After close() pushes fail and the
// consumer drains whatever is left.

class OpportunityChannel {
public:
    explicit OpportunityChannel(size_t capacity = 10000);

    // Non-copyable
    OpportunityChannel(const OpportunityChannel&) = delete;
    OpportunityChannel& operator=(const OpportunityChannel&) = delete;

    // False once the channel is closed
    bool push(ArbitrageOpportunity opportunity);

    // Nullopt on timeout or when closed and empty
    std::optional<ArbitrageOpportunity> pop(std::chrono::milliseconds timeout);

    void close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] bool drained() const;     // closed and empty
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<ArbitrageOpportunity> queue_;
    bool closed_ = false;
};

} // namespace arbscan

#endif // ARBSCAN_CHANNEL_HPP
