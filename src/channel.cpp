#include "arbscan/channel.hpp"

#include <algorithm>

namespace arbscan {

OpportunityChannel::OpportunityChannel(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

bool OpportunityChannel::push(ArbitrageOpportunity opportunity) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() { return closed_ || queue_.size() < capacity_; });
    if (closed_) {
        return false;
    }
    queue_.push_back(std::move(opportunity));
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

std::optional<ArbitrageOpportunity> OpportunityChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    ArbitrageOpportunity front = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return front;
}

void OpportunityChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool OpportunityChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool OpportunityChannel::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && queue_.empty();
}

size_t OpportunityChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace arbscan
