#ifndef ARBSCAN_EVENT_SOURCE_HPP
#define ARBSCAN_EVENT_SOURCE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace arbscan {

// =============================================================================
// Transport Errors
// =============================================================================

struct Error {
    int code = 0;
    std::string message;

    explicit operator bool() const noexcept { return code != 0; }
};

template<typename T>
struct Result {
    T value;
    Error error;

    [[nodiscard]] bool ok() const noexcept { return !error; }
    explicit operator bool() const noexcept { return ok(); }
};

namespace error_code {

constexpr int CONNECT_FAILED = -1;
constexpr int CONNECT_TIMEOUT = -2;
constexpr int SUBSCRIBE_FAILED = -3;
constexpr int CLOSED = -4;
constexpr int IDLE_TIMEOUT = -5;

} // namespace error_code

// =============================================================================
// EventSource - one log subscription
// =============================================================================
//
// Owned by a single ingestion thread; implementations need not be thread-safe
// beyond their own transport callbacks.

class EventSource {
public:
    virtual ~EventSource() = default;

    // Connect and subscribe. Blocks until the subscription is live or fails.
    virtual Error connect() = 0;

    // Next log object. An empty value means the timeout elapsed; an error
    // means the transport is gone and the source must be discarded.
    virtual Result<std::optional<nlohmann::json>> receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    virtual std::string describe() const = 0;
};

using EventSourceFactory = std::function<std::unique_ptr<EventSource>()>;

} // namespace arbscan

#endif // ARBSCAN_EVENT_SOURCE_HPP
