#ifndef ARBSCAN_WS_SUBSCRIPTION_HPP
#define ARBSCAN_WS_SUBSCRIPTION_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "event_source.hpp"
#include "types.hpp"

namespace arbscan {

struct WsSubscriptionConfig {
    std::string url = "ws://127.0.0.1:8546";
    std::vector<std::string> topics;        // topic0 alternatives
    std::vector<Address> addresses;         // empty = every emitter
    std::chrono::milliseconds connect_timeout{10000};
};

// =============================================================================
// WsLogSubscription - eth_subscribe("logs") over a plain websocket
// =============================================================================

class WsLogSubscription : public EventSource {
public:
    explicit WsLogSubscription(WsSubscriptionConfig config);
    ~WsLogSubscription() override;

    // Non-copyable
    WsLogSubscription(const WsLogSubscription&) = delete;
    WsLogSubscription& operator=(const WsLogSubscription&) = delete;

    Error connect() override;
    Result<std::optional<nlohmann::json>> receive(std::chrono::milliseconds timeout) override;
    void close() override;
    std::string describe() const override;

    // Subscription id assigned by the node, empty before connect() succeeds
    std::string subscription_id() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// What one websocket frame means to a log subscription
struct SubscriptionFrame {
    enum class Kind : uint8_t {
        Ignored,            // valid JSON-RPC, not ours
        Malformed,          // text holds the reason
        Log,                // log holds the notification's log object
        Subscribed,         // text holds the subscription id
        SubscribeFailed     // text holds the node's error
    };

    Kind kind = Kind::Ignored;
    nlohmann::json log;
    std::string text;
};

// Never throws on node input
SubscriptionFrame parse_subscription_frame(const std::string& payload, uint64_t subscribe_id);

// eth_subscribe request body
nlohmann::json make_logs_subscribe_request(uint64_t id, const std::vector<std::string>& topics,
                                           const std::vector<Address>& addresses);

} // namespace arbscan

#endif // ARBSCAN_WS_SUBSCRIPTION_HPP
