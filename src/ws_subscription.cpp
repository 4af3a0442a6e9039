// =============================================================================
// ws_subscription.cpp - websocketpp log subscription
// =============================================================================

#include "arbscan/ws_subscription.hpp"

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace arbscan {

using json = nlohmann::json;

using WsClient = websocketpp::client<websocketpp::config::asio_client>;
using ConnectionHdl = websocketpp::connection_hdl;
using MessagePtr = websocketpp::config::asio_client::message_type::ptr;

namespace {

constexpr uint64_t SUBSCRIBE_REQUEST_ID = 1;

enum class WsState { Disconnected, Connecting, Connected, Failed };

} // anonymous namespace

json make_logs_subscribe_request(uint64_t id, const std::vector<std::string>& topics,
                                 const std::vector<Address>& addresses) {
    json filter = json::object();
    if (!addresses.empty()) {
        json list = json::array();
        for (const auto& a : addresses) list.push_back(to_hex(a));
        filter["address"] = std::move(list);
    }
    // Nested array: topic0 may be any of these
    filter["topics"] = json::array({topics});

    return json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "eth_subscribe"},
        {"params", json::array({"logs", filter})}
    };
}

SubscriptionFrame parse_subscription_frame(const std::string& payload, uint64_t subscribe_id) {
    SubscriptionFrame frame;
    json msg;
    try {
        msg = json::parse(payload);
    } catch (const json::parse_error& e) {
        frame.kind = SubscriptionFrame::Kind::Malformed;
        frame.text = e.what();
        return frame;
    }
    if (!msg.is_object()) {
        frame.kind = SubscriptionFrame::Kind::Malformed;
        frame.text = std::string("frame is a JSON ") + msg.type_name();
        return frame;
    }

    auto method = msg.find("method");
    if (method != msg.end() && *method == "eth_subscription") {
        auto params = msg.find("params");
        if (params != msg.end() && params->is_object() && params->contains("result")) {
            frame.kind = SubscriptionFrame::Kind::Log;
            frame.log = std::move((*params)["result"]);
        } else {
            frame.kind = SubscriptionFrame::Kind::Malformed;
            frame.text = "notification without params.result";
        }
        return frame;
    }

    auto id = msg.find("id");
    if (id == msg.end() || !id->is_number_unsigned() || id->get<uint64_t>() != subscribe_id) {
        return frame;
    }
    auto result = msg.find("result");
    if (result != msg.end() && result->is_string()) {
        frame.kind = SubscriptionFrame::Kind::Subscribed;
        frame.text = result->get<std::string>();
    } else {
        frame.kind = SubscriptionFrame::Kind::SubscribeFailed;
        auto error = msg.find("error");
        frame.text = error != msg.end() ? error->dump() : "malformed response";
    }
    return frame;
}

//------------------------------------------------------------------------------
// WsLogSubscription::Impl
//------------------------------------------------------------------------------

class WsLogSubscription::Impl {
public:
    explicit Impl(WsSubscriptionConfig config)
        : config_(std::move(config))
        , state_(WsState::Disconnected)
    {
        ws_client_.clear_access_channels(websocketpp::log::alevel::all);
        ws_client_.clear_error_channels(websocketpp::log::elevel::all);

        ws_client_.init_asio();

        ws_client_.set_open_handler([this](ConnectionHdl) {
            set_state(WsState::Connected);
        });

        ws_client_.set_close_handler([this](ConnectionHdl) {
            set_state(WsState::Disconnected);
        });

        ws_client_.set_fail_handler([this](ConnectionHdl) {
            set_state(WsState::Failed);
        });

        ws_client_.set_message_handler([this](ConnectionHdl, MessagePtr msg) {
            on_message(msg->get_payload());
        });
    }

    ~Impl() {
        close();
    }

    Error connect() {
        set_state(WsState::Connecting);

        websocketpp::lib::error_code ec;
        auto con = ws_client_.get_connection(config_.url, ec);
        if (ec) {
            set_state(WsState::Failed);
            return Error{error_code::CONNECT_FAILED, "Failed to create connection: " + ec.message()};
        }

        connection_ = con->get_handle();
        ws_client_.connect(con);

        io_thread_ = std::thread([this]() {
            ws_client_.run();
        });

        // Wait for the handshake
        {
            std::unique_lock<std::mutex> lock(mutex_);
            bool settled = cv_.wait_for(lock, config_.connect_timeout, [this]() {
                return state_ != WsState::Connecting;
            });
            if (!settled) {
                return Error{error_code::CONNECT_TIMEOUT, "Connection timeout: " + config_.url};
            }
            if (state_ != WsState::Connected) {
                return Error{error_code::CONNECT_FAILED, "Connection failed: " + config_.url};
            }
        }

        json request = make_logs_subscribe_request(SUBSCRIBE_REQUEST_ID, config_.topics,
                                                   config_.addresses);
        ws_client_.send(connection_, request.dump(), websocketpp::frame::opcode::text, ec);
        if (ec) {
            return Error{error_code::SUBSCRIBE_FAILED, "eth_subscribe send failed: " + ec.message()};
        }

        // Wait for the subscription id
        std::unique_lock<std::mutex> lock(mutex_);
        bool answered = cv_.wait_for(lock, config_.connect_timeout, [this]() {
            return !subscription_id_.empty() || !subscribe_error_.empty() ||
                   state_ != WsState::Connected;
        });
        if (!answered) {
            return Error{error_code::SUBSCRIBE_FAILED, "eth_subscribe timed out"};
        }
        if (!subscribe_error_.empty()) {
            return Error{error_code::SUBSCRIBE_FAILED, "eth_subscribe rejected: " + subscribe_error_};
        }
        if (subscription_id_.empty()) {
            return Error{error_code::CLOSED, "Connection closed during subscribe"};
        }

        spdlog::info("Subscribed to logs on {} (id {})", config_.url, subscription_id_);
        return {};
    }

    Result<std::optional<json>> receive(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || state_ != WsState::Connected;
        });

        if (!queue_.empty()) {
            json log = std::move(queue_.front());
            queue_.pop_front();
            return {std::move(log), {}};
        }
        if (state_ != WsState::Connected) {
            return {std::nullopt, Error{error_code::CLOSED, "Connection closed: " + config_.url}};
        }
        return {std::nullopt, {}};
    }

    void close() {
        if (closed_.exchange(true)) {
            return;
        }

        if (!connection_.expired()) {
            websocketpp::lib::error_code ec;
            ws_client_.close(connection_, websocketpp::close::status::normal, "", ec);
            if (ec) {
                spdlog::debug("Websocket close on {}: {}", config_.url, ec.message());
            }
        }

        ws_client_.stop();

        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        set_state(WsState::Disconnected);
    }

    std::string describe() const {
        return "ws logs " + config_.url;
    }

    std::string subscription_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscription_id_;
    }

private:
    void set_state(WsState state) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = state;
        }
        cv_.notify_all();
    }

    void on_message(const std::string& payload) {
        SubscriptionFrame frame = parse_subscription_frame(payload, SUBSCRIBE_REQUEST_ID);
        switch (frame.kind) {
            case SubscriptionFrame::Kind::Malformed:
                spdlog::warn("Dropping frame from {}: {}", config_.url, frame.text);
                return;
            case SubscriptionFrame::Kind::Ignored:
                return;
            default:
                break;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (frame.kind == SubscriptionFrame::Kind::Log) {
                queue_.push_back(std::move(frame.log));
            } else if (frame.kind == SubscriptionFrame::Kind::Subscribed) {
                subscription_id_ = std::move(frame.text);
            } else {
                subscribe_error_ = std::move(frame.text);
            }
        }
        cv_.notify_all();
    }

    WsSubscriptionConfig config_;
    WsClient ws_client_;
    ConnectionHdl connection_;
    std::thread io_thread_;
    std::atomic<bool> closed_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    WsState state_;
    std::deque<json> queue_;
    std::string subscription_id_;
    std::string subscribe_error_;
};

//------------------------------------------------------------------------------
// WsLogSubscription
//------------------------------------------------------------------------------

WsLogSubscription::WsLogSubscription(WsSubscriptionConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

WsLogSubscription::~WsLogSubscription() = default;

Error WsLogSubscription::connect() {
    return impl_->connect();
}

Result<std::optional<json>> WsLogSubscription::receive(std::chrono::milliseconds timeout) {
    return impl_->receive(timeout);
}

void WsLogSubscription::close() {
    impl_->close();
}

std::string WsLogSubscription::describe() const {
    return impl_->describe();
}

std::string WsLogSubscription::subscription_id() const {
    return impl_->subscription_id();
}

} // namespace arbscan
