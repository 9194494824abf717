#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include "lanmap/model/topology_view.hpp"
#include "lanmap/transport/pull_client.hpp"
#include "lanmap/transport/push_connection.hpp"
#include "lanmap/transport/reconnect_policy.hpp"

namespace lanmap::transport {

struct PushSettings {
    std::string host{"127.0.0.1"};
    std::string port{"5000"};
    std::string endpoint{"/ws"};
    int max_attempts{5};
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{16000};
};

struct PullSettings {
    std::string host{"127.0.0.1"};
    std::string port{"5000"};
    std::string target{"/api/discovery/devices"};
    std::chrono::milliseconds interval{30000};
    std::chrono::milliseconds timeout{10000};
    std::string auth_token;
};

struct TransportSettings {
    PushSettings push;
    PullSettings pull;
};

/**
 * @brief Feeds raw JSON from the push stream and the periodic pull.
 *
 * All network work runs on one worker thread owned by the adapter; handlers
 * are invoked there.
 * The push side follows Disconnected -> Connecting -> Connected and, on
 * loss, retries per ReconnectPolicy until it reports Failed. The pull timer
 * runs independently of the push state and never overlaps two pulls.
 *
 * Handlers must be installed before start(). stop() is final and must not
 * be called from inside a handler.
 */
class TransportAdapter {
public:
    using MessageHandler = std::function<void(const nlohmann::json&)>;
    using SnapshotHandler = std::function<void(const nlohmann::json&)>;
    using StatusHandler = std::function<void(const model::ConnectionStatus&)>;

    explicit TransportAdapter(TransportSettings settings);
    ~TransportAdapter();

    TransportAdapter(const TransportAdapter&) = delete;
    TransportAdapter& operator=(const TransportAdapter&) = delete;

    void set_message_handler(MessageHandler handler);
    void set_snapshot_handler(SnapshotHandler handler);
    void set_status_handler(StatusHandler handler);

    void start();
    void stop();
    // Immediate pull outside the timer; ignored while one is in flight.
    void request_pull();
    // Restarts the push connection with a fresh backoff budget.
    void reconnect();

    model::ConnectionStatus status() const;
    const TransportSettings& settings() const noexcept { return settings_; }

private:
    void run_worker();
    void shutdown_on_worker();
    void open_push();
    void on_push_open();
    void on_push_closed(const std::string& reason);
    void schedule_pull();
    void begin_pull();
    void on_pull_result(PullResult result);
    void update_status(const std::function<void(model::ConnectionStatus&)>& mutate);

    TransportSettings settings_;
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread worker_;
    boost::asio::steady_timer reconnect_timer_;
    boost::asio::steady_timer pull_timer_;
    ReconnectPolicy policy_;

    std::shared_ptr<PushConnection> push_;
    std::shared_ptr<PullClient> pull_;
    std::atomic_bool running_{false};
    bool stopped_{false};

    mutable std::mutex status_mutex_;
    model::ConnectionStatus status_;

    MessageHandler message_handler_;
    SnapshotHandler snapshot_handler_;
    StatusHandler status_handler_;
};

}  // namespace lanmap::transport
