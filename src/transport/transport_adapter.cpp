#include "lanmap/transport/transport_adapter.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace lanmap::transport {

using model::ConnectionState;
using model::ConnectionStatus;

TransportAdapter::TransportAdapter(TransportSettings settings)
    : settings_(std::move(settings)),
      reconnect_timer_(io_context_),
      pull_timer_(io_context_),
      policy_(settings_.push.max_attempts, settings_.push.initial_delay, settings_.push.max_delay) {}

TransportAdapter::~TransportAdapter() {
    stop();
}

void TransportAdapter::set_message_handler(MessageHandler handler) {
    message_handler_ = std::move(handler);
}

void TransportAdapter::set_snapshot_handler(SnapshotHandler handler) {
    snapshot_handler_ = std::move(handler);
}

void TransportAdapter::set_status_handler(StatusHandler handler) {
    status_handler_ = std::move(handler);
}

void TransportAdapter::start() {
    if (stopped_) {
        spdlog::warn("Transport already stopped; start() ignored");
        return;
    }
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    worker_ = std::thread([this] { run_worker(); });
    boost::asio::post(io_context_, [this] {
        open_push();
        begin_pull();
        schedule_pull();
    });
}

void TransportAdapter::stop() {
    running_.store(false);
    if (stopped_) {
        return;
    }
    stopped_ = true;

    if (worker_.joinable()) {
        boost::asio::post(io_context_, [this] { shutdown_on_worker(); });
        worker_.join();
    } else {
        shutdown_on_worker();
    }
    {
        std::lock_guard lock(status_mutex_);
        status_.state = ConnectionState::Disconnected;
        status_.pull_in_flight = false;
    }
    message_handler_ = nullptr;
    snapshot_handler_ = nullptr;
    status_handler_ = nullptr;
}

void TransportAdapter::run_worker() {
    try {
        io_context_.run();
    } catch (const std::exception& ex) {
        spdlog::error("Transport worker stopped on exception: {}", ex.what());
    }
}

// Runs on the worker once stop() is requested; sockets and timers are only
// touched from this thread.
void TransportAdapter::shutdown_on_worker() {
    reconnect_timer_.cancel();
    pull_timer_.cancel();
    if (push_) {
        push_->close();
        push_.reset();
    }
    if (pull_) {
        pull_->cancel();
        pull_.reset();
    }
    work_guard_.reset();
    // A pending name lookup would otherwise keep run() alive.
    io_context_.stop();
}

void TransportAdapter::request_pull() {
    if (!running_) {
        return;
    }
    boost::asio::post(io_context_, [this] { begin_pull(); });
}

void TransportAdapter::reconnect() {
    if (!running_) {
        return;
    }
    boost::asio::post(io_context_, [this] {
        if (!running_) {
            return;
        }
        if (push_ && status().state == ConnectionState::Connected) {
            spdlog::debug("Reconnect requested while connected; ignored");
            return;
        }
        spdlog::info("Manual reconnect to {}:{}", settings_.push.host, settings_.push.port);
        reconnect_timer_.cancel();
        policy_.reset();
        if (push_) {
            push_->close();
            push_.reset();
        }
        open_push();
    });
}

ConnectionStatus TransportAdapter::status() const {
    std::lock_guard lock(status_mutex_);
    return status_;
}

void TransportAdapter::open_push() {
    if (!running_) {
        return;
    }
    update_status([](ConnectionStatus& status) { status.state = ConnectionState::Connecting; });

    push_ = std::make_shared<PushConnection>(
        io_context_, settings_.push.host, settings_.push.port, settings_.push.endpoint);
    push_->start([this] { on_push_open(); },
                 [this](const nlohmann::json& message) {
                     if (running_ && message_handler_) {
                         message_handler_(message);
                     }
                 },
                 [this](const std::string& reason) { on_push_closed(reason); });
}

void TransportAdapter::on_push_open() {
    policy_.reset();
    update_status([](ConnectionStatus& status) {
        status.state = ConnectionState::Connected;
        status.reconnect_attempts = 0;
        status.last_error.clear();
    });
}

void TransportAdapter::on_push_closed(const std::string& reason) {
    push_.reset();
    if (!running_) {
        return;
    }
    spdlog::warn("Push connection lost: {}", reason);

    auto delay = policy_.next_delay();
    if (!delay) {
        spdlog::error("Push reconnect gave up after {} attempts", policy_.max_attempts());
        update_status([&](ConnectionStatus& status) {
            status.state = ConnectionState::Failed;
            status.reconnect_attempts = policy_.attempts();
            status.last_error = reason;
        });
        return;
    }

    spdlog::info("Push reconnect {}/{} in {} ms", policy_.attempts(), policy_.max_attempts(), delay->count());
    update_status([&](ConnectionStatus& status) {
        status.state = ConnectionState::Disconnected;
        status.reconnect_attempts = policy_.attempts();
        status.last_error = reason;
    });
    reconnect_timer_.expires_after(*delay);
    reconnect_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        open_push();
    });
}

void TransportAdapter::schedule_pull() {
    pull_timer_.expires_after(settings_.pull.interval);
    pull_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        begin_pull();
        schedule_pull();
    });
}

void TransportAdapter::begin_pull() {
    if (!running_) {
        return;
    }
    if (pull_) {
        spdlog::debug("Pull skipped; previous request still in flight");
        return;
    }
    update_status([](ConnectionStatus& status) { status.pull_in_flight = true; });

    PullRequest request{settings_.pull.host,
                        settings_.pull.port,
                        settings_.pull.target,
                        settings_.pull.auth_token,
                        settings_.pull.timeout};
    pull_ = std::make_shared<PullClient>(io_context_, std::move(request));
    pull_->run([this](PullResult result) { on_pull_result(std::move(result)); });
}

void TransportAdapter::on_pull_result(PullResult result) {
    pull_.reset();
    if (!running_) {
        return;
    }
    if (!result.ok()) {
        spdlog::warn("Pull from {}:{}{} failed: {}",
                     settings_.pull.host,
                     settings_.pull.port,
                     settings_.pull.target,
                     result.error);
    }
    // Data is applied before the status refresh that reports the pull.
    if (result.ok() && snapshot_handler_) {
        try {
            snapshot_handler_(*result.body);
        } catch (const std::exception& ex) {
            spdlog::warn("Snapshot handler failed: {}", ex.what());
        }
    }
    update_status([&](ConnectionStatus& status) {
        status.pull_in_flight = false;
        status.pull_healthy = result.ok();
        status.last_pull = std::chrono::system_clock::now();
        if (!result.ok()) {
            status.last_error = result.error;
        }
    });
}

void TransportAdapter::update_status(const std::function<void(ConnectionStatus&)>& mutate) {
    ConnectionStatus copy;
    {
        std::lock_guard lock(status_mutex_);
        mutate(status_);
        copy = status_;
    }
    if (running_ && status_handler_) {
        try {
            status_handler_(copy);
        } catch (const std::exception& ex) {
            spdlog::warn("Status handler failed: {}", ex.what());
        }
    }
}

}  // namespace lanmap::transport
