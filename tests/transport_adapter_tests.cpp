#include "lanmap/transport/transport_adapter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

using lanmap::model::ConnectionState;
using lanmap::model::ConnectionStatus;
using lanmap::transport::TransportAdapter;
using lanmap::transport::TransportSettings;
using std::chrono::milliseconds;

namespace {

namespace asio = boost::asio;
namespace http = boost::beast::http;
using tcp = asio::ip::tcp;

tcp::endpoint loopback_any_port() {
    return {asio::ip::address_v4::loopback(), 0};
}

// A loopback port nobody listens on; connects to it are refused.
std::string refused_port() {
    asio::io_context io_context;
    tcp::acceptor acceptor(io_context, loopback_any_port());
    const auto port = acceptor.local_endpoint().port();
    acceptor.close();
    return std::to_string(port);
}

template <typename Predicate>
bool eventually(Predicate predicate, milliseconds limit = milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds(5));
    }
    return predicate();
}

// Accepts connections and never answers them.
class SilentServer {
public:
    SilentServer() : acceptor_(io_context_, loopback_any_port()) {
        port_ = std::to_string(acceptor_.local_endpoint().port());
        do_accept();
        thread_ = std::thread([this] { io_context_.run(); });
    }

    ~SilentServer() {
        io_context_.stop();
        thread_.join();
    }

    const std::string& port() const { return port_; }
    int accepted() const { return accepted_.load(); }

private:
    void do_accept() {
        acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                return;
            }
            held_.push_back(std::move(socket));
            ++accepted_;
            do_accept();
        });
    }

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::vector<tcp::socket> held_;
    std::atomic_int accepted_{0};
    std::string port_;
    std::thread thread_;
};

// Answers a single GET with a fixed JSON body.
class JsonResponder {
public:
    explicit JsonResponder(std::string body)
        : acceptor_(io_context_, loopback_any_port()), socket_(io_context_), body_(std::move(body)) {
        port_ = std::to_string(acceptor_.local_endpoint().port());
        acceptor_.async_accept(socket_, [this](const boost::system::error_code& ec) {
            if (!ec) {
                read_request();
            }
        });
        thread_ = std::thread([this] { io_context_.run(); });
    }

    ~JsonResponder() {
        io_context_.stop();
        thread_.join();
    }

    const std::string& port() const { return port_; }

    std::string authorization() const {
        std::lock_guard lock(mutex_);
        return authorization_;
    }

private:
    void read_request() {
        http::async_read(socket_, buffer_, request_, [this](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                return;
            }
            {
                std::lock_guard lock(mutex_);
                const auto value = request_[http::field::authorization];
                authorization_.assign(value.data(), value.size());
            }
            response_.version(11);
            response_.result(http::status::ok);
            response_.set(http::field::content_type, "application/json");
            response_.keep_alive(false);
            response_.body() = body_;
            response_.prepare_payload();
            http::async_write(socket_, response_, [this](const boost::system::error_code&, std::size_t) {
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_send, shutdown_ec);
            });
        });
    }

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    tcp::socket socket_;
    std::string body_;
    std::string port_;
    boost::beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    mutable std::mutex mutex_;
    std::string authorization_;
    std::thread thread_;
};

class StatusLog {
public:
    void record(const ConnectionStatus& status) {
        std::lock_guard lock(mutex_);
        entries_.push_back(status);
    }

    std::vector<ConnectionStatus> entries() const {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    // Push states with consecutive repeats collapsed.
    std::vector<ConnectionState> transitions() const {
        std::vector<ConnectionState> states;
        for (const auto& entry : entries()) {
            if (states.empty() || states.back() != entry.state) {
                states.push_back(entry.state);
            }
        }
        return states;
    }

    bool reached(ConnectionState state) const {
        const auto states = transitions();
        return !states.empty() && states.back() == state;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ConnectionStatus> entries_;
};

TransportSettings loopback_settings(const std::string& push_port, const std::string& pull_port) {
    TransportSettings settings;
    settings.push.host = "127.0.0.1";
    settings.push.port = push_port;
    settings.push.max_attempts = 2;
    settings.push.initial_delay = milliseconds(10);
    settings.push.max_delay = milliseconds(20);
    settings.pull.host = "127.0.0.1";
    settings.pull.port = pull_port;
    settings.pull.interval = milliseconds(60000);
    settings.pull.timeout = milliseconds(5000);
    return settings;
}

}  // namespace

TEST_CASE("Transport settings default to the local discovery service", "[transport]") {
    const TransportSettings settings;
    CHECK(settings.push.endpoint == "/ws");
    CHECK(settings.push.max_attempts == 5);
    CHECK(settings.pull.target == "/api/discovery/devices");
    CHECK(settings.pull.interval == std::chrono::milliseconds(30000));
    CHECK(settings.pull.auth_token.empty());
}

TEST_CASE("An adapter that was never started stays idle", "[transport]") {
    TransportAdapter adapter(TransportSettings{});
    bool notified = false;
    adapter.set_status_handler([&](const lanmap::model::ConnectionStatus&) { notified = true; });

    adapter.request_pull();
    adapter.reconnect();

    const auto status = adapter.status();
    CHECK(status.state == ConnectionState::Disconnected);
    CHECK_FALSE(status.pull_in_flight);
    CHECK(status.pull_healthy);
    CHECK_FALSE(status.last_pull.has_value());
    CHECK_FALSE(notified);
}

TEST_CASE("A stopped adapter cannot be restarted", "[transport]") {
    TransportAdapter adapter(TransportSettings{});
    adapter.stop();
    adapter.start();
    adapter.stop();

    CHECK(adapter.status().state == ConnectionState::Disconnected);
}

TEST_CASE("Push retries with bounded backoff and then fails", "[transport]") {
    StatusLog log;
    TransportAdapter adapter(loopback_settings(refused_port(), refused_port()));
    adapter.set_status_handler([&](const ConnectionStatus& status) { log.record(status); });
    adapter.start();

    REQUIRE(eventually([&] { return log.reached(ConnectionState::Failed); }));

    const std::vector<ConnectionState> expected{ConnectionState::Connecting,
                                                ConnectionState::Disconnected,
                                                ConnectionState::Connecting,
                                                ConnectionState::Disconnected,
                                                ConnectionState::Connecting,
                                                ConnectionState::Failed};
    CHECK(log.transitions() == expected);

    const auto failed = adapter.status();
    CHECK(failed.state == ConnectionState::Failed);
    CHECK(failed.reconnect_attempts == 2);
    CHECK_FALSE(failed.last_error.empty());

    SECTION("no automatic retry after the budget is spent") {
        std::this_thread::sleep_for(milliseconds(200));
        CHECK(log.transitions() == expected);
        CHECK(adapter.status().state == ConnectionState::Failed);
    }

    SECTION("a manual reconnect starts over with a fresh budget") {
        const auto before = log.entries().size();
        adapter.reconnect();

        REQUIRE(eventually([&] {
            const auto entries = log.entries();
            return entries.size() > before && entries.back().state == ConnectionState::Failed;
        }));

        const auto entries = log.entries();
        std::vector<int> retry_attempts;
        bool left_failed = false;
        for (std::size_t i = before; i < entries.size(); ++i) {
            if (entries[i].state == ConnectionState::Connecting) {
                left_failed = true;
            }
            if (entries[i].state == ConnectionState::Disconnected) {
                retry_attempts.push_back(entries[i].reconnect_attempts);
            }
        }
        CHECK(left_failed);
        CHECK(retry_attempts == std::vector<int>{1, 2});
    }

    adapter.stop();
}

TEST_CASE("Pulls never overlap", "[transport]") {
    SilentServer server;
    auto settings = loopback_settings(refused_port(), server.port());
    settings.pull.interval = milliseconds(20);
    TransportAdapter adapter(settings);
    adapter.start();

    REQUIRE(eventually([&] { return server.accepted() == 1; }));
    adapter.request_pull();
    adapter.request_pull();
    // Several interval ticks pass while the first request is unanswered.
    std::this_thread::sleep_for(milliseconds(200));

    CHECK(server.accepted() == 1);
    CHECK(adapter.status().pull_in_flight);

    adapter.stop();
}

TEST_CASE("Stopping abandons outstanding work without further callbacks", "[transport]") {
    SilentServer server;
    std::atomic_int snapshots{0};
    std::atomic_int statuses{0};
    auto settings = loopback_settings(refused_port(), server.port());
    settings.push.max_attempts = 50;
    settings.push.initial_delay = milliseconds(5);
    settings.push.max_delay = milliseconds(5);

    TransportAdapter adapter(settings);
    adapter.set_snapshot_handler([&](const nlohmann::json&) { ++snapshots; });
    adapter.set_status_handler([&](const ConnectionStatus&) { ++statuses; });
    adapter.start();
    REQUIRE(eventually([&] { return server.accepted() == 1; }));

    const auto started = std::chrono::steady_clock::now();
    adapter.stop();
    CHECK(std::chrono::steady_clock::now() - started < milliseconds(2000));

    const int statuses_at_stop = statuses.load();
    adapter.request_pull();
    adapter.reconnect();
    std::this_thread::sleep_for(milliseconds(100));

    CHECK(statuses.load() == statuses_at_stop);
    CHECK(snapshots.load() == 0);
    const auto status = adapter.status();
    CHECK(status.state == ConnectionState::Disconnected);
    CHECK_FALSE(status.pull_in_flight);
}

TEST_CASE("A pull delivers the JSON body before reporting success", "[transport]") {
    JsonResponder responder(R"({"devices":[{"id":"a","ip":"10.0.0.2"}]})");
    auto settings = loopback_settings(refused_port(), responder.port());
    settings.pull.auth_token = "t0ken";

    std::mutex mutex;
    nlohmann::json received;
    bool snapshot_before_report = false;
    TransportAdapter adapter(settings);
    adapter.set_snapshot_handler([&](const nlohmann::json& body) {
        std::lock_guard lock(mutex);
        received = body;
    });
    adapter.set_status_handler([&](const ConnectionStatus& status) {
        if (status.last_pull && status.pull_healthy) {
            std::lock_guard lock(mutex);
            snapshot_before_report = !received.is_null();
        }
    });
    adapter.start();

    REQUIRE(eventually([&] {
        const auto status = adapter.status();
        return status.last_pull.has_value() && !status.pull_in_flight;
    }));
    adapter.stop();

    CHECK(adapter.status().pull_healthy);
    CHECK(responder.authorization() == "Bearer t0ken");
    std::lock_guard lock(mutex);
    REQUIRE(received.contains("devices"));
    CHECK(received["devices"].size() == 1);
    CHECK(snapshot_before_report);
}

TEST_CASE("A refused pull is reported as unhealthy", "[transport]") {
    auto settings = loopback_settings(refused_port(), refused_port());
    settings.push.max_attempts = 1;
    TransportAdapter adapter(settings);
    adapter.start();

    REQUIRE(eventually([&] { return adapter.status().last_pull.has_value(); }));
    const auto status = adapter.status();
    CHECK_FALSE(status.pull_healthy);
    CHECK_FALSE(status.pull_in_flight);
    adapter.stop();
}

TEST_CASE("An unanswered pull times out and frees the next one", "[transport]") {
    SilentServer server;
    auto settings = loopback_settings(refused_port(), server.port());
    settings.push.max_attempts = 1;
    settings.pull.timeout = milliseconds(100);
    TransportAdapter adapter(settings);
    adapter.start();

    REQUIRE(eventually([&] { return adapter.status().last_pull.has_value(); }));
    const auto status = adapter.status();
    CHECK_FALSE(status.pull_healthy);
    CHECK_FALSE(status.pull_in_flight);
    CHECK(server.accepted() == 1);

    adapter.request_pull();
    CHECK(eventually([&] { return server.accepted() == 2; }));
    adapter.stop();
}
