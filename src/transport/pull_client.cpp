#include "lanmap/transport/pull_client.hpp"

#include <spdlog/spdlog.h>

namespace lanmap::transport {

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
}  // namespace

PullClient::PullClient(asio::io_context& io_context, PullRequest request)
    : request_(std::move(request)), resolver_(io_context), stream_(io_context), deadline_(io_context) {}

void PullClient::run(ResultHandler handler) {
    handler_ = std::move(handler);

    http_request_.version(11);
    http_request_.method(http::verb::get);
    http_request_.target(request_.target);
    http_request_.set(http::field::host, request_.host);
    http_request_.set(http::field::user_agent, "lanmap/0.1");
    http_request_.set(http::field::accept, "application/json");
    if (!request_.auth_token.empty()) {
        http_request_.set(http::field::authorization, "Bearer " + request_.auth_token);
    }

    spdlog::debug("Pull GET {}:{}{}", request_.host, request_.port, request_.target);
    deadline_.expires_after(request_.timeout);
    deadline_.async_wait(beast::bind_front_handler(&PullClient::on_deadline, shared_from_this()));
    resolver_.async_resolve(request_.host,
                            request_.port,
                            beast::bind_front_handler(&PullClient::on_resolve, shared_from_this()));
}

void PullClient::cancel() {
    if (finished_) {
        return;
    }
    finished_ = true;
    handler_ = nullptr;
    deadline_.cancel();
    resolver_.cancel();
    stream_.close();
}

void PullClient::on_deadline(const boost::system::error_code& ec) {
    if (ec || finished_) {
        return;
    }
    // A blocked name lookup only notices cancellation once it returns, so the
    // result is reported here instead of by the aborted step.
    resolver_.cancel();
    stream_.close();
    finish({std::nullopt, "timed out after " + std::to_string(request_.timeout.count()) + " ms"});
}

void PullClient::on_resolve(const beast::error_code& ec, tcp::resolver::results_type results) {
    if (ec) {
        fail("resolve", ec);
        return;
    }
    stream_.async_connect(results, beast::bind_front_handler(&PullClient::on_connect, shared_from_this()));
}

void PullClient::on_connect(const beast::error_code& ec, tcp::endpoint) {
    if (ec) {
        fail("connect", ec);
        return;
    }
    http::async_write(stream_, http_request_, beast::bind_front_handler(&PullClient::on_write, shared_from_this()));
}

void PullClient::on_write(const beast::error_code& ec, std::size_t) {
    if (ec) {
        fail("write", ec);
        return;
    }
    http::async_read(stream_,
                     buffer_,
                     http_response_,
                     beast::bind_front_handler(&PullClient::on_read, shared_from_this()));
}

void PullClient::on_read(const beast::error_code& ec, std::size_t) {
    if (ec) {
        fail("read", ec);
        return;
    }

    beast::error_code shutdown_ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
        spdlog::debug("Pull shutdown: {}", shutdown_ec.message());
    }

    const auto status = http_response_.result_int();
    if (status < 200 || status >= 300) {
        finish({std::nullopt, "HTTP " + std::to_string(status)});
        return;
    }

    auto body = nlohmann::json::parse(http_response_.body(), nullptr, false);
    if (body.is_discarded()) {
        finish({std::nullopt, "response body is not JSON"});
        return;
    }
    finish({std::move(body), {}});
}

void PullClient::fail(const char* what, const beast::error_code& ec) {
    const std::string reason =
        ec == beast::error::timeout ? std::string(what) + ": timed out" : std::string(what) + ": " + ec.message();
    finish({std::nullopt, reason});
}

void PullClient::finish(PullResult result) {
    if (finished_) {
        return;
    }
    finished_ = true;
    deadline_.cancel();
    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (handler) {
        handler(std::move(result));
    }
}

}  // namespace lanmap::transport
