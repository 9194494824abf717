#include "lanmap/transport/push_connection.hpp"

#include <chrono>

#include <boost/asio/buffer.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

namespace lanmap::transport {

namespace {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

constexpr std::chrono::seconds kConnectTimeout{30};
}  // namespace

PushConnection::PushConnection(asio::io_context& io_context,
                               std::string host,
                               std::string port,
                               std::string endpoint)
    : host_(std::move(host)),
      port_(std::move(port)),
      endpoint_(std::move(endpoint)),
      resolver_(io_context),
      websocket_(io_context) {}

void PushConnection::start(OpenHandler on_open, MessageHandler on_message, CloseHandler on_close) {
    open_handler_ = std::move(on_open);
    message_handler_ = std::move(on_message);
    close_handler_ = std::move(on_close);

    spdlog::debug("Push connecting to {}:{}{}", host_, port_, endpoint_);
    resolver_.async_resolve(host_, port_, beast::bind_front_handler(&PushConnection::on_resolve, shared_from_this()));
}

void PushConnection::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    open_handler_ = nullptr;
    message_handler_ = nullptr;
    close_handler_ = nullptr;
    resolver_.cancel();
    beast::get_lowest_layer(websocket_).close();
}

void PushConnection::on_resolve(const beast::error_code& ec, tcp::resolver::results_type results) {
    if (ec) {
        fail("resolve", ec);
        return;
    }
    beast::get_lowest_layer(websocket_).expires_after(kConnectTimeout);
    beast::get_lowest_layer(websocket_)
        .async_connect(results, beast::bind_front_handler(&PushConnection::on_connect, shared_from_this()));
}

void PushConnection::on_connect(const beast::error_code& ec, tcp::endpoint endpoint) {
    if (ec) {
        fail("connect", ec);
        return;
    }

    // The websocket stream applies its own handshake and idle timeouts.
    beast::get_lowest_layer(websocket_).expires_never();
    websocket_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    websocket_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "lanmap/0.1");
    }));

    host_header_ = host_ + ":" + std::to_string(endpoint.port());
    websocket_.async_handshake(host_header_,
                               endpoint_,
                               beast::bind_front_handler(&PushConnection::on_handshake, shared_from_this()));
}

void PushConnection::on_handshake(const beast::error_code& ec) {
    if (ec) {
        fail("handshake", ec);
        return;
    }
    spdlog::info("Push connected to {}{}", host_header_, endpoint_);
    if (open_handler_) {
        open_handler_();
    }
    if (closed_) {
        return;
    }

    websocket_.text(true);
    outgoing_ = Json{{"type", "requestInitialData"}}.dump();
    websocket_.async_write(asio::buffer(outgoing_),
                           beast::bind_front_handler(&PushConnection::on_write, shared_from_this()));
    do_read();
}

void PushConnection::on_write(const beast::error_code& ec, std::size_t) {
    if (ec) {
        fail("write", ec);
    }
}

void PushConnection::do_read() {
    websocket_.async_read(buffer_, beast::bind_front_handler(&PushConnection::on_read, shared_from_this()));
}

void PushConnection::on_read(const beast::error_code& ec, std::size_t bytes) {
    if (ec) {
        fail(ec == websocket::error::closed ? "closed by peer" : "read", ec);
        return;
    }
    if (closed_) {
        return;
    }

    const std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    auto message = Json::parse(text, nullptr, false);
    if (message.is_discarded()) {
        spdlog::warn("Push frame is not JSON ({} bytes), dropped", bytes);
    } else if (message_handler_) {
        try {
            message_handler_(message);
        } catch (const std::exception& ex) {
            spdlog::warn("Push message handler failed: {}", ex.what());
        }
    }

    if (!closed_) {
        do_read();
    }
}

void PushConnection::fail(const char* what, const beast::error_code& ec) {
    if (closed_) {
        return;
    }
    closed_ = true;
    const std::string reason = std::string(what) + ": " + ec.message();
    auto handler = std::move(close_handler_);
    open_handler_ = nullptr;
    message_handler_ = nullptr;
    close_handler_ = nullptr;
    beast::get_lowest_layer(websocket_).close();
    if (handler) {
        handler(reason);
    }
}

}  // namespace lanmap::transport
