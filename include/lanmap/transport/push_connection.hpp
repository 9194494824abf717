#pragma once

#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

namespace lanmap::transport {

/**
 * @brief One websocket session against the push endpoint.
 *
 * Resolve, connect, handshake and the read loop are all asynchronous on the
 * owning io_context. After the handshake a snapshot request is sent. The
 * close handler fires at most once, when the session ends for any reason
 * other than close().
 *
 * Every member function must run on the io_context thread.
 */
class PushConnection : public std::enable_shared_from_this<PushConnection> {
public:
    using Json = nlohmann::json;
    using OpenHandler = std::function<void()>;
    using MessageHandler = std::function<void(const Json&)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    PushConnection(boost::asio::io_context& io_context, std::string host, std::string port, std::string endpoint);

    PushConnection(const PushConnection&) = delete;
    PushConnection& operator=(const PushConnection&) = delete;

    void start(OpenHandler on_open, MessageHandler on_message, CloseHandler on_close);
    // Abandons the session; no handler is invoked afterwards.
    void close();

private:
    using websocket_t = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    void on_resolve(const boost::beast::error_code& ec, boost::asio::ip::tcp::resolver::results_type results);
    void on_connect(const boost::beast::error_code& ec, boost::asio::ip::tcp::endpoint endpoint);
    void on_handshake(const boost::beast::error_code& ec);
    void on_write(const boost::beast::error_code& ec, std::size_t bytes);
    void do_read();
    void on_read(const boost::beast::error_code& ec, std::size_t bytes);
    void fail(const char* what, const boost::beast::error_code& ec);

    std::string host_;
    std::string port_;
    std::string endpoint_;
    std::string host_header_;

    boost::asio::ip::tcp::resolver resolver_;
    websocket_t websocket_;
    boost::beast::flat_buffer buffer_;
    std::string outgoing_;

    OpenHandler open_handler_;
    MessageHandler message_handler_;
    CloseHandler close_handler_;
    bool closed_{false};
};

}  // namespace lanmap::transport
