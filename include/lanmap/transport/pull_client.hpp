#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace lanmap::transport {

struct PullRequest {
    std::string host;
    std::string port;
    std::string target;
    std::string auth_token;
    std::chrono::milliseconds timeout{10000};
};

struct PullResult {
    std::optional<nlohmann::json> body;
    std::string error;

    bool ok() const { return body.has_value(); }
};

// A single HTTP/1.1 GET returning a JSON document. The result handler runs
// exactly once unless cancel() is called first. PullRequest::timeout bounds
// the whole exchange, name resolution included.
class PullClient : public std::enable_shared_from_this<PullClient> {
public:
    using ResultHandler = std::function<void(PullResult)>;

    PullClient(boost::asio::io_context& io_context, PullRequest request);

    PullClient(const PullClient&) = delete;
    PullClient& operator=(const PullClient&) = delete;

    void run(ResultHandler handler);
    void cancel();

private:
    void on_resolve(const boost::beast::error_code& ec, boost::asio::ip::tcp::resolver::results_type results);
    void on_connect(const boost::beast::error_code& ec, boost::asio::ip::tcp::endpoint endpoint);
    void on_write(const boost::beast::error_code& ec, std::size_t bytes);
    void on_read(const boost::beast::error_code& ec, std::size_t bytes);
    void on_deadline(const boost::system::error_code& ec);
    void fail(const char* what, const boost::beast::error_code& ec);
    void finish(PullResult result);

    PullRequest request_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::beast::tcp_stream stream_;
    boost::asio::steady_timer deadline_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::empty_body> http_request_;
    boost::beast::http::response<boost::beast::http::string_body> http_response_;
    ResultHandler handler_;
    bool finished_{false};
};

}  // namespace lanmap::transport
