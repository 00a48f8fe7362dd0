#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/optional.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "server_config.hpp"
#include "request_pipeline.hpp"
#include "api_router.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace streamguard {

// One HTTP/1.1 connection, optionally over TLS. Every request read from the
// connection goes through the request pipeline; the session never answers
// on its own except when the parser itself gives up.
//
// The pipeline runs on the worker pool so a slow lookup never holds the
// connection's strand. While it runs the socket is watched for the peer
// going away, which raises the request's cancellation flag.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        beast::ssl_stream<beast::tcp_stream>&& stream,
        const ServerConfig& config,
        const RequestPipeline& pipeline,
        ApiRouter& router,
        net::thread_pool& workers
    );

    HttpSession(
        beast::tcp_stream&& stream,
        const ServerConfig& config,
        const RequestPipeline& pipeline,
        ApiRouter& router,
        net::thread_pool& workers
    );

    ~HttpSession();

    void run();

private:
    std::variant<
        beast::ssl_stream<beast::tcp_stream>,
        beast::tcp_stream
    > stream_;
    bool is_tls_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;
    const RequestPipeline& pipeline_;
    ApiRouter& router_;
    net::thread_pool& workers_;

    std::string remote_addr_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
    bool watching_ = false;

    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void arm_timeout();
    void handle_request();
    void watch_disconnect();
    void on_processed(std::optional<http::response<http::string_body>> res);
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();

    tcp::socket& socket();
};

}
