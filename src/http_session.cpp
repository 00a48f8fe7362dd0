#include "http_session.hpp"
#include "service_logger.hpp"

#include <boost/asio/post.hpp>

namespace streamguard {

// HTTPS session (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    const RequestPipeline& pipeline,
    ApiRouter& router,
    net::thread_pool& workers
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , pipeline_(pipeline)
    , router_(router)
    , workers_(workers)
    , cancelled_(std::make_shared<std::atomic<bool>>(false))
{
    beast::error_code ec;
    auto ep = socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Plaintext HTTP session (behind a local proxy or for testing)
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    const RequestPipeline& pipeline,
    ApiRouter& router,
    net::thread_pool& workers
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , pipeline_(pipeline)
    , router_(router)
    , workers_(workers)
    , cancelled_(std::make_shared<std::atomic<bool>>(false))
{
    beast::error_code ec;
    auto ep = socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

HttpSession::~HttpSession() {
    cancelled_->store(true);
}

tcp::socket& HttpSession::socket() {
    if (is_tls_) {
        return beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).socket();
    }
    return std::get<beast::tcp_stream>(stream_).socket();
}

void HttpSession::run() {
    if (is_tls_) {
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Silent closure; scanners fail the handshake constantly.
        return;
    }
    do_read();
}

// Idle timeout against slow-loris style clients.
void HttpSession::arm_timeout() {
    auto timeout = std::chrono::seconds(config_.connection_timeout_sec);
    if (is_tls_) {
        beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).expires_after(timeout);
    } else {
        std::get<beast::tcp_stream>(stream_).expires_after(timeout);
    }
}

void HttpSession::do_read() {
    req_ = {};
    arm_timeout();

    auto self = shared_from_this();
    parser_.emplace();
    parser_->header_limit(static_cast<std::uint32_t>(config_.max_header_block_size));
    pipeline_.size_limiter().apply_body_limit(*parser_);

    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::body_limit) {
        // The body is cut off at the ceiling and never buffered in full.
        send_response(pipeline_.reject_oversized_body(parser_->get().base(), remote_addr_,
                                                      pipeline_.size_limiter().body_read_limit()));
        return;
    }

    if (ec == http::error::header_limit) {
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::SIZE_LIMIT, remote_addr_,
                           "header block exceeds parser limit, closing connection");
        cancelled_->store(true);
        do_close();
        return;
    }

    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }

    if (ec) {
        cancelled_->store(true);
        return;
    }

    req_ = parser_->release();
    handle_request();
}

void HttpSession::handle_request() {
    watch_disconnect();

    auto self = shared_from_this();
    net::post(workers_, [self] {
        std::optional<http::response<http::string_body>> res;
        try {
            res = self->pipeline_.process(
                self->req_, self->remote_addr_,
                [self](const http::request<http::string_body>& req, RequestContext& ctx) {
                    return self->router_.handle(req, ctx);
                },
                self->cancelled_);
        } catch (const std::exception& e) {
            ServiceLogger::log(ServiceLogger::Level::ERROR, ServiceLogger::Event::CONNECTION, self->remote_addr_,
                               std::string("request dropped: ") + e.what());
        }

        net::post(self->socket().get_executor(),
                  [self, res = std::move(res)]() mutable {
                      self->on_processed(std::move(res));
                  });
    });
}

// Readiness with nothing to read means the peer closed or reset. Pending
// bytes (a pipelined request, a TLS record) are left for the next read.
void HttpSession::watch_disconnect() {
    watching_ = true;
    auto self = shared_from_this();
    socket().async_wait(tcp::socket::wait_read, [self](beast::error_code ec) {
        if (ec || !self->watching_) {
            return;
        }
        beast::error_code avail_ec;
        std::size_t pending = self->socket().available(avail_ec);
        if (avail_ec || pending == 0) {
            self->cancelled_->store(true);
            ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::CONNECTION, self->remote_addr_,
                               "client went away before the response was ready");
        }
    });
}

void HttpSession::on_processed(std::optional<http::response<http::string_body>> res) {
    watching_ = false;
    beast::error_code ec;
    socket().cancel(ec);

    if (!res || cancelled_->load()) {
        do_close();
        return;
    }
    send_response(std::move(*res));
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    arm_timeout();

    auto self = shared_from_this();

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        cancelled_->store(true);
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::CONNECTION, remote_addr_,
                           "HTTP write error: " + ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
