#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <cstdlib>

#include "server_config.hpp"
#include "config_loader.hpp"
#include "audit_logger.hpp"
#include "cache_store.hpp"
#include "video_lookup.hpp"
#include "request_pipeline.hpp"
#include "api_router.hpp"
#include "http_session.hpp"
#include "service_logger.hpp"
#include "metrics.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace streamguard {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        const RequestPipeline& pipeline,
        ApiRouter& router,
        net::thread_pool& workers
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , pipeline_(pipeline)
        , router_(router)
        , workers_(workers)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    const RequestPipeline& pipeline_;
    ApiRouter& router_;
    net::thread_pool& workers_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }

        if (ec) {
            ServiceLogger::log(ServiceLogger::Level::ERROR, ServiceLogger::Event::CONNECTION, "internal",
                               "Accept error: " + ec.message());
        } else if (config_.enable_tls) {
            std::make_shared<HttpSession>(
                beast::ssl_stream<beast::tcp_stream>(beast::tcp_stream(std::move(socket)), ssl_ctx_),
                config_,
                pipeline_,
                router_,
                workers_
            )->run();
        } else {
            std::make_shared<HttpSession>(
                beast::tcp_stream(std::move(socket)),
                config_,
                pipeline_,
                router_,
                workers_
            )->run();
        }

        do_accept();
    }
};

}

// Configures the SSL context (TLS 1.2+).
void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );

    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

int main(int argc, char* argv[]) {
    using streamguard::ServiceLogger;
    using streamguard::ConfigError;

    streamguard::ServerConfig config;

    try {
        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-tls" || arg == "-n") {
                config.enable_tls = false;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --no-tls, -n   Disable TLS (for local development)\n"
                          << "  --help, -h     Show this help\n"
                          << "Configuration is read from the environment (see SPEC_FULL.md).\n";
                return 0;
            } else {
                auto port = streamguard::parse_int(arg);
                if (!port || *port <= 0 || *port > 65535) {
                    std::cerr << "[!] Invalid port argument: " << arg << "\n";
                    return 1;
                }
                config.port = static_cast<uint16_t>(*port);
            }
        }

        // --- Environment Variable Overrides ---
        streamguard::apply_env(config, streamguard::process_env());

        // Nothing listens until the whole configuration is valid.
        streamguard::validate(config);
    } catch (const ConfigError& e) {
        std::cerr << "[!] Configuration error, refusing to start:\n";
        for (const auto& v : e.violations()) {
            std::cerr << "    - " << v << "\n";
        }
        return 1;
    }

    try {
        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        if (config.enable_tls &&
            (!std::filesystem::exists(config.cert_path) || !std::filesystem::exists(config.key_path))) {
            std::cerr << "[!] TLS certificates not found at:\n"
                      << "    " << config.cert_path << "\n"
                      << "    " << config.key_path << "\n"
                      << "[*] Or use --no-tls for development without TLS.\n";
            return 1;
        }

        ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::STARTUP, "internal",
                           "streamguard starting on " + config.address + ":" + std::to_string(config.port) +
                           (config.enable_tls ? " (TLS)" : " (plaintext)"));

        net::io_context ioc{config.thread_count};

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        const auto& policy = config.security;
        streamguard::FileAuditLogger audit(policy.audit_log_path, policy.enable_audit_log);
        ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::AUDIT, "internal",
                           policy.enable_audit_log ? "audit log: " + policy.audit_log_path
                                                   : std::string("audit log disabled"));

        auto cache = std::make_shared<streamguard::RedisCacheStore>(config.redis_url);
        streamguard::CachedVideoLookup lookup(
            std::make_unique<streamguard::ExtractorVideoLookup>(
                config.extractor_path, std::chrono::seconds(config.extractor_timeout_sec)),
            cache,
            std::chrono::seconds(config.video_info_ttl_sec),
            std::chrono::seconds(config.stream_url_ttl_sec));

        streamguard::RequestPipeline pipeline(policy, audit);
        streamguard::ApiRouter router(config, lookup, audit, pipeline.errors());

        // Pipeline and lookups run here, off the I/O threads.
        net::thread_pool workers(static_cast<std::size_t>(config.thread_count));
        streamguard::MetricsRegistry::instance().set_gauge(streamguard::metric::kWorkerThreads, config.thread_count);
        streamguard::MetricsRegistry::instance().set_gauge(streamguard::metric::kRequestsInFlight, 0);

        auto listener = std::make_shared<streamguard::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            pipeline,
            router,
            workers
        );
        listener->run();

        // SIGINT and SIGTERM perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener](beast::error_code const&, int) {
                ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::SHUTDOWN, "internal",
                                   "Initiating graceful shutdown");
                listener->stop();
                ioc.stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        workers.stop();
        workers.join();

        audit.close();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
