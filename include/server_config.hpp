#pragma once

#include <string>
#include <cstdint>
#include <vector>

#include "security_policy.hpp"

namespace streamguard {


// Process-wide server configuration. The embedded SecurityPolicy is the
// only part the request pipeline consumes.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8001;
    int thread_count = 0;  // 0 defaults to hardware concurrency
    std::string redis_url = "tcp://127.0.0.1:6379";

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Connection Management ---
    int connection_timeout_sec = 60;
    size_t max_header_block_size = 64 * 1024;  // parser ceiling for the whole header block

    // --- Video Lookup & Cache ---
    std::string extractor_path = "yt-dlp";
    int extractor_timeout_sec = 60;
    int video_info_ttl_sec = 15 * 60;
    int stream_url_ttl_sec = 5 * 60;

    // --- Smart Streaming ---
    bool smart_proxy_enabled = true;
    std::vector<std::string> proxy_countries = {"CN"};
    std::string default_stream_mode = "direct";

    SecurityPolicy security;
};

}
