#pragma once

#include <string>
#include <vector>
#include <boost/beast/http.hpp>

#include "cidr_range.hpp"

namespace streamguard {

namespace http = boost::beast::http;

// Abstract interface for client-address access decisions.
class IpAccessController {
public:
    virtual ~IpAccessController() = default;

    // True when the address falls inside any blocklisted range.
    virtual bool is_blocked(const std::string& addr) const = 0;

    // True when the address may pass the allowlist (an empty allowlist allows all).
    virtual bool is_allowed(const std::string& addr) const = 0;

    virtual bool is_enabled() const = 0;
};

// CIDR-table implementation. Tables are parsed once in the constructor and
// never modified afterwards, so concurrent lookups need no locking.
class CidrAccessController : public IpAccessController {
public:
    /**
     * @throws std::invalid_argument if any entry is malformed. Policies are
     * validated before this point, so this only fires on programming errors.
     */
    CidrAccessController(const std::vector<std::string>& allowlist,
                         const std::vector<std::string>& blocklist,
                         bool enabled);

    bool is_blocked(const std::string& addr) const override;
    bool is_allowed(const std::string& addr) const override;
    bool is_enabled() const override { return enabled_; }

    size_t allowlist_size() const { return allowlist_.size(); }
    size_t blocklist_size() const { return blocklist_.size(); }

    static std::vector<CidrRange> parse_list(const std::vector<std::string>& entries);

private:
    std::vector<CidrRange> allowlist_;
    std::vector<CidrRange> blocklist_;
    bool enabled_;
};

/**
 * Resolves the client address for a request. Tries, in order:
 * CF-Connecting-IP, X-Real-IP, the first hop of X-Forwarded-For, then the
 * transport peer address with any port stripped. Returns an empty string
 * when nothing is available.
 */
std::string extract_client_address(const http::request_header<>& headers,
                                   const std::string& peer_addr);

// Removes a trailing ":port" from "a.b.c.d:port" or "[v6]:port".
std::string strip_port(const std::string& host_port);

}
