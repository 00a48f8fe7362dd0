#pragma once

#include <string>
#include <utility>
#include <vector>
#include <boost/beast/http.hpp>

#include "security_policy.hpp"

namespace streamguard {

namespace http = boost::beast::http;

// Fixed plus policy-driven response headers, composed once from the policy
// and stamped onto every response regardless of status.
class SecurityHeaders {
public:
    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    explicit SecurityHeaders(const SecurityPolicy& policy);

    const HeaderList& headers() const { return headers_; }

    template<class Body>
    void apply(http::response<Body>& res) const {
        for (const auto& h : headers_) {
            res.set(h.first, h.second);
        }
    }

    // "max-age=<n>; includeSubDomains; preload"
    static std::string hsts_value(int max_age);

private:
    HeaderList headers_;
};

}
