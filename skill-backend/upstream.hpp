#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace skill
{
    class upstream_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // The deadline passed before the exchange completed.
    class upstream_timeout : public upstream_error
    {
    public:
        using upstream_error::upstream_error;
    };

    struct upstream_request
    {
        std::string url;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        std::chrono::milliseconds budget{4200};
    };

    struct upstream_reply
    {
        unsigned status = 0;
        std::string body;
    };

    using upstream_transport = std::function<upstream_reply(const upstream_request &)>;

    // POSTs req.body to req.url over HTTP or HTTPS (peer verified, SNI set).
    // One deadline covers every step; 307/308 are followed up to 3 times.
    upstream_reply post_upstream(const upstream_request &req);
}
