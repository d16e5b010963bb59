#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace skill
{
    std::string trim(std::string_view s);
    std::string to_lower(std::string s);

    // Decodes %XX escapes; malformed escapes are kept as-is.
    std::string percent_decode(std::string_view s);
    std::string percent_encode_path(std::string_view s);
    std::string html_escape(std::string_view s);

    // RFC 7231 date, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
    std::string http_date(std::time_t t);
    std::optional<std::time_t> parse_http_date(const std::string &s);

    // 2026-10-19T08:00:00.123456 (UTC, no zone suffix)
    std::string iso_timestamp_utc(std::chrono::system_clock::time_point tp);

    struct url_parts
    {
        std::string scheme; // "http" or "https"
        std::string host;
        std::string port;
        std::string target; // path + query, at least "/"
    };

    // Throws std::invalid_argument on anything but absolute http(s) URLs.
    url_parts parse_url(const std::string &url);
}
