#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace skill
{
    namespace
    {
        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        std::tm utc_tm(std::time_t t)
        {
            std::tm tm{};
            gmtime_r(&t, &tm);
            return tm;
        }
    }

    std::string trim(std::string_view s)
    {
        auto is_space = [](char c)
        { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        std::size_t b = 0, e = s.size();
        while (b < e && is_space(s[b]))
            ++b;
        while (e > b && is_space(s[e - 1]))
            --e;
        return std::string(s.substr(b, e - b));
    }

    std::string to_lower(std::string s)
    {
        for (char &c : s)
            c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    std::string percent_decode(std::string_view s)
    {
        std::string out;
        out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] == '%' && i + 2 < s.size())
            {
                int hi = hex_value(s[i + 1]);
                int lo = hex_value(s[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    out.push_back(static_cast<char>(hi * 16 + lo));
                    i += 2;
                    continue;
                }
            }
            out.push_back(s[i]);
        }
        return out;
    }

    std::string percent_encode_path(std::string_view s)
    {
        static const char *digits = "0123456789ABCDEF";
        std::string out;
        for (char ch : s)
        {
            auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~')
            {
                out.push_back(ch);
                continue;
            }
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0f]);
        }
        return out;
    }

    std::string html_escape(std::string_view s)
    {
        std::string out;
        out.reserve(s.size());
        for (char c : s)
        {
            switch (c)
            {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#x27;";
                break;
            default:
                out.push_back(c);
            }
        }
        return out;
    }

    std::string http_date(std::time_t t)
    {
        std::tm tm = utc_tm(t);
        char buf[64];
        std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
        return buf;
    }

    std::optional<std::time_t> parse_http_date(const std::string &s)
    {
        std::tm tm{};
        std::istringstream in(s);
        in.imbue(std::locale::classic());
        in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
        if (in.fail())
            return std::nullopt;
        return timegm(&tm);
    }

    std::string iso_timestamp_utc(std::chrono::system_clock::time_point tp)
    {
        auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
        std::tm tm = utc_tm(std::chrono::system_clock::to_time_t(secs));
        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
        char frac[16];
        std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(micros));
        return std::string(buf) + frac;
    }

    url_parts parse_url(const std::string &url)
    {
        url_parts parts;
        std::string rest;
        if (url.rfind("https://", 0) == 0)
        {
            parts.scheme = "https";
            rest = url.substr(8);
        }
        else if (url.rfind("http://", 0) == 0)
        {
            parts.scheme = "http";
            rest = url.substr(7);
        }
        else
        {
            throw std::invalid_argument("unsupported url: " + url);
        }
        auto slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        parts.target = slash == std::string::npos ? "/" : rest.substr(slash);
        auto colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
            parts.host = authority.substr(0, colon);
            parts.port = authority.substr(colon + 1);
            bool numeric = std::all_of(parts.port.begin(), parts.port.end(), [](char c)
                                      { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
            if (parts.port.empty() || !numeric)
                throw std::invalid_argument("invalid port in url: " + url);
        }
        else
        {
            parts.host = authority;
            parts.port = parts.scheme == "https" ? "443" : "80";
        }
        if (parts.host.empty())
            throw std::invalid_argument("missing host in url: " + url);
        return parts;
    }
}
