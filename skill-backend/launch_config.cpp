#include "launch_config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace skill
{
    namespace
    {
        bool all_digits(const std::string &s)
        {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](char c)
                                             { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
        }

        int parse_positive(const std::string &flag, const std::string &value, int minimum)
        {
            if (!all_digits(value) || value.size() > 9)
                throw config_error(flag + " expects a number, got '" + value + "'");
            int n = std::stoi(value);
            if (n < minimum)
                throw config_error(flag + " must be at least " + std::to_string(minimum));
            return n;
        }

        void parse_bind(const std::string &value, worker_settings &s)
        {
            auto colon = value.rfind(':');
            if (colon == std::string::npos)
            {
                s.host = value;
                s.port = default_port;
                return;
            }
            s.host = value.substr(0, colon);
            if (s.host.empty())
                s.host = "0.0.0.0";
            s.port = parse_port(value.substr(colon + 1));
        }
    }

    unsigned short parse_port(const std::string &value)
    {
        if (!all_digits(value) || value.size() > 5)
            throw config_error("invalid port '" + value + "'");
        int n = std::stoi(value);
        if (n > 65535)
            throw config_error("port out of range '" + value + "'");
        return static_cast<unsigned short>(n);
    }

    unsigned short port_from_environment(bool required)
    {
        const char *p = std::getenv("PORT");
        std::string value = p ? trim(p) : std::string();
        if (value.empty())
        {
            if (required)
                throw config_error("PORT is not set; cannot bind 0.0.0.0:$PORT");
            return default_port;
        }
        return parse_port(value);
    }

    serve_options parse_serve_options(const std::vector<std::string> &args)
    {
        serve_options opts;
        bool have_bind = false;
        bool have_app = false;
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if (arg.rfind("--", 0) != 0)
            {
                if (have_app)
                    throw config_error("unexpected argument '" + arg + "'");
                opts.app = arg;
                have_app = true;
                continue;
            }
            if (i + 1 >= args.size())
                throw config_error(arg + " requires a value");
            const std::string &value = args[++i];
            if (arg == "--bind")
            {
                parse_bind(value, opts.settings);
                have_bind = true;
            }
            else if (arg == "--threads")
                opts.settings.threads = parse_positive(arg, value, 1);
            else if (arg == "--timeout")
                opts.settings.timeout = std::chrono::seconds(parse_positive(arg, value, 1));
            else if (arg == "--graceful-timeout")
                opts.settings.graceful_timeout = std::chrono::seconds(parse_positive(arg, value, 0));
            else if (arg == "--keep-alive")
                opts.settings.keep_alive = std::chrono::seconds(parse_positive(arg, value, 1));
            else if (arg == "--log-level")
                opts.settings.level = parse_log_level(to_lower(value));
            else
                throw config_error("unknown option '" + arg + "'");
        }
        if (!have_bind)
            opts.settings.port = port_from_environment(true);
        return opts;
    }

    std::string env_or(const char *name, const std::string &fallback)
    {
        const char *v = std::getenv(name);
        return v ? std::string(v) : fallback;
    }
}
