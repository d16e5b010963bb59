#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"

namespace skill
{
    // Fatal startup problem; main() reports it and exits with status 1.
    class config_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    constexpr unsigned short default_port = 8080;

    // Parses a decimal port in [0, 65535]; throws config_error otherwise.
    unsigned short parse_port(const std::string &value);

    // Reads PORT. Unset or empty is an error when required, else default_port.
    unsigned short port_from_environment(bool required);

    struct worker_settings
    {
        std::string host = "0.0.0.0";
        unsigned short port = 0;
        int threads = 2;
        std::chrono::seconds timeout{30};
        std::chrono::seconds graceful_timeout{10};
        std::chrono::seconds keep_alive{65};
        log_level level = log_level::info;
    };

    struct serve_options
    {
        std::string app = "app:app";
        worker_settings settings;
    };

    // Parses "skill-serve [APP] [--bind H:P] [--threads N] [--timeout S]
    // [--graceful-timeout S] [--keep-alive S] [--log-level L]". PORT is only
    // consulted (and then required) when --bind is absent.
    serve_options parse_serve_options(const std::vector<std::string> &args);

    std::string env_or(const char *name, const std::string &fallback);
}
