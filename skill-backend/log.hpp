#pragma once

#include <cstddef>
#include <string>

namespace skill
{
    enum class log_level
    {
        debug,
        info,
        warning,
        error,
        critical
    };

    // Throws config_error for unknown names.
    log_level parse_log_level(const std::string &name);
    const char *log_level_name(log_level level);

    void set_log_level(log_level level);
    log_level current_log_level();

    // "2026-10-19 08:00:00,123 | INFO | message" on stderr.
    void log_message(log_level level, const std::string &message);

    inline void log_debug(const std::string &m) { log_message(log_level::debug, m); }
    inline void log_info(const std::string &m) { log_message(log_level::info, m); }
    inline void log_warning(const std::string &m) { log_message(log_level::warning, m); }
    inline void log_error(const std::string &m) { log_message(log_level::error, m); }
    inline void log_critical(const std::string &m) { log_message(log_level::critical, m); }

    struct access_entry
    {
        std::string remote;
        std::string method;
        std::string target;
        unsigned version = 11;
        unsigned status = 0;
        std::size_t bytes = 0;
        std::string referer;
        std::string user_agent;
    };

    std::string format_access_line(const access_entry &e);

    // One combined-format line on stdout.
    void log_access(const access_entry &e);
}
