#include "log.hpp"
#include "launch_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

namespace skill
{
    namespace
    {
        std::mutex log_mtx;
        std::atomic<log_level> threshold{log_level::info};

        std::string local_stamp()
        {
            auto now = std::chrono::system_clock::now();
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
            std::time_t t = std::chrono::system_clock::to_time_t(now);
            std::tm tm{};
            localtime_r(&t, &tm);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
            char out[48];
            std::snprintf(out, sizeof(out), "%s,%03d", buf, static_cast<int>(ms));
            return out;
        }

        std::string access_stamp()
        {
            std::time_t t = std::time(nullptr);
            std::tm tm{};
            gmtime_r(&t, &tm);
            char buf[40];
            std::strftime(buf, sizeof(buf), "[%d/%b/%Y:%H:%M:%S +0000]", &tm);
            return buf;
        }

        std::string dash_if_empty(const std::string &s)
        {
            return s.empty() ? "-" : s;
        }
    }

    log_level parse_log_level(const std::string &name)
    {
        if (name == "debug")
            return log_level::debug;
        if (name == "info")
            return log_level::info;
        if (name == "warning")
            return log_level::warning;
        if (name == "error")
            return log_level::error;
        if (name == "critical")
            return log_level::critical;
        throw config_error("invalid log level '" + name + "'");
    }

    const char *log_level_name(log_level level)
    {
        switch (level)
        {
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warning:
            return "WARNING";
        case log_level::error:
            return "ERROR";
        case log_level::critical:
            return "CRITICAL";
        }
        return "INFO";
    }

    void set_log_level(log_level level)
    {
        threshold.store(level);
    }

    log_level current_log_level()
    {
        return threshold.load();
    }

    void log_message(log_level level, const std::string &message)
    {
        if (level < threshold.load())
            return;
        std::string line = local_stamp() + " | " + log_level_name(level) + " | " + message;
        std::lock_guard<std::mutex> lk(log_mtx);
        std::cerr << line << std::endl;
    }

    std::string format_access_line(const access_entry &e)
    {
        std::string request = e.method + " " + e.target + " HTTP/" +
                              std::to_string(e.version / 10) + "." + std::to_string(e.version % 10);
        return dash_if_empty(e.remote) + " - - " + access_stamp() + " \"" + request + "\" " +
               std::to_string(e.status) + " " + std::to_string(e.bytes) + " \"" +
               dash_if_empty(e.referer) + "\" \"" + dash_if_empty(e.user_agent) + "\"";
    }

    void log_access(const access_entry &e)
    {
        std::string line = format_access_line(e);
        std::lock_guard<std::mutex> lk(log_mtx);
        std::cout << line << std::endl;
    }
}
