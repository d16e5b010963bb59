#pragma once

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

namespace skill_test
{
    // Sets or unsets an environment variable for the lifetime of the guard.
    class scoped_env
    {
    public:
        scoped_env(const char *name, const char *value)
            : name_(name)
        {
            if (const char *old = std::getenv(name))
                old_ = old;
            if (value)
                ::setenv(name, value, 1);
            else
                ::unsetenv(name);
        }

        ~scoped_env()
        {
            if (old_)
                ::setenv(name_.c_str(), old_->c_str(), 1);
            else
                ::unsetenv(name_.c_str());
        }

        scoped_env(const scoped_env &) = delete;
        scoped_env &operator=(const scoped_env &) = delete;

    private:
        std::string name_;
        std::optional<std::string> old_;
    };

    class temp_dir
    {
    public:
        explicit temp_dir(const std::string &prefix)
        {
            auto now = std::chrono::steady_clock::now().time_since_epoch().count();
            path_ = std::filesystem::temp_directory_path() / (prefix + "-" + std::to_string(now));
            std::filesystem::create_directories(path_);
        }

        ~temp_dir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        const std::filesystem::path &path() const { return path_; }

        void write(const std::string &relative, const std::string &content) const
        {
            auto file = path_ / relative;
            std::filesystem::create_directories(file.parent_path());
            std::ofstream out(file, std::ios::binary);
            out << content;
        }

    private:
        std::filesystem::path path_;
    };

    using response = boost::beast::http::response<boost::beast::http::string_body>;

    // One blocking request to 127.0.0.1:port on a fresh connection.
    inline response fetch(unsigned short port, boost::beast::http::verb method, const std::string &target,
                          const std::string &body = "")
    {
        namespace http = boost::beast::http;
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::socket sock{ioc};
        sock.connect({boost::asio::ip::make_address("127.0.0.1"), port});
        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.set(http::field::connection, "close");
        req.body() = body;
        req.prepare_payload();
        http::write(sock, req);
        boost::beast::flat_buffer buffer;
        response res;
        http::read(sock, buffer, res);
        boost::beast::error_code ec;
        sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        return res;
    }
}
