#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/http.hpp>

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <variant>

namespace skill
{
    namespace http = boost::beast::http;
    using tcp = boost::asio::ip::tcp;

    using http_request = http::request<http::string_body>;
    using http_response = http::response<http::string_body>;
    using request_handler = std::function<http_response(const http_request &)>;

    // Files go out through file_body so their bytes are never held in memory.
    using file_response = http::response<http::file_body>;
    using any_response = std::variant<http_response, file_response>;
    using any_handler = std::function<any_response(const http_request &)>;

    http_response make_response(const http_request &req, http::status status,
                                const std::string &content_type, std::string body);

    // Runs the handler; an escaping exception becomes a logged 500.
    http_response invoke_handler(const request_handler &handler, const http_request &req);
    any_response invoke_handler(const any_handler &handler, const http_request &req);

    // Access log line; bytes are taken from Content-Length.
    void log_exchange(const std::string &remote, const http_request &req, unsigned status, std::size_t bytes);

    template <class Body>
    void log_exchange(const std::string &remote, const http_request &req, const http::response<Body> &res)
    {
        std::size_t bytes = 0;
        auto len = res.find(http::field::content_length);
        if (len != res.end())
            bytes = std::stoul(std::string(len->value()));
        log_exchange(remote, req, res.result_int(), bytes);
    }

    enum class connection_model
    {
        sequential,           // one connection at a time, one request each
        thread_per_connection // keep-alive, no timeouts
    };

    // Blocking accept loop on a single io_context. Used for the directory
    // server and the development entry point.
    class basic_server
    {
    public:
        basic_server(const std::string &host, unsigned short port, any_handler handler, connection_model model);
        ~basic_server();

        unsigned short local_port() const;

        // Returns after stop() or SIGINT/SIGTERM and once every connection
        // thread has finished.
        void run();

        // Thread-safe.
        void stop();

    private:
        void do_accept();
        void serve_one(tcp::socket &socket);
        void serve_connection(std::shared_ptr<tcp::socket> socket);
        void shutdown_connections();

        boost::asio::io_context ioc_{1};
        tcp::acceptor acceptor_;
        boost::asio::signal_set signals_;
        any_handler handler_;
        connection_model model_;

        std::mutex conn_mtx_;
        std::condition_variable conn_cv_;
        std::set<std::shared_ptr<tcp::socket>> live_;
        int running_threads_ = 0;
    };
}
