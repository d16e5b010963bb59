#include "http_server.hpp"
#include "log.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>

#include <sys/socket.h>

#include <csignal>
#include <thread>

namespace skill
{
    namespace beast = boost::beast;
    namespace net = boost::asio;

    namespace
    {
        std::string remote_of(const tcp::socket &socket)
        {
            beast::error_code ec;
            auto ep = socket.remote_endpoint(ec);
            return ec ? std::string("-") : ep.address().to_string();
        }

        bool is_parse_error(const beast::error_code &ec)
        {
            return ec.category() == http::make_error_code(http::error::bad_method).category() &&
                   ec != http::error::end_of_stream && ec != http::error::partial_message;
        }

        http_response internal_error(const http_request &req, const std::exception &e)
        {
            log_error("Error handling request " + std::string(req.target()) + ": " + e.what());
            return make_response(req, http::status::internal_server_error, "text/html",
                                 "<html><head><title>Internal Server Error</title></head>"
                                 "<body><h1><p>Internal Server Error</p></h1></body></html>");
        }
    }

    http_response make_response(const http_request &req, http::status status,
                                const std::string &content_type, std::string body)
    {
        http_response res{status, req.version()};
        res.set(http::field::server, "skill-backend");
        res.set(http::field::content_type, content_type);
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    http_response invoke_handler(const request_handler &handler, const http_request &req)
    {
        try
        {
            return handler(req);
        }
        catch (const std::exception &e)
        {
            return internal_error(req, e);
        }
    }

    any_response invoke_handler(const any_handler &handler, const http_request &req)
    {
        try
        {
            return handler(req);
        }
        catch (const std::exception &e)
        {
            return internal_error(req, e);
        }
    }

    void log_exchange(const std::string &remote, const http_request &req, unsigned status, std::size_t bytes)
    {
        access_entry e;
        e.remote = remote;
        e.method = std::string(req.method_string());
        e.target = std::string(req.target());
        e.version = req.version();
        e.status = status;
        e.bytes = bytes;
        if (auto it = req.find(http::field::referer); it != req.end())
            e.referer = std::string(it->value());
        if (auto it = req.find(http::field::user_agent); it != req.end())
            e.user_agent = std::string(it->value());
        log_access(e);
    }

    basic_server::basic_server(const std::string &host, unsigned short port, any_handler handler, connection_model model)
        : acceptor_(ioc_), signals_(ioc_, SIGINT, SIGTERM), handler_(std::move(handler)), model_(model)
    {
        tcp::endpoint endpoint{net::ip::make_address(host), port};
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
    }

    basic_server::~basic_server()
    {
        shutdown_connections();
    }

    unsigned short basic_server::local_port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void basic_server::run()
    {
        signals_.async_wait([this](beast::error_code ec, int sig)
                            {
                                if (ec)
                                    return;
                                log_info("Handling signal " + std::to_string(sig) + ", shutting down");
                                stop(); });
        do_accept();
        ioc_.run();
        shutdown_connections();
    }

    void basic_server::stop()
    {
        net::post(ioc_, [this]
                  {
                      beast::error_code ec;
                      acceptor_.close(ec);
                      signals_.cancel(ec);
                      ioc_.stop(); });
    }

    void basic_server::do_accept()
    {
        acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket)
                               {
                                   if (ec)
                                   {
                                       if (ec != net::error::operation_aborted)
                                           log_error("accept failed: " + ec.message());
                                       if (!acceptor_.is_open())
                                           return;
                                       return do_accept();
                                   }
                                   if (model_ == connection_model::sequential)
                                   {
                                       // Served inline: the next accept waits for this one.
                                       serve_one(socket);
                                   }
                                   else
                                   {
                                       auto sp = std::make_shared<tcp::socket>(std::move(socket));
                                       {
                                           std::lock_guard<std::mutex> lk(conn_mtx_);
                                           live_.insert(sp);
                                           ++running_threads_;
                                       }
                                       std::thread(&basic_server::serve_connection, this, sp).detach();
                                   }
                                   do_accept(); });
    }

    void basic_server::serve_one(tcp::socket &socket)
    {
        std::string remote = remote_of(socket);
        beast::flat_buffer buffer;
        http_request req;
        beast::error_code ec;
        http::read(socket, buffer, req, ec);
        if (ec)
        {
            if (is_parse_error(ec))
            {
                http_request bad;
                bad.version(10);
                auto res = make_response(bad, http::status::bad_request, "text/html", "Bad request syntax");
                res.keep_alive(false);
                http::write(socket, res, ec);
            }
            else if (ec != http::error::end_of_stream)
            {
                log_debug("read failed from " + remote + ": " + ec.message());
            }
            socket.shutdown(tcp::socket::shutdown_both, ec);
            return;
        }

        any_response res = invoke_handler(handler_, req);
        std::visit([&](auto &r)
                   {
                       r.keep_alive(false);
                       http::write(socket, r, ec);
                       log_exchange(remote, req, r); },
                   res);
        if (ec)
            log_debug("write failed to " + remote + ": " + ec.message());
        socket.shutdown(tcp::socket::shutdown_send, ec);
        socket.close(ec);
    }

    void basic_server::serve_connection(std::shared_ptr<tcp::socket> socket)
    {
        std::string remote = remote_of(*socket);
        beast::flat_buffer buffer;
        beast::error_code ec;
        for (;;)
        {
            http_request req;
            http::read(*socket, buffer, req, ec);
            if (ec)
            {
                if (ec != http::error::end_of_stream)
                    log_debug("read failed from " + remote + ": " + ec.message());
                break;
            }
            any_response res = invoke_handler(handler_, req);
            bool close = std::visit([&](auto &r)
                                    {
                                        r.keep_alive(req.keep_alive());
                                        http::write(*socket, r, ec);
                                        log_exchange(remote, req, r);
                                        return r.need_eof(); },
                                    res);
            if (ec || close)
                break;
        }
        std::lock_guard<std::mutex> lk(conn_mtx_);
        socket->shutdown(tcp::socket::shutdown_send, ec);
        socket->close(ec);
        live_.erase(socket);
        socket.reset();
        --running_threads_;
        conn_cv_.notify_all();
    }

    void basic_server::shutdown_connections()
    {
        std::unique_lock<std::mutex> lk(conn_mtx_);
        for (const auto &sp : live_)
        {
            // Unblocks the thread's pending read.
            ::shutdown(sp->native_handle(), SHUT_RDWR);
        }
        conn_cv_.wait(lk, [this]
                      { return running_threads_ == 0; });
    }
}
