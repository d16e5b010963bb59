#include "upstream.hpp"
#include "log.hpp"
#include "util.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>

#include <optional>
#include <type_traits>

namespace skill
{
    namespace
    {
        namespace beast = boost::beast;
        namespace http = beast::http;
        namespace net = boost::asio;
        namespace ssl = net::ssl;
        using tcp = net::ip::tcp;
        using steady = std::chrono::steady_clock;

        constexpr int max_redirects = 3;

        using plain_stream = beast::tcp_stream;
        using tls_stream = beast::ssl_stream<beast::tcp_stream>;

        // One POST exchange driven by a private io_context. Every step shares
        // the same deadline; the resolver has none of its own so a timer
        // cancels it.
        template <class Stream>
        class exchange
        {
        public:
            template <class... StreamArgs>
            exchange(net::io_context &ioc, const url_parts &url, const upstream_request &req,
                     steady::time_point deadline, StreamArgs &&...stream_args)
                : resolver_(ioc), timer_(ioc), stream_(std::forward<StreamArgs>(stream_args)...),
                  url_(url), deadline_(deadline)
            {
                req_.method(http::verb::post);
                req_.target(url_.target);
                req_.version(11);
                bool default_port = (url_.scheme == "https" && url_.port == "443") ||
                                    (url_.scheme == "http" && url_.port == "80");
                req_.set(http::field::host, default_port ? url_.host : url_.host + ":" + url_.port);
                req_.set(http::field::user_agent, "skill-backend/1.0");
                req_.set(http::field::accept, "application/json,text/plain,*/*");
                req_.set(http::field::connection, "close");
                for (const auto &h : req.headers)
                {
                    if (!h.second.empty())
                        req_.set(h.first, h.second);
                }
                req_.body() = req.body;
                req_.prepare_payload();
            }

            void start()
            {
                if constexpr (std::is_same_v<Stream, tls_stream>)
                {
                    if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str()))
                    {
                        fail(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()), "sni");
                        return;
                    }
                }
                timer_.expires_at(deadline_);
                timer_.async_wait([this](beast::error_code ec)
                                  {
                                      if (!ec && !resolved_)
                                      {
                                          resolve_timed_out_ = true;
                                          resolver_.cancel();
                                      } });
                resolver_.async_resolve(url_.host, url_.port,
                                        [this](beast::error_code ec, tcp::resolver::results_type results)
                                        { on_resolve(ec, results); });
            }

            upstream_reply result()
            {
                if (timed_out_)
                    throw upstream_timeout("upstream timed out during " + failed_step_);
                if (error_)
                    throw upstream_error(failed_step_ + ": " + error_.message());
                return upstream_reply{static_cast<unsigned>(res_.result_int()), std::move(res_.body())};
            }

            std::optional<std::string> location() const
            {
                auto it = res_.find(http::field::location);
                if (it == res_.end())
                    return std::nullopt;
                return std::string(it->value());
            }

        private:
            void on_resolve(beast::error_code ec, const tcp::resolver::results_type &results)
            {
                resolved_ = true;
                timer_.cancel();
                if (resolve_timed_out_)
                    ec = beast::error::timeout;
                if (ec)
                    return fail(ec, "resolve");
                beast::get_lowest_layer(stream_).expires_at(deadline_);
                beast::get_lowest_layer(stream_).async_connect(
                    results, [this](beast::error_code ec, const tcp::endpoint &)
                    { on_connect(ec); });
            }

            void on_connect(beast::error_code ec)
            {
                if (ec)
                    return fail(ec, "connect");
                if constexpr (std::is_same_v<Stream, tls_stream>)
                {
                    stream_.async_handshake(ssl::stream_base::client,
                                            [this](beast::error_code ec)
                                            {
                                                if (ec)
                                                    return fail(ec, "handshake");
                                                write();
                                            });
                }
                else
                {
                    write();
                }
            }

            void write()
            {
                http::async_write(stream_, req_, [this](beast::error_code ec, std::size_t)
                                  {
                                      if (ec)
                                          return fail(ec, "write");
                                      http::async_read(stream_, buffer_, res_,
                                                       [this](beast::error_code ec, std::size_t)
                                                       {
                                                           if (ec)
                                                               return fail(ec, "read");
                                                           beast::get_lowest_layer(stream_).close();
                                                       }); });
            }

            void fail(beast::error_code ec, const char *step)
            {
                failed_step_ = step;
                if (ec == beast::error::timeout || ec == net::error::timed_out)
                    timed_out_ = true;
                error_ = ec;
                timer_.cancel();
            }

            tcp::resolver resolver_;
            net::steady_timer timer_;
            Stream stream_;
            url_parts url_;
            steady::time_point deadline_;
            http::request<http::string_body> req_;
            beast::flat_buffer buffer_;
            http::response<http::string_body> res_;
            beast::error_code error_;
            std::string failed_step_;
            bool resolved_ = false;
            bool resolve_timed_out_ = false;
            bool timed_out_ = false;
        };

        template <class Stream, class... StreamArgs>
        std::pair<upstream_reply, std::optional<std::string>>
        run_exchange(const url_parts &url, const upstream_request &req, steady::time_point deadline,
                     net::io_context &ioc, StreamArgs &&...args)
        {
            exchange<Stream> ex(ioc, url, req, deadline, std::forward<StreamArgs>(args)...);
            ex.start();
            ioc.run();
            auto reply = ex.result();
            return {std::move(reply), ex.location()};
        }
    }

    upstream_reply post_upstream(const upstream_request &req)
    {
        steady::time_point deadline = steady::now() + req.budget;
        std::string url = req.url;
        for (int hop = 0;; ++hop)
        {
            url_parts parts;
            try
            {
                parts = parse_url(url);
            }
            catch (const std::invalid_argument &e)
            {
                throw upstream_error(e.what());
            }

            net::io_context ioc;
            std::pair<upstream_reply, std::optional<std::string>> out;
            if (parts.scheme == "https")
            {
                ssl::context tls_ctx{ssl::context::tls_client};
                tls_ctx.set_default_verify_paths();
                tls_ctx.set_verify_mode(ssl::verify_peer);
                out = run_exchange<tls_stream>(parts, req, deadline, ioc, ioc, tls_ctx);
            }
            else
            {
                out = run_exchange<plain_stream>(parts, req, deadline, ioc, ioc);
            }

            unsigned status = out.first.status;
            if ((status == 307 || status == 308) && out.second && hop < max_redirects &&
                (out.second->rfind("https://", 0) == 0 || out.second->rfind("http://", 0) == 0))
            {
                log_debug("[upstream] following " + std::to_string(status) + " to " + *out.second);
                url = *out.second;
                continue;
            }
            return std::move(out.first);
        }
    }
}
