#include "worker_server.hpp"
#include "log.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <mutex>
#include <thread>
#include <vector>

namespace skill
{
    namespace beast = boost::beast;
    namespace net = boost::asio;

    namespace
    {
        constexpr auto accept_backoff = std::chrono::milliseconds(100);
        constexpr auto drain_poll = std::chrono::milliseconds(50);
    }

    struct worker_server::state
    {
        state(const worker_settings &s, request_handler h);

        void do_accept();
        void begin_drain();
        void poll_drain();
        void finish(bool was_forced);

        worker_settings settings;
        request_handler handler;

        std::atomic<bool> draining{false};
        std::atomic<bool> forced{false};
        std::atomic<int> open_sessions{0};
        std::mutex sessions_mtx;
        std::vector<std::weak_ptr<session>> sessions;
        std::chrono::steady_clock::time_point drain_deadline;

        // control outlives io: sessions own timers on the control context.
        net::io_context control{1};
        net::io_context io;
        net::executor_work_guard<net::io_context::executor_type> work;
        tcp::acceptor acceptor;
        net::signal_set signals;
        net::steady_timer drain_timer;
        net::steady_timer backoff_timer;
    };

    class worker_server::session : public std::enable_shared_from_this<session>
    {
    public:
        session(tcp::socket &&socket, state &st)
            : stream_(std::move(socket)), st_(st)
        {
            beast::error_code ec;
            auto ep = stream_.socket().remote_endpoint(ec);
            remote_ = ec ? std::string("-") : ep.address().to_string();
            ++st_.open_sessions;
        }

        ~session()
        {
            --st_.open_sessions;
        }

        void run()
        {
            net::dispatch(stream_.get_executor(),
                          beast::bind_front_handler(&session::do_read, shared_from_this()));
        }

        // Posted by the drain; a connection waiting for its next request is
        // closed, one with a request in progress finishes it first.
        void close_if_idle()
        {
            net::post(stream_.get_executor(), [self = shared_from_this()]
                      {
                          if (self->idle_)
                              self->do_close();
                      });
        }

    private:
        enum phase : int
        {
            handling = 0,
            answered = 1,
            expired = 2
        };

        void do_read()
        {
            req_ = {};
            idle_ = true;
            stream_.expires_after(first_ ? st_.settings.timeout : st_.settings.keep_alive);
            http::async_read(stream_, buffer_, req_,
                             beast::bind_front_handler(&session::on_read, shared_from_this()));
        }

        void on_read(beast::error_code ec, std::size_t)
        {
            if (ec == http::error::end_of_stream)
                return do_close();
            if (ec)
            {
                if (ec != beast::error::timeout && ec != net::error::operation_aborted)
                    log_debug("read failed from " + remote_ + ": " + ec.message());
                return;
            }
            idle_ = false;

            arm_watchdog();
            http_response res = invoke_handler(st_.handler, req_);
            if (!disarm_watchdog())
                return do_close();

            res.keep_alive(req_.keep_alive() && !st_.draining.load());
            res_ = std::make_shared<http_response>(std::move(res));
            log_exchange(remote_, req_, *res_);

            stream_.expires_after(st_.settings.timeout);
            http::async_write(stream_, *res_,
                              beast::bind_front_handler(&session::on_write, shared_from_this(), res_->need_eof()));
        }

        void on_write(bool close, beast::error_code ec, std::size_t)
        {
            res_.reset();
            first_ = false;
            if (ec)
            {
                log_debug("write failed to " + remote_ + ": " + ec.message());
                return;
            }
            if (close || st_.draining.load())
                return do_close();
            do_read();
        }

        void do_close()
        {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            stream_.socket().close(ec);
        }

        // The timer lives on the control context; it is created here but only
        // ever waited on, cancelled and destroyed there.
        void arm_watchdog()
        {
            phase_.store(handling);
            watchdog_ = std::make_shared<net::steady_timer>(st_.control, st_.settings.timeout);
            std::weak_ptr<session> weak = shared_from_this();
            net::post(st_.control, [timer = watchdog_, weak]
                      { timer->async_wait([weak](beast::error_code ec)
                                          {
                                              if (ec)
                                                  return;
                                              if (auto self = weak.lock())
                                                  self->expire(); }); });
        }

        // False when the watchdog already dropped the connection.
        bool disarm_watchdog()
        {
            net::post(st_.control, [timer = std::move(watchdog_)]
                      { timer->cancel(); });
            int expected = handling;
            return phase_.compare_exchange_strong(expected, answered);
        }

        // Control thread, while the handler is still running on an I/O
        // thread: only the descriptor is touched, the socket object is
        // closed by do_close once the handler returns.
        void expire()
        {
            int expected = handling;
            if (!phase_.compare_exchange_strong(expected, expired))
                return;
            log_critical("WORKER TIMEOUT handling " + std::string(req_.target()) + " for " + remote_);
            ::shutdown(stream_.socket().native_handle(), SHUT_RDWR);
        }

        beast::tcp_stream stream_;
        state &st_;
        std::string remote_;
        beast::flat_buffer buffer_;
        http_request req_;
        std::shared_ptr<http_response> res_;
        std::shared_ptr<net::steady_timer> watchdog_;
        std::atomic<int> phase_{answered};
        bool idle_ = true;
        bool first_ = true;
    };

    worker_server::state::state(const worker_settings &s, request_handler h)
        : settings(s), handler(std::move(h)), io(s.threads), work(io.get_executor()), acceptor(control),
          signals(control, SIGINT, SIGTERM), drain_timer(control), backoff_timer(control)
    {
        tcp::endpoint endpoint{net::ip::make_address(settings.host), settings.port};
        acceptor.open(endpoint.protocol());
        acceptor.set_option(net::socket_base::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen(net::socket_base::max_listen_connections);
    }

    void worker_server::state::do_accept()
    {
        acceptor.async_accept(net::make_strand(io),
                              [this](beast::error_code ec, tcp::socket socket)
                              {
                                  if (draining.load())
                                      return;
                                  if (ec)
                                  {
                                      // EMFILE and friends persist; retry after a pause.
                                      log_error("accept failed: " + ec.message());
                                      backoff_timer.expires_after(accept_backoff);
                                      backoff_timer.async_wait([this](beast::error_code wait_ec)
                                                               {
                                                                   if (!wait_ec && !draining.load())
                                                                       do_accept(); });
                                      return;
                                  }
                                  auto s = std::make_shared<session>(std::move(socket), *this);
                                  {
                                      std::lock_guard<std::mutex> lk(sessions_mtx);
                                      sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                                                    [](const std::weak_ptr<session> &w)
                                                                    { return w.expired(); }),
                                                     sessions.end());
                                      sessions.push_back(s);
                                  }
                                  s->run();
                                  do_accept();
                              });
    }

    void worker_server::state::begin_drain()
    {
        if (draining.exchange(true))
            return;
        beast::error_code ec;
        acceptor.close(ec);
        signals.cancel(ec);
        backoff_timer.cancel();

        std::vector<std::shared_ptr<session>> live;
        {
            std::lock_guard<std::mutex> lk(sessions_mtx);
            for (auto &w : sessions)
            {
                if (auto s = w.lock())
                    live.push_back(std::move(s));
            }
        }
        for (auto &s : live)
            s->close_if_idle();
        live.clear();

        drain_deadline = std::chrono::steady_clock::now() + settings.graceful_timeout;
        poll_drain();
    }

    void worker_server::state::poll_drain()
    {
        int open = open_sessions.load();
        if (open == 0)
            return finish(false);
        if (std::chrono::steady_clock::now() >= drain_deadline)
        {
            log_warning("graceful timeout reached, dropping " + std::to_string(open) + " connection(s)");
            return finish(true);
        }
        drain_timer.expires_after(drain_poll);
        drain_timer.async_wait([this](beast::error_code ec)
                               {
                                   if (!ec)
                                       poll_drain(); });
    }

    void worker_server::state::finish(bool was_forced)
    {
        forced.store(was_forced);
        work.reset();
        io.stop();
        control.stop();
    }

    worker_server::worker_server(const worker_settings &settings, request_handler handler)
        : state_(std::make_shared<state>(settings, std::move(handler)))
    {
    }

    worker_server::~worker_server() = default;

    unsigned short worker_server::local_port() const
    {
        return state_->acceptor.local_endpoint().port();
    }

    bool worker_server::draining() const
    {
        return state_->draining.load();
    }

    worker_server::drain_result worker_server::run()
    {
        std::shared_ptr<state> st = state_;
        log_info("Listening at: http://" + st->settings.host + ":" + std::to_string(local_port()) +
                 " (" + std::to_string(::getpid()) + ")");
        log_info("Using worker: threads=" + std::to_string(st->settings.threads) +
                 " timeout=" + std::to_string(st->settings.timeout.count()) +
                 "s graceful-timeout=" + std::to_string(st->settings.graceful_timeout.count()) +
                 "s keep-alive=" + std::to_string(st->settings.keep_alive.count()) + "s");

        st->signals.async_wait([raw = st.get()](beast::error_code ec, int sig)
                               {
                                   if (ec)
                                       return;
                                   log_info("Handling signal: " + std::to_string(sig));
                                   raw->begin_drain(); });
        st->do_accept();

        std::vector<std::thread> pool;
        pool.reserve(st->settings.threads);
        for (int i = 0; i < st->settings.threads; ++i)
        {
            // Each thread co-owns the state so a forced drain can leave it behind.
            pool.emplace_back([st]
                              { st->io.run(); });
        }
        st->control.run();

        if (st->forced.load())
        {
            for (auto &t : pool)
                t.detach();
            log_info("Shutting down with handlers still running");
            return drain_result::forced;
        }
        for (auto &t : pool)
            t.join();
        log_info("Shutting down");
        return drain_result::drained;
    }

    void worker_server::shutdown()
    {
        net::post(state_->control, [raw = state_.get()]
                  { raw->begin_drain(); });
    }
}
