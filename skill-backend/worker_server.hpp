#pragma once

#include "http_server.hpp"
#include "launch_config.hpp"

#include <memory>

namespace skill
{
    // Threaded server for the production entry point: settings.threads
    // requests in flight at most, each handled with blocking code on an I/O
    // thread. Request reads and response writes are bounded by
    // settings.timeout, idle connections by settings.keep_alive. A handler
    // still running after settings.timeout loses its connection. SIGINT and
    // SIGTERM drain in-flight requests for up to settings.graceful_timeout.
    //
    // Accepting, signals and every timer run on a separate control thread
    // (the caller of run()), so deadlines fire even when all I/O threads are
    // stuck in handlers.
    class worker_server
    {
    public:
        enum class drain_result
        {
            drained, // every connection finished inside the window
            forced   // the window closed with handlers still running
        };

        worker_server(const worker_settings &settings, request_handler handler);
        ~worker_server();

        worker_server(const worker_server &) = delete;
        worker_server &operator=(const worker_server &) = delete;

        unsigned short local_port() const;

        // Blocks until the drain completes. On drain_result::forced the busy
        // I/O threads are left running detached; they keep the server state
        // alive until their handlers return.
        drain_result run();

        // Begins the drain. Thread-safe.
        void shutdown();

        bool draining() const;

    private:
        struct state;
        class session;

        std::shared_ptr<state> state_;
    };
}
