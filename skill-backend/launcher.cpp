#include "launcher.hpp"
#include "app_registry.hpp"
#include "chatling_client.hpp"
#include "http_server.hpp"
#include "launch_config.hpp"
#include "log.hpp"
#include "skill_app.hpp"
#include "static_files.hpp"
#include "worker_server.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace skill
{
    int launch_worker_server(int argc, char **argv)
    {
        serve_options opts;
        request_handler handler;
        try
        {
            opts = parse_serve_options(std::vector<std::string>(argv + 1, argv + argc));
            set_log_level(opts.settings.level);
            handler = resolve_application(opts.app);
        }
        catch (const config_error &e)
        {
            log_error("Error: " + std::string(e.what()));
            return 1;
        }

        try
        {
            worker_server server(opts.settings, std::move(handler));
            if (server.run() == worker_server::drain_result::forced)
            {
                // Busy handlers cannot be interrupted; leave without unwinding them.
                log_critical("exiting with requests still in progress");
                std::cout.flush();
                std::cerr.flush();
                std::_Exit(1);
            }
        }
        catch (const std::exception &e)
        {
            log_error("Connection in use or bind failed: " + opts.settings.host + ":" +
                      std::to_string(opts.settings.port) + " (" + e.what() + ")");
            return 1;
        }
        return 0;
    }

    int launch_app()
    {
        unsigned short port = 0;
        try
        {
            port = port_from_environment(false);
        }
        catch (const config_error &e)
        {
            log_error(e.what());
            return 1;
        }

        auto app = std::make_shared<skill_app>(
            std::make_shared<chatling_client>(chatling_settings::from_environment()));
        try
        {
            basic_server server("0.0.0.0", port, [app](const http_request &req)
                                { return (*app)(req); },
                                connection_model::thread_per_connection);
            log_info("running on 0.0.0.0:" + std::to_string(server.local_port()));
            server.run();
        }
        catch (const std::exception &e)
        {
            log_error("HTTP server error: " + std::string(e.what()));
            return 1;
        }
        return 0;
    }

    int launch_static()
    {
        unsigned short port = 0;
        try
        {
            port = port_from_environment(false);
        }
        catch (const config_error &e)
        {
            log_error(e.what());
            return 1;
        }

        try
        {
            static_files files(std::filesystem::current_path());
            basic_server server("0.0.0.0", port, [files](const http_request &req)
                                { return files(req); },
                                connection_model::sequential);
            log_info("Serving HTTP on 0.0.0.0 port " + std::to_string(server.local_port()) +
                     " (http://0.0.0.0:" + std::to_string(server.local_port()) + "/) ...");
            server.run();
        }
        catch (const std::exception &e)
        {
            log_error("HTTP server error: " + std::string(e.what()));
            return 1;
        }
        return 0;
    }
}
