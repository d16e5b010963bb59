#include "http_server.hpp"
#include "log.hpp"
#include "static_files.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

namespace http = boost::beast::http;

namespace
{
    // Runs a basic_server on a background thread for the test's lifetime.
    class running_server
    {
    public:
        running_server(skill::any_handler handler, skill::connection_model model)
            : server_("127.0.0.1", 0, std::move(handler), model), thread_([this]
                                                                         { server_.run(); })
        {
        }

        ~running_server()
        {
            server_.stop();
            thread_.join();
        }

        unsigned short port() const { return server_.local_port(); }

    private:
        skill::basic_server server_;
        std::thread thread_;
    };
}

TEST(BasicServerTest, SequentialServesFilesAndMisses)
{
    skill_test::temp_dir dir("skill-basic");
    dir.write("page.txt", "static body");
    skill::static_files files(dir.path());
    running_server server([files](const skill::http_request &req)
                          { return files(req); },
                          skill::connection_model::sequential);

    auto hit = skill_test::fetch(server.port(), http::verb::get, "/page.txt");
    EXPECT_EQ(hit.result(), http::status::ok);
    EXPECT_EQ(hit.body(), "static body");

    auto miss = skill_test::fetch(server.port(), http::verb::get, "/nope.txt");
    EXPECT_EQ(miss.result(), http::status::not_found);
}

TEST(BasicServerTest, SequentialServesOneRequestAtATime)
{
    using namespace std::chrono;
    running_server server([](const skill::http_request &req)
                          {
                              std::this_thread::sleep_for(milliseconds(300));
                              return skill::make_response(req, http::status::ok, "text/plain", "slow"); },
                          skill::connection_model::sequential);

    auto started = steady_clock::now();
    auto first = std::async(std::launch::async, [&]
                            { return skill_test::fetch(server.port(), http::verb::get, "/a"); });
    auto second = std::async(std::launch::async, [&]
                             { return skill_test::fetch(server.port(), http::verb::get, "/b"); });
    EXPECT_EQ(first.get().body(), "slow");
    EXPECT_EQ(second.get().body(), "slow");
    EXPECT_GE(duration_cast<milliseconds>(steady_clock::now() - started).count(), 550);
}

TEST(BasicServerTest, ThreadPerConnectionOverlapsRequests)
{
    using namespace std::chrono;
    running_server server([](const skill::http_request &req)
                          {
                              std::this_thread::sleep_for(milliseconds(300));
                              return skill::make_response(req, http::status::ok, "text/plain", "slow"); },
                          skill::connection_model::thread_per_connection);

    auto started = steady_clock::now();
    auto first = std::async(std::launch::async, [&]
                            { return skill_test::fetch(server.port(), http::verb::get, "/a"); });
    auto second = std::async(std::launch::async, [&]
                             { return skill_test::fetch(server.port(), http::verb::get, "/b"); });
    EXPECT_EQ(first.get().result(), http::status::ok);
    EXPECT_EQ(second.get().result(), http::status::ok);
    EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - started).count(), 550);
}

TEST(BasicServerTest, HandlerExceptionBecomes500)
{
    running_server server([](const skill::http_request &) -> skill::http_response
                          { throw std::runtime_error("boom"); },
                          skill::connection_model::sequential);
    auto res = skill_test::fetch(server.port(), http::verb::get, "/");
    EXPECT_EQ(res.result(), http::status::internal_server_error);
}

TEST(AccessLogTest, CombinedFormat)
{
    skill::access_entry e;
    e.remote = "10.0.0.1";
    e.method = "POST";
    e.target = "/webhook";
    e.version = 11;
    e.status = 200;
    e.bytes = 87;
    e.user_agent = "kakao";
    std::string line = skill::format_access_line(e);
    EXPECT_EQ(line.rfind("10.0.0.1 - - [", 0), 0u);
    EXPECT_NE(line.find("+0000] \"POST /webhook HTTP/1.1\" 200 87 \"-\" \"kakao\""), std::string::npos);
}
