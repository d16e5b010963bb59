#include "test_support.hpp"
#include "worker_server.hpp"

#include <gtest/gtest.h>

#include <boost/asio/connect.hpp>

#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

namespace http = boost::beast::http;
namespace net = boost::asio;
using namespace std::chrono;
using tcp = net::ip::tcp;

namespace
{
    // Uses up every free descriptor under a lowered soft limit until
    // destroyed, so accept() fails with EMFILE.
    class descriptor_exhaustion
    {
    public:
        descriptor_exhaustion()
        {
            ::getrlimit(RLIMIT_NOFILE, &saved_);
            int lowest = ::open("/dev/null", O_RDONLY);
            ::close(lowest);
            rlimit lowered = saved_;
            lowered.rlim_cur = static_cast<rlim_t>(lowest + 32);
            ::setrlimit(RLIMIT_NOFILE, &lowered);
            for (;;)
            {
                int fd = ::open("/dev/null", O_RDONLY);
                if (fd < 0)
                    break;
                held_.push_back(fd);
            }
        }

        ~descriptor_exhaustion()
        {
            for (int fd : held_)
                ::close(fd);
            ::setrlimit(RLIMIT_NOFILE, &saved_);
        }

    private:
        rlimit saved_{};
        std::vector<int> held_;
    };

    std::size_t count_of(const std::string &text, const std::string &needle)
    {
        std::size_t n = 0;
        for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1))
            ++n;
        return n;
    }
}

class WorkerServerTest : public ::testing::Test
{
protected:
    skill::worker_settings settings(int threads = 2) const
    {
        skill::worker_settings s;
        s.host = "127.0.0.1";
        s.port = 0;
        s.threads = threads;
        s.timeout = seconds(5);
        s.graceful_timeout = seconds(2);
        s.keep_alive = seconds(2);
        return s;
    }
};

TEST_F(WorkerServerTest, KeepsConnectionsAliveBetweenRequests)
{
    std::atomic<int> handled{0};
    skill::worker_server server(settings(), [&](const skill::http_request &req)
                                {
                                    ++handled;
                                    return skill::make_response(req, http::status::ok, "text/plain", std::string(req.target())); });
    std::thread runner([&]
                       { server.run(); });

    {
        net::io_context ioc;
        tcp::socket sock{ioc};
        sock.connect({net::ip::make_address("127.0.0.1"), server.local_port()});
        boost::beast::flat_buffer buffer;
        for (const char *target : {"/one", "/two"})
        {
            http::request<http::string_body> req{http::verb::get, target, 11};
            req.set(http::field::host, "127.0.0.1");
            http::write(sock, req);
            http::response<http::string_body> res;
            http::read(sock, buffer, res);
            EXPECT_EQ(res.body(), target);
            EXPECT_TRUE(res.keep_alive());
        }
    }

    server.shutdown();
    runner.join();
    EXPECT_EQ(handled.load(), 2);
}

TEST_F(WorkerServerTest, ServesUpToThreadsConcurrently)
{
    skill::worker_server server(settings(2), [](const skill::http_request &req)
                                {
                                    std::this_thread::sleep_for(milliseconds(300));
                                    return skill::make_response(req, http::status::ok, "text/plain", "done"); });
    std::thread runner([&]
                       { server.run(); });

    auto started = steady_clock::now();
    auto a = std::async(std::launch::async, [&]
                        { return skill_test::fetch(server.local_port(), http::verb::get, "/a"); });
    auto b = std::async(std::launch::async, [&]
                        { return skill_test::fetch(server.local_port(), http::verb::get, "/b"); });
    EXPECT_EQ(a.get().body(), "done");
    EXPECT_EQ(b.get().body(), "done");
    EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - started).count(), 550);

    server.shutdown();
    runner.join();
}

TEST_F(WorkerServerTest, ShutdownLetsInFlightRequestFinish)
{
    std::promise<void> entered;
    skill::worker_server server(settings(), [&](const skill::http_request &req)
                                {
                                    entered.set_value();
                                    std::this_thread::sleep_for(milliseconds(300));
                                    return skill::make_response(req, http::status::ok, "text/plain", "finished"); });
    std::thread runner([&]
                       { server.run(); });

    auto pending = std::async(std::launch::async, [&]
                              { return skill_test::fetch(server.local_port(), http::verb::get, "/slow"); });
    entered.get_future().wait();
    server.shutdown();

    auto res = pending.get();
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "finished");
    EXPECT_FALSE(res.keep_alive());
    runner.join();
    EXPECT_TRUE(server.draining());
}

TEST_F(WorkerServerTest, ShutdownClosesIdleConnections)
{
    skill::worker_server server(settings(), [](const skill::http_request &req)
                                { return skill::make_response(req, http::status::ok, "text/plain", "ok"); });
    std::thread runner([&]
                       { server.run(); });

    net::io_context ioc;
    tcp::socket idle{ioc};
    idle.connect({net::ip::make_address("127.0.0.1"), server.local_port()});

    auto started = steady_clock::now();
    server.shutdown();
    runner.join();
    // Well inside the 2 s graceful window: the idle connection did not hold it open.
    EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - started).count(), 1500);
}

TEST_F(WorkerServerTest, HandlerOverTimeoutClosesWithoutResponse)
{
    auto s = settings();
    s.timeout = seconds(1);
    std::atomic<bool> returned{false};
    skill::worker_server server(s, [&](const skill::http_request &req)
                                {
                                    std::this_thread::sleep_for(milliseconds(2500));
                                    returned = true;
                                    return skill::make_response(req, http::status::ok, "text/plain", "late"); });
    std::thread runner([&]
                       { server.run(); });

    // The connection drops when the timeout fires, not when the handler returns.
    auto started = steady_clock::now();
    EXPECT_ANY_THROW(skill_test::fetch(server.local_port(), http::verb::get, "/slow"));
    auto waited = duration_cast<milliseconds>(steady_clock::now() - started).count();
    EXPECT_GE(waited, 900);
    EXPECT_LT(waited, 2000);
    EXPECT_FALSE(returned.load());

    server.shutdown();
    runner.join();
    EXPECT_TRUE(returned.load());
}

TEST_F(WorkerServerTest, GracefulTimeoutForcesShutdown)
{
    auto s = settings();
    s.timeout = seconds(10);
    s.graceful_timeout = seconds(1);

    // The handler outlives run(); it only touches state it co-owns.
    auto entered = std::make_shared<std::promise<void>>();
    auto server = std::make_unique<skill::worker_server>(s, [entered](const skill::http_request &req)
                                                         {
                                                             entered->set_value();
                                                             std::this_thread::sleep_for(milliseconds(3000));
                                                             return skill::make_response(req, http::status::ok, "text/plain", "too late"); });
    unsigned short port = server->local_port();
    auto result = std::async(std::launch::async, [&]
                             { return server->run(); });

    std::thread client([port]
                       {
                           try
                           {
                               skill_test::fetch(port, http::verb::get, "/stuck");
                           }
                           catch (const std::exception &)
                           {
                               // Dropped by the forced shutdown.
                           } });
    entered->get_future().wait();

    auto started = steady_clock::now();
    server->shutdown();
    ASSERT_EQ(result.wait_for(milliseconds(2500)), std::future_status::ready);
    EXPECT_EQ(result.get(), skill::worker_server::drain_result::forced);
    EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - started).count(), 2000);
    EXPECT_TRUE(server->draining());
    server.reset();
    client.join();
}

TEST_F(WorkerServerTest, DrainWithinWindowReportsDrained)
{
    skill::worker_server server(settings(), [](const skill::http_request &req)
                                { return skill::make_response(req, http::status::ok, "text/plain", "ok"); });
    auto result = std::async(std::launch::async, [&]
                             { return server.run(); });
    EXPECT_EQ(skill_test::fetch(server.local_port(), http::verb::get, "/").body(), "ok");
    server.shutdown();
    EXPECT_EQ(result.get(), skill::worker_server::drain_result::drained);
}

TEST_F(WorkerServerTest, AcceptFailureBacksOffAndRecovers)
{
    skill::worker_server server(settings(1), [](const skill::http_request &req)
                                { return skill::make_response(req, http::status::ok, "text/plain", "recovered"); });
    std::thread runner([&]
                       { server.run(); });

    net::io_context ioc;
    tcp::socket sock{ioc};
    sock.open(tcp::v4());
    testing::internal::CaptureStderr();
    {
        descriptor_exhaustion exhausted;
        // Completes in the kernel; the server cannot accept it yet.
        sock.connect({net::ip::make_address("127.0.0.1"), server.local_port()});
        std::this_thread::sleep_for(milliseconds(350));
    }

    http::request<http::string_body> req{http::verb::get, "/", 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::connection, "close");
    http::write(sock, req);
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(sock, buffer, res);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(res.body(), "recovered");
    auto failures = count_of(err, "accept failed");
    EXPECT_GE(failures, 1u);
    EXPECT_LE(failures, 6u);

    server.shutdown();
    runner.join();
}
