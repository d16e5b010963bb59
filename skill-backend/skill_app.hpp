#pragma once

#include "chatling_client.hpp"
#include "http_server.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>

namespace skill
{
    // Kakao skill webhook relaying utterances to Chatling.
    //   GET  /, /healthz  liveness
    //   GET  /diag        configuration and last upstream outcome
    //   POST /webhook     skill request -> simpleText response
    class skill_app
    {
    public:
        explicit skill_app(std::shared_ptr<chatling_client> chatling);

        http_response operator()(const http_request &req);

        nlohmann::json diagnostics() const;

    private:
        http_response route(const http_request &req);
        http_response healthz(const http_request &req) const;
        http_response diag(const http_request &req) const;
        http_response webhook(const http_request &req);

        std::shared_ptr<chatling_client> chatling_;
        mutable std::mutex mtx_;
        nlohmann::json last_request_;
    };

    // Query parameter value from a request target, empty when absent.
    std::string query_param(const std::string &target, const std::string &name);
}
