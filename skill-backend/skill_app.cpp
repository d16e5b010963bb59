#include "skill_app.hpp"
#include "kakao.hpp"
#include "log.hpp"
#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace skill
{
    namespace
    {
        const char *json_utf8 = "application/json; charset=utf-8";

        std::string dump(const nlohmann::json &j, int indent = -1)
        {
            return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        std::string path_of(const std::string &target)
        {
            return target.substr(0, target.find('?'));
        }
    }

    std::string query_param(const std::string &target, const std::string &name)
    {
        auto q = target.find('?');
        if (q == std::string::npos)
            return "";
        std::stringstream ss(target.substr(q + 1));
        std::string pair;
        while (std::getline(ss, pair, '&'))
        {
            auto eq = pair.find('=');
            std::string key = percent_decode(pair.substr(0, eq));
            if (key != name)
                continue;
            if (eq == std::string::npos)
                return "";
            std::string value = pair.substr(eq + 1);
            std::replace(value.begin(), value.end(), '+', ' ');
            return percent_decode(value);
        }
        return "";
    }

    skill_app::skill_app(std::shared_ptr<chatling_client> chatling)
        : chatling_(std::move(chatling))
    {
    }

    http_response skill_app::operator()(const http_request &req)
    {
        http_response res = route(req);
        if (req.method() == http::verb::head)
        {
            auto size = res.body().size();
            res.body().clear();
            res.content_length(size);
        }
        return res;
    }

    http_response skill_app::route(const http_request &req)
    {
        std::string path = path_of(std::string(req.target()));
        bool get = req.method() == http::verb::get || req.method() == http::verb::head;

        if (path == "/" || path == "/healthz")
            return get ? healthz(req) : make_response(req, http::status::method_not_allowed, "text/plain", "Method Not Allowed");
        if (path == "/diag")
            return get ? diag(req) : make_response(req, http::status::method_not_allowed, "text/plain", "Method Not Allowed");
        if (path == "/webhook")
            return req.method() == http::verb::post ? webhook(req)
                                                    : make_response(req, http::status::method_not_allowed, "text/plain", "Method Not Allowed");
        return make_response(req, http::status::not_found, "text/plain", "Not Found");
    }

    nlohmann::json skill_app::diagnostics() const
    {
        const chatling_settings &s = chatling_->settings();
        nlohmann::json last_request;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            last_request = last_request_;
        }
        return {{"api_key_set", !s.api_key.empty()},
                {"chatling_url", s.url},
                {"model_id", s.model_id ? nlohmann::json(*s.model_id) : nlohmann::json(nullptr)},
                {"body_key", chatling_body_key},
                {"sync_budget_s", s.timeout_seconds},
                {"last_chatling", chatling_->last_call()},
                {"last_request", last_request}};
    }

    http_response skill_app::healthz(const http_request &req) const
    {
        return make_response(req, http::status::ok, "text/html; charset=utf-8", "ok");
    }

    http_response skill_app::diag(const http_request &req) const
    {
        nlohmann::json payload = diagnostics();
        bool pretty = !query_param(std::string(req.target()), "pretty").empty();
        return make_response(req, http::status::ok, "application/json",
                             dump(payload, pretty ? 2 : -1));
    }

    http_response skill_app::webhook(const http_request &req)
    {
        nlohmann::json data = nlohmann::json::parse(req.body(), nullptr, false);
        if (data.is_discarded() || !data.is_object())
            data = nlohmann::json::object();

        utterance u = extract_utterance(data);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            last_request_ = {{"utter", u.text},
                             {"source", u.source},
                             {"raw_usrtext", u.raw_usrtext},
                             {"raw_utterance", u.raw_utterance},
                             {"ts", iso_timestamp_utc(std::chrono::system_clock::now())}};
        }
        log_info("WEBHOOK utter='" + u.text + "'");

        if (u.text.empty())
            return make_response(req, http::status::ok, json_utf8, dump(simple_text(prompt_for_question)));

        std::optional<std::string> reply = chatling_->ask(u.text);
        if (reply && !reply->empty())
            return make_response(req, http::status::ok, json_utf8, dump(simple_text(*reply)));

        // Kakao drops replies after 5 s; answer with the fallback instead of an error.
        return make_response(req, http::status::ok, json_utf8, dump(simple_text(busy_fallback)));
    }
}
