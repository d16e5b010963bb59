#include "chatling_client.hpp"
#include "launch_config.hpp"
#include "log.hpp"
#include "util.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace skill
{
    namespace
    {
        constexpr std::size_t snippet_limit = 200;

        // First snippet_limit characters, counted as UTF-8 code points.
        std::string snippet(const std::string &body)
        {
            std::size_t chars = 0;
            std::size_t i = 0;
            for (; i < body.size(); ++i)
            {
                if ((static_cast<unsigned char>(body[i]) & 0xC0) != 0x80 && chars++ == snippet_limit)
                    break;
            }
            return body.substr(0, i);
        }
    }

    chatling_settings chatling_settings::from_environment()
    {
        chatling_settings s;
        s.api_key = trim(env_or("CHATLING_API_KEY", ""));
        s.url = trim(env_or("CHATLING_URL", default_chatling_url));

        std::string model = trim(env_or("CHATLING_MODEL_ID", ""));
        if (!model.empty())
        {
            try
            {
                std::size_t used = 0;
                long long id = std::stoll(model, &used);
                if (used == model.size())
                    s.model_id = id;
                else
                    log_warning("[chatling] CHATLING_MODEL_ID is not an integer: '" + model + "'");
            }
            catch (const std::exception &)
            {
                log_warning("[chatling] CHATLING_MODEL_ID is not an integer: '" + model + "'");
            }
        }

        std::string timeout = trim(env_or("CHATLING_TIMEOUT", ""));
        if (!timeout.empty())
        {
            try
            {
                double t = std::stod(timeout);
                if (t > 0 && std::isfinite(t))
                    s.timeout_seconds = t;
                else
                    log_warning("[chatling] CHATLING_TIMEOUT must be positive, using " + std::to_string(s.timeout_seconds));
            }
            catch (const std::exception &)
            {
                log_warning("[chatling] invalid CHATLING_TIMEOUT '" + timeout + "', using default");
            }
        }
        return s;
    }

    chatling_client::chatling_client(chatling_settings settings, upstream_transport transport)
        : settings_(std::move(settings)), transport_(std::move(transport))
    {
    }

    std::optional<std::string> chatling_client::ask(const std::string &message)
    {
        if (settings_.api_key.empty())
        {
            record({{"ok", false}, {"status", 0}, {"error", "no_api_key"}});
            return std::nullopt;
        }
        if (!settings_.model_id || *settings_.model_id == 0)
        {
            record({{"ok", false}, {"status", 0}, {"error", "no_model_id"}});
            return std::nullopt;
        }

        upstream_request req;
        req.url = settings_.url;
        req.headers = {{"Authorization", "Bearer " + settings_.api_key},
                       {"Content-Type", "application/json"}};
        req.body = nlohmann::json{{chatling_body_key, message}, {"ai_model_id", *settings_.model_id}}.dump();
        req.budget = std::chrono::milliseconds(static_cast<long long>(settings_.timeout_seconds * 1000.0));

        upstream_reply reply;
        try
        {
            reply = transport_(req);
        }
        catch (const upstream_timeout &)
        {
            record({{"ok", false}, {"status", 0}, {"error", "timeout"}});
            return std::nullopt;
        }
        catch (const std::exception &e)
        {
            record({{"ok", false}, {"status", 0}, {"error", e.what()}});
            return std::nullopt;
        }

        bool ok = reply.status < 400;
        std::string text_snippet = snippet(reply.body);
        record({{"ok", ok}, {"status", reply.status}, {"url", settings_.url}, {"body_snippet", text_snippet}});
        if (!ok)
        {
            log_warning("Chatling non-2xx: " + std::to_string(reply.status) + " " + text_snippet);
            return std::nullopt;
        }
        return extract_reply(reply.body);
    }

    nlohmann::json chatling_client::last_call() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return last_;
    }

    void chatling_client::record(nlohmann::json outcome)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        last_ = std::move(outcome);
    }

    std::string extract_reply(const std::string &body)
    {
        std::string text_snippet = snippet(body);
        nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded())
            return text_snippet;

        // Usual shape: {"status":"success","data":{"response":"..."}}
        if (j.is_object())
        {
            const nlohmann::json &data = j.contains("data") ? j.at("data") : j;
            if (data.is_object())
            {
                for (const char *key : {"response", "answer", "text", "message"})
                {
                    auto it = data.find(key);
                    if (it != data.end() && it->is_string())
                        return trim(it->get<std::string>());
                }
            }
        }
        return text_snippet;
    }
}
