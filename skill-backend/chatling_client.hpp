#pragma once

#include "upstream.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <optional>
#include <string>

namespace skill
{
    constexpr const char *default_chatling_url = "https://api.chatling.ai/v2/chatbots/9226872959/ai/kb/chat";

    // Body key of the v2 chat API; fixed, not configurable.
    constexpr const char *chatling_body_key = "message";

    struct chatling_settings
    {
        std::string api_key;
        std::string url = default_chatling_url;
        std::optional<long long> model_id;
        double timeout_seconds = 4.2;

        // CHATLING_API_KEY, CHATLING_URL, CHATLING_MODEL_ID, CHATLING_TIMEOUT
        static chatling_settings from_environment();
    };

    class chatling_client
    {
    public:
        explicit chatling_client(chatling_settings settings, upstream_transport transport = post_upstream);

        // Reply text, or nothing when the call could not produce one.
        // Never throws for upstream failures; they land in last_call().
        std::optional<std::string> ask(const std::string &message);

        // Outcome of the most recent ask(); null before the first call.
        nlohmann::json last_call() const;

        const chatling_settings &settings() const { return settings_; }

    private:
        void record(nlohmann::json outcome);

        chatling_settings settings_;
        upstream_transport transport_;
        mutable std::mutex mtx_;
        nlohmann::json last_;
    };

    // Picks the reply out of a 2xx body; see chatling_client::ask.
    std::string extract_reply(const std::string &body);
}
