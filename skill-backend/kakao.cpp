#include "kakao.hpp"
#include "util.hpp"

namespace skill
{
    namespace
    {
        const nlohmann::json &member(const nlohmann::json &j, const char *key)
        {
            static const nlohmann::json null_value;
            if (!j.is_object())
                return null_value;
            auto it = j.find(key);
            return it == j.end() ? null_value : *it;
        }
    }

    utterance extract_utterance(const nlohmann::json &payload)
    {
        utterance u;
        u.raw_usrtext = member(member(member(payload, "action"), "params"), "usrtext");
        u.raw_utterance = member(member(payload, "userRequest"), "utterance");

        bool usrtext_set = u.raw_usrtext.is_string() && !u.raw_usrtext.get<std::string>().empty();
        if (usrtext_set)
            u.text = trim(u.raw_usrtext.get<std::string>());
        else if (u.raw_utterance.is_string())
            u.text = trim(u.raw_utterance.get<std::string>());
        u.source = usrtext_set ? "action.params.usrtext" : "userRequest.utterance";
        return u;
    }

    nlohmann::json simple_text(const std::string &text)
    {
        nlohmann::json output;
        output["simpleText"]["text"] = text;
        nlohmann::json body;
        body["version"] = "2.0";
        body["template"]["outputs"] = nlohmann::json::array();
        body["template"]["outputs"].push_back(std::move(output));
        return body;
    }
}
