#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace skill
{
    constexpr const char *prompt_for_question = "질문을 입력해 주세요 🙂";
    constexpr const char *busy_fallback = "지금은 답변 서버가 혼잡해요. 잠시 뒤에 다시 시도해 주세요.";

    struct utterance
    {
        std::string text; // trimmed
        std::string source;
        nlohmann::json raw_usrtext;   // null when absent
        nlohmann::json raw_utterance; // null when absent
    };

    // action.params.usrtext wins when it is a non-empty string, otherwise
    // userRequest.utterance. Non-object payloads read as empty.
    utterance extract_utterance(const nlohmann::json &payload);

    // {"version":"2.0","template":{"outputs":[{"simpleText":{"text":...}}]}}
    nlohmann::json simple_text(const std::string &text);
}
