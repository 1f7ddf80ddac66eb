#include "openai.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "scoring.hpp"
#include "tokens.hpp"
#include "utils.hpp"

namespace tad::adapters
{
    using json = nlohmann::json;

    namespace
    {
        constexpr const char* REMOVAL_RISK_PROMPT =
            "You assess how likely a tweet is to be deleted by its author or removed by moderation. "
            "Consider controversy, misinformation, harassment, market manipulation, legal exposure and regret. "
            "Respond with ONLY a JSON object of the form {\"score\": <number between 0 and 1>, \"analysis\": \"<one sentence>\"}.";

        // Models sometimes wrap JSON answers in a markdown fence
        std::string _stripCodeFence(const std::string & answer)
        {
            std::string text = utils::trim(answer);
            if(!text.starts_with("```"))
            {
                return text;
            }

            const auto first_newline = text.find('\n');
            const auto closing = text.rfind("```");
            if(first_newline == std::string::npos || closing == std::string::npos || closing <= first_newline)
            {
                return text;
            }
            return utils::trim(std::string_view(text).substr(first_newline + 1, closing - first_newline - 1));
        }
    }

    std::string classifierSystemPrompt()
    {
        std::string symbols;
        for(const price::TokenInfo & token : price::supportedTokens())
        {
            symbols += symbols.empty() ? "" : ", ";
            symbols += token.symbol;
        }

        return std::format(
            "You are a cryptocurrency ecosystem classifier. Identify which cryptocurrency or blockchain a tweet primarily discusses.\n\n"
            "SUPPORTED TOKENS: {}\n\n"
            "RULES:\n"
            "1. Return ONLY the token symbol (e.g. \"BTC\", \"ETH\", \"SOL\")\n"
            "2. Choose the token that is MOST prominently discussed; on a tie choose the first one mentioned\n"
            "3. If no supported token is clearly mentioned, return \"UNKNOWN\"\n"
            "4. Consider $SYMBOL cashtags, token names, chain names and common variations (\"Ethereum\" is ETH)\n\n"
            "Respond with ONLY the token symbol or UNKNOWN. No explanation.",
            symbols);
    }

    OpenAiClient::OpenAiClient(OpenAiConfig cfg, JsonPost post)
        : _cfg(std::move(cfg)),
          _post(std::move(post))
    {
    }

    bool OpenAiClient::configured() const noexcept
    {
        return !_cfg.api_key.empty() && static_cast<bool>(_post);
    }

    pipeline::Outcome<std::string> OpenAiClient::chat(const std::string & system_prompt, const std::string & user_prompt, const double temperature) const
    {
        if(!configured())
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = "OpenAI API key not configured"
            });
        }

        const json body{
            {"model", _cfg.model},
            {"temperature", temperature},
            {"messages", json::array({
                json{{"role", "system"}, {"content", system_prompt}},
                json{{"role", "user"}, {"content", user_prompt}}
            })}
        };

        const auto response = _post(_cfg.base_url + "/chat/completions", body, {{"Authorization", "Bearer " + _cfg.api_key}});
        if(!response)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = std::format("OpenAI request failed ({}): {}", response.error().kind, response.error().message)
            });
        }

        const json parsed = json::parse(response->body, nullptr, false);
        if(parsed.is_discarded() || !parsed.contains("choices") || !parsed["choices"].is_array() || parsed["choices"].empty())
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::INVALID_RESPONSE,
                .message = "OpenAI response has no choices"
            });
        }

        const json & message = parsed["choices"][0].value("message", json::object());
        if(!message.contains("content") || !message["content"].is_string())
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::INVALID_RESPONSE,
                .message = "OpenAI response has no message content"
            });
        }
        return message["content"].get<std::string>();
    }

    OpenAiRemovalRiskScorer::OpenAiRemovalRiskScorer(const OpenAiClient & client)
        : _client(client)
    {
    }

    pipeline::Outcome<pipeline::RemovalRisk> OpenAiRemovalRiskScorer::scoreRemovalRisk(const std::string & text)
    {
        const auto answer = _client.chat(REMOVAL_RISK_PROMPT, std::format("Tweet:\n\n{}", text), 0.2);
        if(!answer)
        {
            return std::unexpected(answer.error());
        }

        const json parsed = json::parse(_stripCodeFence(*answer), nullptr, false);
        if(parsed.is_discarded() || !parsed.is_object() || !parsed.contains("score") || !parsed["score"].is_number())
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::INVALID_RESPONSE,
                .message = std::format("unexpected removal-risk answer: {}", *answer)
            });
        }

        return pipeline::RemovalRisk{
            .score = std::clamp(parsed["score"].get<double>(), 0.0, 1.0),
            .analysis = parsed.contains("analysis") && parsed["analysis"].is_string() ? parsed["analysis"].get<std::string>() : ""
        };
    }

    OpenAiEcosystemClassifier::OpenAiEcosystemClassifier(const OpenAiClient & client)
        : _client(client)
    {
    }

    pipeline::Outcome<pipeline::EcosystemLabel> OpenAiEcosystemClassifier::classify(const std::string & text)
    {
        if(utils::trim(text).empty())
        {
            return pipeline::EcosystemLabel{.token = pipeline::UNKNOWN_TOKEN, .confidence = 0.0, .chain = "Unknown"};
        }

        const auto answer = _client.chat(classifierSystemPrompt(), std::format("Classify this tweet:\n\n{}", text), 0.1);
        if(!answer)
        {
            return std::unexpected(answer.error());
        }

        const std::string token = pipeline::normalizeToken(*answer);
        if(token == pipeline::UNKNOWN_TOKEN && !utils::equalsIgnoreCase(utils::trim(*answer), pipeline::UNKNOWN_TOKEN))
        {
            spdlog::warn("Classifier returned unsupported token '{}', using UNKNOWN", utils::trim(*answer));
        }

        pipeline::EcosystemLabel label{.token = token, .confidence = 0.0, .chain = "Unknown"};
        if(const auto info = price::findToken(token))
        {
            label.chain = std::string(info->chain);
            label.confidence = pipeline::ecosystemConfidence(text, token);
        }
        return label;
    }
}
