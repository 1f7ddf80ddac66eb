#pragma once

#include <string>

#include "collaborators.hpp"
#include "transport.hpp"

namespace tad::adapters
{
    struct OpenAiConfig
    {
        std::string api_key;
        std::string model = "gpt-4o-mini";
        std::string base_url = "https://api.openai.com/v1";
    };

    /**
     * @brief Minimal chat-completions client returning the first choice's message content.
     */
    class OpenAiClient
    {
    public:
        OpenAiClient(OpenAiConfig cfg, JsonPost post);

        bool configured() const noexcept;

        pipeline::Outcome<std::string> chat(const std::string & system_prompt, const std::string & user_prompt, double temperature) const;

    private:
        OpenAiConfig _cfg;
        JsonPost _post;
    };

    /**
     * @brief Asks the model how likely the tweet is to be deleted or moderated.
     *
     * The model answers {"score": 0..1, "analysis": "..."}; the score is clamped to [0, 1].
     */
    class OpenAiRemovalRiskScorer final : public pipeline::IRemovalRiskScorer
    {
    public:
        explicit OpenAiRemovalRiskScorer(const OpenAiClient & client);

        pipeline::Outcome<pipeline::RemovalRisk> scoreRemovalRisk(const std::string & text) override;

    private:
        const OpenAiClient & _client;
    };

    /**
     * @brief Asks the model for the one supported token the tweet is about, or UNKNOWN.
     *
     * Confidence comes from the keyword heuristic, not from the model.
     */
    class OpenAiEcosystemClassifier final : public pipeline::IEcosystemClassifier
    {
    public:
        explicit OpenAiEcosystemClassifier(const OpenAiClient & client);

        pipeline::Outcome<pipeline::EcosystemLabel> classify(const std::string & text) override;

    private:
        const OpenAiClient & _client;
    };

    std::string classifierSystemPrompt();
}
