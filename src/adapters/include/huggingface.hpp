#pragma once

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "collaborators.hpp"
#include "transport.hpp"

namespace tad::adapters
{
    struct HuggingFaceConfig
    {
        std::string api_key;
        std::string financial_model = "ProsusAI/finbert";
        std::string social_model = "cardiffnlp/twitter-roberta-base-sentiment-latest";
        std::string base_url = "https://api-inference.huggingface.co/models";
    };

    /**
     * @brief One classifier's verdict: label is "positive", "negative" or "neutral".
     */
    struct ModelSentiment
    {
        std::string label = "neutral";
        double score = 0.5;
    };

    struct SentimentAnalysis
    {
        ModelSentiment financial;
        ModelSentiment social;

        std::string combined_label;
        double combined_score = 0.5;
        double confidence = 0.0;
        double controversy = 0.0;
    };

    /**
     * @brief Maps model-specific labels ("POSITIVE", "LABEL_2", "neg"...) to the three canonical ones.
     */
    std::string normalizeSentimentLabel(const std::string & label);

    /**
     * @brief Picks the highest-scoring label from an inference response.
     *
     * Accepts both [[{label, score}, ...]] and [{label, score}, ...].
     */
    std::optional<ModelSentiment> parseInferenceOutput(const nlohmann::json & output);

    /**
     * @brief Merges two model verdicts and derives a controversy estimate in [0, 1].
     *
     * The financial model weighs 0.6 and the social model 0.4. Controversy mixes sentiment extremity,
     * disagreement between the models and a share of known loaded keywords in `text`.
     */
    SentimentAnalysis combineSentiment(const ModelSentiment & financial, const ModelSentiment & social, const std::string & text);

    class HuggingFaceSentimentScorer final : public pipeline::ISentimentScorer
    {
    public:
        HuggingFaceSentimentScorer(HuggingFaceConfig cfg, JsonPost post);

        pipeline::Outcome<pipeline::SentimentScore> scoreSentiment(const std::string & text) override;

    private:
        pipeline::Outcome<ModelSentiment> _query(const std::string & model, const std::string & text) const;

        HuggingFaceConfig _cfg;
        JsonPost _post;
    };
}
