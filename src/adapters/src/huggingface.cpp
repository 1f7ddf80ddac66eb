#include "huggingface.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace tad::adapters
{
    using json = nlohmann::json;

    namespace
    {
        constexpr double FINANCIAL_WEIGHT = 0.6;
        constexpr double SOCIAL_WEIGHT = 0.4;
        constexpr double LABEL_THRESHOLD = 0.2;

        constexpr std::array<std::string_view, 13> CONTROVERSY_KEYWORDS{
            "scam", "fraud", "rug", "dump", "crash", "moon", "lambos",
            "ponzi", "shitcoin", "pump", "fud", "manipulation", "insider"
        };

        // Models accept at most 512 tokens; bytes are a safe upper bound
        constexpr std::size_t MAX_INPUT_BYTES = 512;

        double _polarity(const std::string & label)
        {
            if(label == "positive") return 1.0;
            if(label == "negative") return -1.0;
            return 0.0;
        }

        double _keywordScore(const std::string & text)
        {
            const std::string lowered = utils::toLower(text);
            const auto matches = std::count_if(CONTROVERSY_KEYWORDS.begin(), CONTROVERSY_KEYWORDS.end(),
                [&lowered](std::string_view keyword) { return lowered.find(keyword) != std::string::npos; });
            return static_cast<double>(matches) / static_cast<double>(CONTROVERSY_KEYWORDS.size());
        }
    }

    std::string normalizeSentimentLabel(const std::string & label)
    {
        const std::string lowered = utils::toLower(label);

        // cardiffnlp checkpoints without label mapping report LABEL_0..2
        if(lowered == "label_0") return "negative";
        if(lowered == "label_2") return "positive";

        if(lowered.find("pos") != std::string::npos) return "positive";
        if(lowered.find("neg") != std::string::npos) return "negative";
        return "neutral";
    }

    std::optional<ModelSentiment> parseInferenceOutput(const json & output)
    {
        if(!output.is_array() || output.empty())
        {
            return std::nullopt;
        }

        const json & candidates = output.front().is_array() ? output.front() : output;

        std::optional<ModelSentiment> best;
        for(const json & candidate : candidates)
        {
            if(!candidate.is_object() || !candidate.contains("label") || !candidate.contains("score"))
            {
                continue;
            }
            if(!candidate["label"].is_string() || !candidate["score"].is_number())
            {
                continue;
            }

            const double score = candidate["score"].get<double>();
            if(!best || score > best->score)
            {
                best = ModelSentiment{
                    .label = normalizeSentimentLabel(candidate["label"].get<std::string>()),
                    .score = score
                };
            }
        }
        return best;
    }

    SentimentAnalysis combineSentiment(const ModelSentiment & financial, const ModelSentiment & social, const std::string & text)
    {
        SentimentAnalysis analysis{.financial = financial, .social = social};

        const double combined_value =
            _polarity(financial.label) * financial.score * FINANCIAL_WEIGHT +
            _polarity(social.label) * social.score * SOCIAL_WEIGHT;

        if(combined_value > LABEL_THRESHOLD)        analysis.combined_label = "positive";
        else if(combined_value < -LABEL_THRESHOLD)  analysis.combined_label = "negative";
        else                                        analysis.combined_label = "neutral";

        const double agreement = financial.label == social.label ? 1.0 : 0.5;
        analysis.confidence = agreement * (financial.score + social.score) / 2.0;
        analysis.combined_score = (combined_value + 1.0) / 2.0;

        const double extremity = std::abs(analysis.combined_score - 0.5) * 2.0;
        const double disagreement = 1.0 - analysis.confidence;

        analysis.controversy = std::clamp(extremity * 0.4 + disagreement * 0.3 + _keywordScore(text) * 0.3, 0.0, 1.0);
        return analysis;
    }

    HuggingFaceSentimentScorer::HuggingFaceSentimentScorer(HuggingFaceConfig cfg, JsonPost post)
        : _cfg(std::move(cfg)),
          _post(std::move(post))
    {
    }

    pipeline::Outcome<ModelSentiment> HuggingFaceSentimentScorer::_query(const std::string & model, const std::string & text) const
    {
        const json body{{"inputs", utils::truncateUtf8(text, MAX_INPUT_BYTES)}};
        const auto response = _post(std::format("{}/{}", _cfg.base_url, model), body, {{"Authorization", "Bearer " + _cfg.api_key}});
        if(!response)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = std::format("{} inference failed ({}): {}", model, response.error().kind, response.error().message)
            });
        }

        const json parsed = json::parse(response->body, nullptr, false);
        if(parsed.is_discarded())
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::INVALID_RESPONSE,
                .message = std::format("{} returned non-JSON output", model)
            });
        }

        auto verdict = parseInferenceOutput(parsed);
        if(!verdict)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::INVALID_RESPONSE,
                .message = std::format("{} returned no label scores", model)
            });
        }
        return *verdict;
    }

    pipeline::Outcome<pipeline::SentimentScore> HuggingFaceSentimentScorer::scoreSentiment(const std::string & text)
    {
        if(_cfg.api_key.empty() || !_post)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = "Hugging Face API key not configured"
            });
        }

        auto financial = _query(_cfg.financial_model, text);
        auto social = _query(_cfg.social_model, text);

        if(!financial && !social)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = std::format("both sentiment models failed: {}; {}", financial.error().message, social.error().message)
            });
        }

        // A single failing model counts as a neutral, half-confident vote
        if(!financial)
        {
            spdlog::warn("Financial sentiment unavailable, using neutral: {}", financial.error().message);
        }
        if(!social)
        {
            spdlog::warn("Social sentiment unavailable, using neutral: {}", social.error().message);
        }

        const SentimentAnalysis analysis = combineSentiment(financial.value_or(ModelSentiment{}), social.value_or(ModelSentiment{}), text);
        spdlog::debug("Sentiment {} (score {:.3f}, confidence {:.3f}, controversy {:.3f})",
            analysis.combined_label, analysis.combined_score, analysis.confidence, analysis.controversy);

        return pipeline::SentimentScore{
            .label = analysis.combined_label,
            .controversy = analysis.controversy
        };
    }
}
