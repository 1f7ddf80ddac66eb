#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tad::pipeline
{
    inline constexpr double PRIMARY_WEIGHT = 0.6;
    inline constexpr double SECONDARY_WEIGHT = 0.4;

    inline constexpr const char* UNKNOWN_TOKEN = "UNKNOWN";

    /**
     * @brief Weighted blend of removal risk (primary) and sentiment controversy (secondary).
     *
     * A missing signal is replaced by the one that succeeded; neither yields 0.
     * The result is clamped to [0, 1].
     */
    double combinedScore(std::optional<double> primary, std::optional<double> secondary);

    /**
     * @brief Heuristic confidence that `text` is about `symbol`.
     *
     * +0.5 for a "$SYM" cashtag (else +0.3 for the bare symbol), +0.3 for the chain name,
     * +0.2 for a known name variation; capped at 1.0. Matching is case-insensitive.
     */
    double ecosystemConfidence(std::string_view text, std::string_view symbol);

    /**
     * @brief Normalizes a classifier answer to a supported upper-case symbol or "UNKNOWN".
     */
    std::string normalizeToken(std::string_view answer);

    /**
     * @brief Keeps the digits of an engagement count such as "1,204". Nothing left yields 0.
     */
    std::uint64_t normalizeCount(std::string_view value);
}
