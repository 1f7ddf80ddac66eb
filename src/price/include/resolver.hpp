#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "price_quote.hpp"
#include "price_source.hpp"
#include "retry.hpp"

namespace tad::price
{
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct ResolverOptions
    {
        std::chrono::seconds cache_ttl{60};
        std::chrono::milliseconds batch_delay{100};

        Clock clock = {};
        net::SleepFn sleep = net::sleepFor;
    };

    /**
     * @brief Answers "current USD price of X" from prioritized sources behind a TTL cache.
     *
     * Sources are tried in construction order; the first numeric price wins and replaces
     * the cached quote. Failed lookups are never cached.
     */
    class PriceResolver
    {
    public:
        explicit PriceResolver(std::vector<std::unique_ptr<IPriceSource>> sources, ResolverOptions options = {});

        PriceResolver(const PriceResolver &) = delete;
        PriceResolver & operator=(const PriceResolver &) = delete;

        /**
         * @brief Never throws. All sources failing yields price 0, source "none", success false.
         */
        PriceQuote getPrice(const std::string & symbol, bool use_cache = true);

        /**
         * @brief Sequential lookups separated by the batch delay to respect upstream rate limits.
         */
        std::map<std::string, PriceQuote> getPrices(const std::vector<std::string> & symbols);

        PriceMetadata getPriceWithMetadata(const std::string & symbol);

        void clearCache();

        std::size_t cacheSize() const;

        std::size_t sourceCount() const noexcept;

    private:
        std::optional<PriceQuote> _cached(const std::string & symbol) const;

        std::vector<std::unique_ptr<IPriceSource>> _sources;
        ResolverOptions _options;

        mutable std::mutex _cache_mutex;
        absl::flat_hash_map<std::string, PriceQuote> _cache;
    };
}
