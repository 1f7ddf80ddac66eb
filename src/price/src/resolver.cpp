#include "resolver.hpp"

#include <exception>
#include <format>
#include <utility>

#include <spdlog/spdlog.h>

#include "tokens.hpp"
#include "utils.hpp"

namespace tad::price
{
    PriceResolver::PriceResolver(std::vector<std::unique_ptr<IPriceSource>> sources, ResolverOptions options)
        : _sources(std::move(sources)),
          _options(std::move(options))
    {
        if(!_options.clock)
        {
            _options.clock = [] { return std::chrono::system_clock::now(); };
        }

        std::string names;
        for(const auto & source : _sources)
        {
            names += names.empty() ? "" : ", ";
            names += source->name();
        }
        spdlog::info("Price resolver initialized with sources [{}] (cache TTL {}s)", names, _options.cache_ttl.count());
    }

    std::optional<PriceQuote> PriceResolver::_cached(const std::string & symbol) const
    {
        std::lock_guard lock(_cache_mutex);
        const auto it = _cache.find(symbol);
        if(it == _cache.end())
        {
            return std::nullopt;
        }

        if(_options.clock() - it->second.timestamp >= _options.cache_ttl)
        {
            return std::nullopt;
        }
        return it->second;
    }

    PriceQuote PriceResolver::getPrice(const std::string & symbol, const bool use_cache)
    {
        const std::string key = utils::toUpper(utils::trim(symbol));

        if(use_cache)
        {
            if(auto cached = _cached(key))
            {
                spdlog::debug("Using cached price for {}", key);
                return std::move(*cached);
            }
        }

        for(const auto & source : _sources)
        {
            SourceResult<double> price = std::unexpected(SourceError{});
            try
            {
                price = source->fetchPrice(key);
            }
            catch(const std::exception & e)
            {
                spdlog::debug("{} lookup for {} threw: {}", source->name(), key, e.what());
                continue;
            }

            if(!price)
            {
                spdlog::debug("{} lookup for {} failed ({}): {}",
                    source->name(), key, std::format("{}", price.error().kind), price.error().message);
                continue;
            }

            PriceQuote quote{
                .symbol = key,
                .price = *price,
                .source = std::string(source->name()),
                .timestamp = _options.clock(),
                .success = true
            };

            {
                std::lock_guard lock(_cache_mutex);
                _cache.insert_or_assign(key, quote);
            }

            spdlog::info("Price for {}: ${:.4f} (source: {})", key, quote.price, quote.source);
            return quote;
        }

        spdlog::warn("Could not fetch price for {} from any source", key);
        return PriceQuote{
            .symbol = key,
            .price = 0.0,
            .source = NO_SOURCE,
            .timestamp = _options.clock(),
            .success = false
        };
    }

    std::map<std::string, PriceQuote> PriceResolver::getPrices(const std::vector<std::string> & symbols)
    {
        spdlog::info("Fetching prices for {} symbols", symbols.size());

        std::map<std::string, PriceQuote> results;
        std::size_t successful = 0;
        for(std::size_t i = 0; i < symbols.size(); ++i)
        {
            if(i > 0 && _options.sleep && _options.batch_delay.count() > 0)
            {
                _options.sleep(_options.batch_delay);
            }

            PriceQuote quote = getPrice(symbols[i]);
            successful += quote.success ? 1 : 0;
            results.insert_or_assign(symbols[i], std::move(quote));
        }

        spdlog::info("Fetched {}/{} prices", successful, symbols.size());
        return results;
    }

    PriceMetadata PriceResolver::getPriceWithMetadata(const std::string & symbol)
    {
        PriceMetadata out{.quote = getPrice(symbol), .chain = "Unknown", .coingecko_id = ""};
        if(const auto token = findToken(out.quote.symbol))
        {
            out.chain = std::string(token->chain);
            out.coingecko_id = std::string(token->coingecko_id);
        }
        return out;
    }

    void PriceResolver::clearCache()
    {
        std::lock_guard lock(_cache_mutex);
        _cache.clear();
        spdlog::info("Price cache cleared");
    }

    std::size_t PriceResolver::cacheSize() const
    {
        std::lock_guard lock(_cache_mutex);
        return _cache.size();
    }

    std::size_t PriceResolver::sourceCount() const noexcept
    {
        return _sources.size();
    }
}
