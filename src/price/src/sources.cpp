#include "sources.hpp"

#include <charconv>
#include <format>
#include <utility>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "abi.hpp"
#include "tokens.hpp"
#include "utils.hpp"

namespace tad::price
{
    using json = nlohmann::json;

    namespace
    {
        constexpr std::size_t FTSO_FEED_ID_SIZE = 21;
        constexpr std::uint8_t FTSO_CRYPTO_CATEGORY = 0x01;
        constexpr double WEI_PER_UNIT = 1e18;

        SourceError _requestFailed(const std::string_view source, const net::Error & error)
        {
            return SourceError{
                .kind = SourceError::Kind::REQUEST_FAILED,
                .message = std::format("{} request failed ({}): {}", source, error.kind, error.message)
            };
        }

        SourceError _malformed(const std::string_view source, const std::string & detail)
        {
            return SourceError{
                .kind = SourceError::Kind::MALFORMED_RESPONSE,
                .message = std::format("{} returned malformed data: {}", source, detail)
            };
        }

        std::optional<double> _parseDouble(const std::string & text)
        {
            double value = 0.0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if(text.empty() || ec != std::errc() || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        // big-endian uint256 word as double
        double _wordToDouble(const std::uint8_t* word)
        {
            double value = 0.0;
            for(std::size_t i = 0; i < 32; ++i)
            {
                value = value * 256.0 + static_cast<double>(word[i]);
            }
            return value;
        }
    }

    HttpGet makeHttpGet(net::http::RequestOptions options)
    {
        return [options = std::move(options)](const std::string & url, const net::http::Headers & headers)
        {
            return net::http::get(url, headers, options);
        };
    }

    chain::Bytes ftsoFeedId(const std::string & symbol)
    {
        const std::string pair = std::format("{}/USD", utils::toUpper(symbol));

        chain::Bytes feed_id(FTSO_FEED_ID_SIZE, 0);
        feed_id[0] = FTSO_CRYPTO_CATEGORY;
        for(std::size_t i = 0; i < pair.size() && i + 1 < FTSO_FEED_ID_SIZE; ++i)
        {
            feed_id[i + 1] = static_cast<std::uint8_t>(pair[i]);
        }
        return feed_id;
    }

    FtsoSource::FtsoSource(FtsoConfig cfg, chain::RpcCall rpc_call)
        : _cfg(std::move(cfg)),
          _rpc(_cfg.rpc_url, std::move(rpc_call))
    {
    }

    std::string_view FtsoSource::name() const
    {
        return "FTSO";
    }

    SourceResult<double> FtsoSource::fetchPrice(const std::string & symbol) const
    {
        if(_cfg.rpc_url.empty() || chain::isZeroAddress(_cfg.contract_address))
        {
            return std::unexpected(SourceError{
                .kind = SourceError::Kind::UNAVAILABLE,
                .message = "FTSO RPC endpoint or contract not configured"
            });
        }

        const auto feed_id = ftsoFeedId(symbol);
        const auto call_data = chain::abi::encodeCall("getFeedByIdInWei(bytes21)", {
            chain::abi::fixedBytes(feed_id.data(), feed_id.size())
        });

        const auto output = _rpc.ethCall(_cfg.contract_address, call_data);
        if(!output)
        {
            return std::unexpected(SourceError{
                .kind = SourceError::Kind::REQUEST_FAILED,
                .message = std::format("FTSO eth_call failed ({}): {}", output.error().kind, output.error().message)
            });
        }

        if(output->size() < 32)
        {
            return std::unexpected(_malformed(name(), std::format("{} byte result", output->size())));
        }

        const double price = _wordToDouble(output->data()) / WEI_PER_UNIT;
        if(price <= 0.0)
        {
            return std::unexpected(SourceError{
                .kind = SourceError::Kind::NOT_FOUND,
                .message = std::format("FTSO has no feed for {}/USD", symbol)
            });
        }
        return price;
    }

    CoinGeckoSource::CoinGeckoSource(std::string api_key, HttpGet http_get, std::string base_url)
        : _api_key(std::move(api_key)),
          _http_get(std::move(http_get)),
          _base_url(std::move(base_url))
    {
    }

    std::string_view CoinGeckoSource::name() const
    {
        return "CoinGecko";
    }

    SourceResult<double> CoinGeckoSource::fetchPrice(const std::string & symbol) const
    {
        const auto token = findToken(symbol);
        if(!token || token->coingecko_id.empty())
        {
            return std::unexpected(SourceError{
                .kind = SourceError::Kind::NOT_FOUND,
                .message = std::format("No CoinGecko id for {}", symbol)
            });
        }

        const std::string id(token->coingecko_id);
        const std::string url = std::format("{}/simple/price?ids={}&vs_currencies=usd&include_last_updated_at=true",
            _base_url, net::http::urlEncode(id));

        net::http::Headers headers;
        if(!_api_key.empty())
        {
            headers.emplace_back("x-cg-pro-api-key", _api_key);
        }

        const auto response = _http_get(url, headers);
        if(!response)
        {
            return std::unexpected(_requestFailed(name(), response.error()));
        }

        const json body = json::parse(response->body, nullptr, false);
        if(body.is_discarded() || !body.is_object())
        {
            return std::unexpected(_malformed(name(), "body is not a JSON object"));
        }

        if(!body.contains(id) || !body[id].is_object() || !body[id].contains("usd") || !body[id]["usd"].is_number())
        {
            return std::unexpected(SourceError{
                .kind = SourceError::Kind::NOT_FOUND,
                .message = std::format("CoinGecko has no USD price for {}", id)
            });
        }

        return body[id]["usd"].get<double>();
    }

    BinanceSource::BinanceSource(std::string api_key, HttpGet http_get, std::string base_url)
        : _api_key(std::move(api_key)),
          _http_get(std::move(http_get)),
          _base_url(std::move(base_url))
    {
    }

    std::string_view BinanceSource::name() const
    {
        return "Binance";
    }

    SourceResult<double> BinanceSource::fetchPrice(const std::string & symbol) const
    {
        const std::string url = std::format("{}/ticker/price?symbol={}USDT", _base_url, net::http::urlEncode(utils::toUpper(symbol)));

        net::http::Headers headers;
        if(!_api_key.empty())
        {
            headers.emplace_back("X-MBX-APIKEY", _api_key);
        }

        const auto response = _http_get(url, headers);
        if(!response)
        {
            return std::unexpected(_requestFailed(name(), response.error()));
        }

        const json body = json::parse(response->body, nullptr, false);
        if(body.is_discarded() || !body.is_object() || !body.contains("price"))
        {
            return std::unexpected(_malformed(name(), response->body));
        }

        std::optional<double> price;
        if(body["price"].is_string())
        {
            price = _parseDouble(body["price"].get<std::string>());
        }
        else if(body["price"].is_number())
        {
            price = body["price"].get<double>();
        }

        if(!price)
        {
            return std::unexpected(_malformed(name(), body["price"].dump()));
        }
        return *price;
    }
}
