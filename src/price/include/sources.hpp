#pragma once

#include <functional>
#include <string>

#include "address.hpp"
#include "hex.hpp"
#include "http.hpp"
#include "price_source.hpp"
#include "rpc.hpp"

namespace tad::price
{
    using HttpGet = std::function<net::Result<net::http::Response>(const std::string & url, const net::http::Headers & headers)>;

    /**
     * @brief HttpGet backed by net::http::get.
     */
    HttpGet makeHttpGet(net::http::RequestOptions options = {});

    struct FtsoConfig
    {
        std::string rpc_url;
        chain::Address contract_address{};
    };

    /**
     * @brief Flare Time Series Oracle v2 read through `getFeedByIdInWei(bytes21)`.
     */
    class FtsoSource final : public IPriceSource
    {
    public:
        FtsoSource(FtsoConfig cfg, chain::RpcCall rpc_call);

        std::string_view name() const override;

        SourceResult<double> fetchPrice(const std::string & symbol) const override;

    private:
        FtsoConfig _cfg;
        chain::RpcClient _rpc;
    };

    /**
     * @brief Feed id of the USD pair: 0x01 followed by "SYM/USD", right-padded to 21 bytes.
     */
    chain::Bytes ftsoFeedId(const std::string & symbol);

    class CoinGeckoSource final : public IPriceSource
    {
    public:
        CoinGeckoSource(std::string api_key, HttpGet http_get, std::string base_url = "https://api.coingecko.com/api/v3");

        std::string_view name() const override;

        SourceResult<double> fetchPrice(const std::string & symbol) const override;

    private:
        std::string _api_key;
        HttpGet _http_get;
        std::string _base_url;
    };

    class BinanceSource final : public IPriceSource
    {
    public:
        BinanceSource(std::string api_key, HttpGet http_get, std::string base_url = "https://api.binance.com/api/v3");

        std::string_view name() const override;

        SourceResult<double> fetchPrice(const std::string & symbol) const override;

    private:
        std::string _api_key;
        HttpGet _http_get;
        std::string _base_url;
    };
}
