#include "unit-tests.hpp"

#include <string>
#include <vector>

#include "fixtures.hpp"

using namespace tad;
using namespace tad::tests;

namespace
{
    struct RecordedGet
    {
        std::string url;
        net::http::Headers headers;
    };

    price::HttpGet scriptedGet(std::vector<RecordedGet> & requests, net::Result<net::http::Response> reply)
    {
        return [&requests, reply](const std::string & url, const net::http::Headers & headers)
        {
            requests.push_back(RecordedGet{.url = url, .headers = headers});
            return reply;
        };
    }

    net::http::Response ok(std::string body)
    {
        return net::http::Response{.status = 200, .body = std::move(body)};
    }
}

TEST_F(UnitTest, Price_Sources_CoinGeckoReadsUsdPrice)
{
    std::vector<RecordedGet> requests;
    price::CoinGeckoSource source("cg-key", scriptedGet(requests, ok(R"({"avalanche-2":{"usd":35.12,"last_updated_at":1700000000}})")));

    const auto result = source.fetchPrice("AVAX");
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(*result, 35.12);

    ASSERT_EQ(requests.size(), 1u);
    EXPECT_NE(requests[0].url.find("ids=avalanche-2"), std::string::npos);
    EXPECT_NE(requests[0].url.find("vs_currencies=usd"), std::string::npos);
    ASSERT_EQ(requests[0].headers.size(), 1u);
    EXPECT_EQ(requests[0].headers[0].first, "x-cg-pro-api-key");
    EXPECT_EQ(requests[0].headers[0].second, "cg-key");
}

TEST_F(UnitTest, Price_Sources_CoinGeckoUnknownTokenSkipsRequest)
{
    std::vector<RecordedGet> requests;
    price::CoinGeckoSource source("", scriptedGet(requests, ok("{}")));

    const auto result = source.fetchPrice("NOTATOKEN");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, price::SourceError::Kind::NOT_FOUND);
    EXPECT_TRUE(requests.empty());
}

TEST_F(UnitTest, Price_Sources_CoinGeckoMissingEntryIsNotFound)
{
    std::vector<RecordedGet> requests;
    price::CoinGeckoSource source("", scriptedGet(requests, ok(R"({"bitcoin":{}})")));

    const auto result = source.fetchPrice("BTC");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, price::SourceError::Kind::NOT_FOUND);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_TRUE(requests[0].headers.empty());
}

TEST_F(UnitTest, Price_Sources_BinanceParsesStringPrice)
{
    std::vector<RecordedGet> requests;
    price::BinanceSource source("", scriptedGet(requests, ok(R"({"symbol":"ETHUSDT","price":"3120.55000000"})")));

    const auto result = source.fetchPrice("eth");
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(*result, 3120.55);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_NE(requests[0].url.find("symbol=ETHUSDT"), std::string::npos);
}

TEST_F(UnitTest, Price_Sources_BinanceReportsFailures)
{
    std::vector<RecordedGet> requests;
    price::BinanceSource failing("", scriptedGet(requests,
        std::unexpected(net::Error{.kind = net::Error::Kind::HTTP_STATUS, .message = "HTTP 400", .status = 400})));

    const auto failed = failing.fetchPrice("XDC");
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, price::SourceError::Kind::REQUEST_FAILED);

    price::BinanceSource garbled("", scriptedGet(requests, ok(R"({"price":"abc"})")));
    const auto malformed = garbled.fetchPrice("XDC");
    ASSERT_FALSE(malformed.has_value());
    EXPECT_EQ(malformed.error().kind, price::SourceError::Kind::MALFORMED_RESPONSE);
}

TEST_F(UnitTest, Price_Sources_FtsoFeedIdLayout)
{
    const auto feed_id = price::ftsoFeedId("flr");
    ASSERT_EQ(feed_id.size(), 21u);
    EXPECT_EQ(feed_id[0], 0x01);

    const std::string pair(feed_id.begin() + 1, feed_id.begin() + 8);
    EXPECT_EQ(pair, "FLR/USD");
    for(std::size_t i = 8; i < feed_id.size(); ++i)
    {
        EXPECT_EQ(feed_id[i], 0x00);
    }
}

TEST_F(UnitTest, Price_Sources_FtsoScalesWeiPrice)
{
    MockRpcNode node;
    node.eth_call_result = hexPrefixed(encodeUint256Word(25'000'000'000'000'000ULL));

    price::FtsoSource source(price::FtsoConfig{.rpc_url = "http://coston2", .contract_address = makeAddressFromSuffix("ftso")}, node.asRpcCall());

    const auto result = source.fetchPrice("FLR");
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, 0.025, 1e-12);

    const auto selector = chain::bytesToHex(crypto::constructSelector("getFeedByIdInWei(bytes21)"));
    EXPECT_EQ(node.last_call_data.substr(0, selector.size()), selector);
}

TEST_F(UnitTest, Price_Sources_FtsoWithoutContractIsUnavailable)
{
    MockRpcNode node;
    price::FtsoSource source(price::FtsoConfig{.rpc_url = "http://coston2"}, node.asRpcCall());

    const auto result = source.fetchPrice("FLR");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, price::SourceError::Kind::UNAVAILABLE);
    EXPECT_EQ(node.eth_call_calls, 0u);
}

TEST_F(UnitTest, Price_Sources_FtsoZeroPriceIsNotFound)
{
    MockRpcNode node;
    node.eth_call_result = hexPrefixed(encodeUint256Word(0));

    price::FtsoSource source(price::FtsoConfig{.rpc_url = "http://coston2", .contract_address = makeAddressFromSuffix("ftso")}, node.asRpcCall());

    const auto result = source.fetchPrice("DOGE");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, price::SourceError::Kind::NOT_FOUND);
}
