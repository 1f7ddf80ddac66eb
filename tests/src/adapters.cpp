#include "unit-tests.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "fixtures.hpp"

using namespace tad;
using namespace tad::tests;

namespace
{
    constexpr const char* LOCATOR = "https://x.com/satoshi/status/1700000000000000000";

    struct RecordedPost
    {
        std::string url;
        json body;
        net::http::Headers headers;
    };

    native::ProcessResult ran(const int exit_code, std::string output, std::string errors = "")
    {
        return native::ProcessResult{.exit_code = exit_code, .output = std::move(output), .errors = std::move(errors)};
    }

    net::http::Response ok(std::string body)
    {
        return net::http::Response{.status = 200, .body = std::move(body)};
    }

    std::optional<std::string> headerValue(const net::http::Headers & headers, const std::string & name)
    {
        const auto it = std::find_if(headers.begin(), headers.end(), [&name](const auto & header) { return header.first == name; });
        if(it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string chatReply(const std::string & content)
    {
        return json{{"choices", json::array({json{{"message", {{"role", "assistant"}, {"content", content}}}}})}}.dump();
    }

    pipeline::RegistryEntry sampleEntry()
    {
        pipeline::RegistryEntry entry;
        entry.content_hash = crypto::contentHash(LOCATOR);
        entry.url = LOCATOR;
        entry.tweet_id = "1700000000000000000";
        entry.author = "Satoshi";
        entry.handle = "@satoshi";
        entry.body = "gm";
        entry.likes = 10;
        entry.data_cid = "bafydata";
        entry.ecosystem = "BTC";
        entry.submitter = makeAddressFromSuffix("depositor");
        return entry;
    }
}

// ---------------------------------------------------------------------------------------------------------------------
// transport

TEST_F(UnitTest, Adapters_Transport_LastJsonObjectSkipsProgressLines)
{
    const auto whole = adapters::lastJsonObject(R"({"a": 1})");
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ((*whole)["a"], 1);

    const auto last = adapters::lastJsonObject("Loading page...\n{\"first\": true}\nDone\n{\"second\": true}\n");
    ASSERT_TRUE(last.has_value());
    EXPECT_TRUE(last->contains("second"));

    EXPECT_FALSE(adapters::lastJsonObject("no json here\n[1, 2]").has_value());
}

// ---------------------------------------------------------------------------------------------------------------------
// scraper

TEST_F(UnitTest, Adapters_Scraper_AppendsLocatorAndParsesOutput)
{
    std::string seen_command;
    std::vector<std::string> seen_args;

    adapters::CommandContentFetcher fetcher("python3 scraper.py --headless",
        [&](const std::string & command, std::vector<std::string> args)
        {
            seen_command = command;
            seen_args = std::move(args);
            return ran(0,
                "Launching browser\n"
                R"({"content": "$BTC to the moon", "user": "Satoshi", "handle": "@satoshi", "verified": "true", )"
                R"("likes": "1,204", "retweets": 7, "replies": "3", "timestamp": "2024-01-02T03:04:05.000Z", "screenshot": "https://gw/ipfs/bafyshot"})");
        });

    const auto content = fetcher.fetch(LOCATOR);
    ASSERT_TRUE(content.has_value()) << content.error().message;

    EXPECT_EQ(seen_command, "python3");
    EXPECT_EQ(seen_args, (std::vector<std::string>{"scraper.py", "--headless", LOCATOR}));

    EXPECT_EQ(content->url, LOCATOR);
    EXPECT_EQ(content->tweet_id, "1700000000000000000");
    EXPECT_EQ(content->body, "$BTC to the moon");
    EXPECT_EQ(content->author, "Satoshi");
    EXPECT_TRUE(content->verified);
    EXPECT_EQ(content->likes, 1'204u);
    EXPECT_EQ(content->retweets, 7u);
    EXPECT_EQ(content->replies, 3u);
    EXPECT_EQ(content->captured_at, std::chrono::system_clock::time_point(std::chrono::seconds(1'704'164'645)));
    EXPECT_EQ(pipeline::cidFromUrl(content->screenshot_url), "bafyshot");
}

TEST_F(UnitTest, Adapters_Scraper_Failures)
{
    adapters::CommandContentFetcher crashed("scrape", [](const std::string &, std::vector<std::string>)
    {
        return ran(1, "Traceback: timeout");
    });
    const auto crashed_res = crashed.fetch(LOCATOR);
    ASSERT_FALSE(crashed_res.has_value());
    EXPECT_EQ(crashed_res.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);

    adapters::CommandContentFetcher silent("scrape", [](const std::string &, std::vector<std::string>)
    {
        return ran(0, "tweet not found");
    });
    const auto silent_res = silent.fetch(LOCATOR);
    ASSERT_FALSE(silent_res.has_value());
    EXPECT_EQ(silent_res.error().kind, pipeline::CollaboratorError::Kind::INVALID_RESPONSE);

    adapters::CommandContentFetcher contentless("scrape", [](const std::string &, std::vector<std::string>)
    {
        return ran(0, R"({"user": "a"})");
    });
    const auto contentless_res = contentless.fetch(LOCATOR);
    ASSERT_FALSE(contentless_res.has_value());
    EXPECT_EQ(contentless_res.error().kind, pipeline::CollaboratorError::Kind::INVALID_RESPONSE);

    std::size_t runs = 0;
    adapters::CommandContentFetcher unconfigured("   ", [&runs](const std::string &, std::vector<std::string>)
    {
        ++runs;
        return ran(0, "");
    });
    const auto unconfigured_res = unconfigured.fetch(LOCATOR);
    ASSERT_FALSE(unconfigured_res.has_value());
    EXPECT_EQ(unconfigured_res.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);
    EXPECT_EQ(runs, 0u);
}

TEST_F(UnitTest, Adapters_Scraper_KilledRunIsUnavailable)
{
    adapters::CommandContentFetcher hung("scrape", [](const std::string &, std::vector<std::string>)
    {
        return native::ProcessResult{.exit_code = -1, .output = "{\"content\": \"partial\"}", .errors = "scrape killed after 180000 ms", .timed_out = true};
    });

    const auto res = hung.fetch(LOCATOR);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);
    EXPECT_NE(res.error().message.find("timed out"), std::string::npos);
}

TEST_F(UnitTest, Adapters_Scraper_IgnoresStandardError)
{
    adapters::CommandContentFetcher noisy("scrape", [](const std::string &, std::vector<std::string>)
    {
        return ran(0, R"({"content": "gm", "user": "a"})", "DevTools listening on ws://127.0.0.1:9222\n{\"content\": \"injected\"}\n");
    });

    const auto content = noisy.fetch(LOCATOR);
    ASSERT_TRUE(content.has_value()) << content.error().message;
    EXPECT_EQ(content->body, "gm");
}

// ---------------------------------------------------------------------------------------------------------------------
// hugging face

TEST_F(UnitTest, Adapters_HuggingFace_NormalizesLabels)
{
    EXPECT_EQ(adapters::normalizeSentimentLabel("POSITIVE"), "positive");
    EXPECT_EQ(adapters::normalizeSentimentLabel("neg"), "negative");
    EXPECT_EQ(adapters::normalizeSentimentLabel("LABEL_0"), "negative");
    EXPECT_EQ(adapters::normalizeSentimentLabel("LABEL_1"), "neutral");
    EXPECT_EQ(adapters::normalizeSentimentLabel("LABEL_2"), "positive");
    EXPECT_EQ(adapters::normalizeSentimentLabel("Neutral"), "neutral");
}

TEST_F(UnitTest, Adapters_HuggingFace_PicksTopScoringLabel)
{
    const auto nested = adapters::parseInferenceOutput(json::parse(
        R"([[{"label": "positive", "score": 0.12}, {"label": "negative", "score": 0.81}, {"label": "neutral", "score": 0.07}]])"));
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(nested->label, "negative");
    EXPECT_DOUBLE_EQ(nested->score, 0.81);

    const auto flat = adapters::parseInferenceOutput(json::parse(
        R"([{"label": "LABEL_2", "score": 0.6}, {"label": "bogus"}, {"label": "LABEL_0", "score": 0.3}])"));
    ASSERT_TRUE(flat.has_value());
    EXPECT_EQ(flat->label, "positive");

    EXPECT_FALSE(adapters::parseInferenceOutput(json::parse(R"({"error": "Model is loading"})")).has_value());
    EXPECT_FALSE(adapters::parseInferenceOutput(json::array()).has_value());
    EXPECT_FALSE(adapters::parseInferenceOutput(json::parse(R"([[{"label": "x"}]])")).has_value());
}

TEST_F(UnitTest, Adapters_HuggingFace_CombinesAgreeingModels)
{
    const auto analysis = adapters::combineSentiment(
        adapters::ModelSentiment{.label = "positive", .score = 0.9},
        adapters::ModelSentiment{.label = "positive", .score = 0.8},
        "BTC to the MOON");

    EXPECT_EQ(analysis.combined_label, "positive");
    EXPECT_NEAR(analysis.combined_score, 0.93, 1e-9);
    EXPECT_NEAR(analysis.confidence, 0.85, 1e-9);
    // extremity 0.86, disagreement 0.15, one keyword of thirteen
    EXPECT_NEAR(analysis.controversy, 0.86 * 0.4 + 0.15 * 0.3 + 0.3 / 13.0, 1e-9);
}

TEST_F(UnitTest, Adapters_HuggingFace_DisagreementRaisesControversy)
{
    const auto analysis = adapters::combineSentiment(
        adapters::ModelSentiment{.label = "negative", .score = 0.7},
        adapters::ModelSentiment{.label = "positive", .score = 0.7},
        "");

    EXPECT_EQ(analysis.combined_label, "neutral");
    EXPECT_NEAR(analysis.confidence, 0.35, 1e-9);
    EXPECT_NEAR(analysis.controversy, 0.14 * 0.4 + 0.65 * 0.3, 1e-9);
}

TEST_F(UnitTest, Adapters_HuggingFace_OneFailingModelVotesNeutral)
{
    std::vector<RecordedPost> posts;
    adapters::HuggingFaceSentimentScorer scorer(adapters::HuggingFaceConfig{.api_key = "hf-key"},
        [&posts](const std::string & url, const json & body, const net::http::Headers & headers) -> net::Result<net::http::Response>
        {
            posts.push_back(RecordedPost{.url = url, .body = body, .headers = headers});
            if(url.ends_with("ProsusAI/finbert"))
            {
                return ok(R"([[{"label": "negative", "score": 0.9}, {"label": "positive", "score": 0.1}]])");
            }
            return std::unexpected(net::Error{.kind = net::Error::Kind::HTTP_STATUS, .message = "HTTP 503", .status = 503});
        });

    const std::string long_text(600, 'a');
    const auto score = scorer.scoreSentiment(long_text);
    ASSERT_TRUE(score.has_value()) << score.error().message;

    EXPECT_EQ(score->label, "negative");
    // combined -0.54, confidence 0.35
    EXPECT_NEAR(score->controversy, 0.54 * 0.4 + 0.65 * 0.3, 1e-9);

    ASSERT_EQ(posts.size(), 2u);
    EXPECT_EQ(posts[0].body["inputs"].get<std::string>().size(), 512u);
    EXPECT_EQ(headerValue(posts[0].headers, "Authorization").value_or(""), "Bearer hf-key");
}

TEST_F(UnitTest, Adapters_HuggingFace_TruncatesOnCodePointBoundary)
{
    std::vector<std::string> inputs;
    adapters::HuggingFaceSentimentScorer scorer(adapters::HuggingFaceConfig{.api_key = "hf-key"},
        [&inputs](const std::string &, const json & body, const net::http::Headers &) -> net::Result<net::http::Response>
        {
            // serialising a split code point throws
            const std::string wire = body.dump();
            inputs.push_back(json::parse(wire)["inputs"].get<std::string>());
            return ok(R"([[{"label": "positive", "score": 0.9}]])");
        });

    // U+1F680 occupies bytes 511..514
    const std::string text = std::string(511, 'a') + "\xF0\x9F\x9A\x80" + std::string(20, 'b');
    const auto score = scorer.scoreSentiment(text);
    ASSERT_TRUE(score.has_value()) << score.error().message;

    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0], std::string(511, 'a'));
    EXPECT_EQ(inputs[1], std::string(511, 'a'));

    EXPECT_EQ(utils::truncateUtf8("h\xC3\xA9llo", 2), "h");
    EXPECT_EQ(utils::truncateUtf8("h\xC3\xA9llo", 3), "h\xC3\xA9");
    EXPECT_EQ(utils::truncateUtf8("short", 512), "short");
}

TEST_F(UnitTest, Adapters_HuggingFace_UnavailableWithoutModels)
{
    std::size_t calls = 0;
    const adapters::JsonPost failing = [&calls](const std::string &, const json &, const net::http::Headers &) -> net::Result<net::http::Response>
    {
        ++calls;
        return ok("<html>gateway timeout</html>");
    };

    adapters::HuggingFaceSentimentScorer unconfigured(adapters::HuggingFaceConfig{}, failing);
    const auto unconfigured_res = unconfigured.scoreSentiment("gm");
    ASSERT_FALSE(unconfigured_res.has_value());
    EXPECT_EQ(unconfigured_res.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);
    EXPECT_EQ(calls, 0u);

    adapters::HuggingFaceSentimentScorer broken(adapters::HuggingFaceConfig{.api_key = "hf-key"}, failing);
    const auto broken_res = broken.scoreSentiment("gm");
    ASSERT_FALSE(broken_res.has_value());
    EXPECT_EQ(broken_res.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);
    EXPECT_EQ(calls, 2u);
}

// ---------------------------------------------------------------------------------------------------------------------
// openai

TEST_F(UnitTest, Adapters_OpenAi_RemovalRiskReadsFencedJson)
{
    std::vector<RecordedPost> posts;
    const adapters::OpenAiClient client(adapters::OpenAiConfig{.api_key = "sk-test", .model = "gpt-4"},
        [&posts](const std::string & url, const json & body, const net::http::Headers & headers) -> net::Result<net::http::Response>
        {
            posts.push_back(RecordedPost{.url = url, .body = body, .headers = headers});
            return ok(chatReply("```json\n{\"score\": 1.4, \"analysis\": \"Likely moderated\"}\n```"));
        });
    adapters::OpenAiRemovalRiskScorer scorer(client);

    const auto risk = scorer.scoreRemovalRisk("this coin is a scam");
    ASSERT_TRUE(risk.has_value()) << risk.error().message;
    EXPECT_DOUBLE_EQ(risk->score, 1.0);
    EXPECT_EQ(risk->analysis, "Likely moderated");

    ASSERT_EQ(posts.size(), 1u);
    EXPECT_EQ(posts[0].url, "https://api.openai.com/v1/chat/completions");
    EXPECT_EQ(posts[0].body["model"], "gpt-4");
    EXPECT_EQ(posts[0].body["messages"].size(), 2u);
    EXPECT_NE(posts[0].body["messages"][1]["content"].get<std::string>().find("this coin is a scam"), std::string::npos);
    EXPECT_EQ(headerValue(posts[0].headers, "Authorization").value_or(""), "Bearer sk-test");
}

TEST_F(UnitTest, Adapters_OpenAi_RejectsUnusableAnswers)
{
    std::string reply;
    const adapters::OpenAiClient client(adapters::OpenAiConfig{.api_key = "sk-test"},
        [&reply](const std::string &, const json &, const net::http::Headers &) -> net::Result<net::http::Response>
        {
            return ok(reply);
        });
    adapters::OpenAiRemovalRiskScorer scorer(client);

    reply = chatReply("I think it is risky");
    const auto prose = scorer.scoreRemovalRisk("gm");
    ASSERT_FALSE(prose.has_value());
    EXPECT_EQ(prose.error().kind, pipeline::CollaboratorError::Kind::INVALID_RESPONSE);

    reply = R"({"choices": []})";
    const auto empty = scorer.scoreRemovalRisk("gm");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().kind, pipeline::CollaboratorError::Kind::INVALID_RESPONSE);

    const adapters::OpenAiClient keyless(adapters::OpenAiConfig{}, nullptr);
    EXPECT_FALSE(keyless.configured());
    adapters::OpenAiRemovalRiskScorer keyless_scorer(keyless);
    const auto unavailable = keyless_scorer.scoreRemovalRisk("gm");
    ASSERT_FALSE(unavailable.has_value());
    EXPECT_EQ(unavailable.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);
}

TEST_F(UnitTest, Adapters_OpenAi_ClassifierNormalizesToken)
{
    std::string reply;
    std::size_t calls = 0;
    const adapters::OpenAiClient client(adapters::OpenAiConfig{.api_key = "sk-test"},
        [&](const std::string &, const json &, const net::http::Headers &) -> net::Result<net::http::Response>
        {
            ++calls;
            return ok(chatReply(reply));
        });
    adapters::OpenAiEcosystemClassifier classifier(client);

    reply = " $eth\n";
    const auto eth = classifier.classify("$ETH gas is cheap on Ethereum today");
    ASSERT_TRUE(eth.has_value());
    EXPECT_EQ(eth->token, "ETH");
    EXPECT_EQ(eth->chain, "Ethereum");
    EXPECT_NEAR(eth->confidence, 1.0, 1e-9);

    reply = "SHIB";
    const auto unsupported = classifier.classify("shib army");
    ASSERT_TRUE(unsupported.has_value());
    EXPECT_EQ(unsupported->token, pipeline::UNKNOWN_TOKEN);
    EXPECT_DOUBLE_EQ(unsupported->confidence, 0.0);

    const auto blank = classifier.classify("   ");
    ASSERT_TRUE(blank.has_value());
    EXPECT_EQ(blank->token, pipeline::UNKNOWN_TOKEN);
    EXPECT_EQ(calls, 2u);

    const std::string prompt = adapters::classifierSystemPrompt();
    EXPECT_NE(prompt.find("BTC, ETH, SOL"), std::string::npos);
    EXPECT_NE(prompt.find("FLR"), std::string::npos);
}

// ---------------------------------------------------------------------------------------------------------------------
// storacha

TEST_F(UnitTest, Adapters_Storacha_ParsesReceipts)
{
    const auto allocation = adapters::parseStoreAllocation(json::parse(
        R"([{"p": {"out": {"ok": {"status": "upload", "url": "https://carpark/put", "headers": {"x-amz-checksum-sha256": "abc"}}}}}])"));
    ASSERT_TRUE(allocation.has_value());
    EXPECT_EQ(allocation->upload_url.value_or(""), "https://carpark/put");
    ASSERT_EQ(allocation->upload_headers.size(), 1u);
    EXPECT_EQ(allocation->upload_headers[0].first, "x-amz-checksum-sha256");
    EXPECT_FALSE(allocation->already_stored);

    const auto done = adapters::parseStoreAllocation(json::parse(R"([{"p": {"out": {"ok": {"status": "done"}}}}])"));
    ASSERT_TRUE(done.has_value());
    EXPECT_FALSE(done->upload_url.has_value());
    EXPECT_TRUE(done->already_stored);

    const auto rejected = adapters::parseStoreAllocation(json::parse(R"([{"p": {"out": {"error": {"message": "space not provisioned"}}}}])"));
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().kind, pipeline::CollaboratorError::Kind::REJECTED);
    EXPECT_NE(rejected.error().message.find("space not provisioned"), std::string::npos);

    const auto missing = adapters::parseStoreAllocation(json::parse(R"({"ok": true})"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, pipeline::CollaboratorError::Kind::INVALID_RESPONSE);

    EXPECT_EQ(adapters::parseDealId(json::parse(R"([{"p": {"out": {"dealId": 98765}}}])")).value_or(""), "98765");
    EXPECT_EQ(adapters::parseDealId(json::parse(R"([{"p": {"out": {"dealId": "d-1"}}}])")).value_or(""), "d-1");
    EXPECT_FALSE(adapters::parseDealId(json::parse(R"([{"p": {"out": {"ok": {}}}}])")).has_value());

    EXPECT_EQ(adapters::parsePinnedCid(json::parse(R"({"IpfsHash": "bafydata", "PinSize": 10})")).value_or(""), "bafydata");
    EXPECT_FALSE(adapters::parsePinnedCid(json::parse(R"({"error": "unauthorized"})")).has_value());
}

TEST_F(UnitTest, Adapters_Storacha_BridgeRequestShape)
{
    const json task = adapters::bridgeTask("store/add", "did:key:z6Mk", json{{"size", 7}});
    ASSERT_TRUE(task["tasks"].is_array());
    ASSERT_EQ(task["tasks"].size(), 1u);
    EXPECT_EQ(task["tasks"][0][0], "store/add");
    EXPECT_EQ(task["tasks"][0][1], "did:key:z6Mk");
    EXPECT_EQ(task["tasks"][0][2]["size"], 7);

    const auto headers = adapters::parseBridgeTokens(json::parse(R"({"X-Auth-Secret": "uS3cr3t", "Authorization": "uAuth"})"));
    ASSERT_TRUE(headers.has_value());
    EXPECT_EQ(headerValue(*headers, "X-Auth-Secret").value_or(""), "uS3cr3t");
    EXPECT_EQ(headerValue(*headers, "Authorization").value_or(""), "uAuth");

    EXPECT_FALSE(adapters::parseBridgeTokens(json::parse(R"({"Authorization": "uAuth"})")).has_value());
}

namespace
{
    /**
     * @brief Scripted ipfs, ipfs-car and w3 tooling plus the Pinata and bridge endpoints.
     */
    struct StorageBench
    {
        std::vector<std::string> abilities;
        std::vector<json> bridge_args;
        std::vector<std::pair<std::string, net::http::Headers>> uploads;
        bool fail_deal = false;
        std::string tool_warnings;

        adapters::StorageTransport transport()
        {
            return adapters::StorageTransport{
                .run = [this](const std::string & command, std::vector<std::string> args)
                {
                    if(command == "ipfs" && !args.empty() && args[0] == "add") return ran(0, "bafyroot\n", tool_warnings);
                    if(command == "ipfs-car") return ran(0, "bagcar\n", tool_warnings);
                    if(command == "w3") return ran(0, "Tokens:\n{\"X-Auth-Secret\": \"s\", \"Authorization\": \"a\"}\n");
                    return ran(127, "command not found");
                },
                .run_to_file = [](const std::string &, std::vector<std::string>, const std::filesystem::path & output_path)
                {
                    const bool written = file::writeTextFileAtomic(output_path, "CARDATA");
                    return ran(written ? 0 : 1, "");
                },
                .post_json = [this](const std::string &, const json & body, const net::http::Headers &) -> net::Result<net::http::Response>
                {
                    const std::string ability = body["tasks"][0][0].get<std::string>();
                    abilities.push_back(ability);
                    bridge_args.push_back(body["tasks"][0][2]);

                    if(ability == "store/add")
                    {
                        return ok(R"([{"p": {"out": {"ok": {"status": "upload", "url": "https://carpark/put", "headers": {"x-amz-checksum-sha256": "abc"}}}}}])");
                    }
                    if(ability == "deal/add" && fail_deal)
                    {
                        return std::unexpected(net::Error{.kind = net::Error::Kind::HTTP_STATUS, .message = "HTTP 500", .status = 500});
                    }
                    if(ability == "deal/add")
                    {
                        return ok(R"([{"p": {"out": {"dealId": 42}}}])");
                    }
                    return ok(R"([{"p": {"out": {"ok": {}}}}])");
                },
                .put_file = [this](const std::string & url, const std::filesystem::path &, const net::http::Headers & headers) -> net::Result<net::http::Response>
                {
                    uploads.emplace_back(url, headers);
                    return ok("");
                },
                .post_multipart = [](const std::string &, const std::string &, const std::filesystem::path &, const net::http::Headers &) -> net::Result<net::http::Response>
                {
                    return ok(R"({"IpfsHash": "bafydata"})");
                }
            };
        }
    };
}

TEST_F(UnitTest, Adapters_Storacha_ArchivesFileEndToEnd)
{
    const auto dir = makeStoragePath("storacha", "end_to_end");
    const auto record_path = dir / "tweet_20240102_030405_abcdef01.json";
    ASSERT_TRUE(file::writeTextFileAtomic(record_path, R"({"content_hash": "0xabcdef01"})"));

    StorageBench bench;
    adapters::StorachaStorage storage(adapters::StorachaConfig{.space_did = "did:key:z6Mk", .pinata_jwt = "jwt"}, bench.transport());

    const auto receipt = storage.store(record_path);
    ASSERT_TRUE(receipt.has_value()) << receipt.error().message;

    EXPECT_EQ(receipt->data_cid, "bafydata");
    EXPECT_EQ(receipt->root_cid, "bafyroot");
    EXPECT_EQ(receipt->car_cid, "bagcar");
    EXPECT_EQ(receipt->deal_id.value_or(""), "42");

    EXPECT_EQ(bench.abilities, (std::vector<std::string>{"store/add", "upload/add", "deal/add"}));
    EXPECT_EQ(bench.bridge_args[0]["link"]["/"], "bagcar");
    EXPECT_EQ(bench.bridge_args[0]["size"], 7);
    EXPECT_EQ(bench.bridge_args[1]["root"]["/"], "bafyroot");

    ASSERT_EQ(bench.uploads.size(), 1u);
    EXPECT_EQ(bench.uploads[0].first, "https://carpark/put");
    EXPECT_EQ(headerValue(bench.uploads[0].second, "Content-Length").value_or(""), "7");
    EXPECT_EQ(headerValue(bench.uploads[0].second, "x-amz-checksum-sha256").value_or(""), "abc");

    auto car_path = record_path;
    car_path += ".car";
    EXPECT_FALSE(std::filesystem::exists(car_path));
    EXPECT_TRUE(std::filesystem::exists(record_path));
}

TEST_F(UnitTest, Adapters_Storacha_ToolWarningsStayOutOfCids)
{
    const auto dir = makeStoragePath("storacha", "tool_warnings");
    const auto record_path = dir / "tweet.json";
    ASSERT_TRUE(file::writeTextFileAtomic(record_path, "{}"));

    StorageBench bench;
    bench.tool_warnings = "WARNING: the IPFS daemon is running an older version\n";
    adapters::StorachaStorage storage(adapters::StorachaConfig{.space_did = "did:key:z6Mk", .pinata_jwt = "jwt"}, bench.transport());

    const auto receipt = storage.store(record_path);
    ASSERT_TRUE(receipt.has_value()) << receipt.error().message;
    EXPECT_EQ(receipt->root_cid, "bafyroot");
    EXPECT_EQ(receipt->car_cid, "bagcar");
    EXPECT_EQ(bench.bridge_args[1]["root"]["/"], "bafyroot");
}

TEST_F(UnitTest, Adapters_Storacha_FailuresAreReported)
{
    const auto dir = makeStoragePath("storacha", "failures");
    const auto record_path = dir / "tweet.json";
    ASSERT_TRUE(file::writeTextFileAtomic(record_path, "{}"));

    StorageBench bench;
    bench.fail_deal = true;
    adapters::StorachaStorage storage(adapters::StorachaConfig{.space_did = "did:key:z6Mk", .pinata_jwt = "jwt"}, bench.transport());

    const auto deal_failure = storage.store(record_path);
    ASSERT_FALSE(deal_failure.has_value());
    EXPECT_EQ(deal_failure.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);
    auto car_path = record_path;
    car_path += ".car";
    EXPECT_FALSE(std::filesystem::exists(car_path));

    const auto missing = storage.store(dir / "does_not_exist.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, pipeline::CollaboratorError::Kind::NOT_FOUND);

    adapters::StorachaStorage unconfigured(adapters::StorachaConfig{}, bench.transport());
    const auto no_credentials = unconfigured.store(record_path);
    ASSERT_FALSE(no_credentials.has_value());
    EXPECT_EQ(no_credentials.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);
}

// ---------------------------------------------------------------------------------------------------------------------
// registry

TEST_F(UnitTest, Adapters_Registry_ExistsReadsBoolWord)
{
    MockRpcNode node;
    const chain::RpcClient rpc("http://node", node.asRpcCall());
    const FakeTransactionSender sender;
    adapters::RegistryClient registry(adapters::RegistryClientConfig{.contract_address = makeAddressFromSuffix("registry")}, rpc, sender);

    const auto hash = crypto::contentHash(LOCATOR);

    node.eth_call_result = hexPrefixed(encodeUint256Word(1));
    const auto present = registry.exists(hash);
    ASSERT_TRUE(present.has_value());
    EXPECT_TRUE(*present);

    const auto selector = chain::bytesToHex(crypto::constructSelector("exists(bytes32)"));
    EXPECT_EQ(node.last_call_data, selector + hexPrefixed(hash).substr(2));

    node.eth_call_result = hexPrefixed(encodeUint256Word(0));
    const auto absent = registry.exists(hash);
    ASSERT_TRUE(absent.has_value());
    EXPECT_FALSE(*absent);

    node.eth_call_result = "0x";
    const auto short_output = registry.exists(hash);
    ASSERT_FALSE(short_output.has_value());
    EXPECT_EQ(short_output.error().kind, pipeline::CollaboratorError::Kind::INVALID_RESPONSE);

    node.fail_eth_call = true;
    const auto unreachable = registry.exists(hash);
    ASSERT_FALSE(unreachable.has_value());
    EXPECT_EQ(unreachable.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);
}

TEST_F(UnitTest, Adapters_Registry_WriteSkipsExistingEntries)
{
    MockRpcNode node;
    node.eth_call_result = hexPrefixed(encodeUint256Word(1));
    const chain::RpcClient rpc("http://node", node.asRpcCall());
    const FakeTransactionSender sender;
    adapters::RegistryClient registry(adapters::RegistryClientConfig{.contract_address = makeAddressFromSuffix("registry")}, rpc, sender);

    const auto written = registry.write(sampleEntry());
    ASSERT_TRUE(written.has_value());
    EXPECT_FALSE(written->has_value());
    EXPECT_TRUE(sender.sent.empty());
}

TEST_F(UnitTest, Adapters_Registry_WriteSendsStoreTweet)
{
    MockRpcNode node;
    node.eth_call_result = hexPrefixed(encodeUint256Word(0));
    const chain::RpcClient rpc("http://node", node.asRpcCall());
    const FakeTransactionSender sender;
    const auto contract = makeAddressFromSuffix("registry");
    adapters::RegistryClient registry(adapters::RegistryClientConfig{.contract_address = contract}, rpc, sender);

    const pipeline::RegistryEntry entry = sampleEntry();
    const auto written = registry.write(entry);
    ASSERT_TRUE(written.has_value());
    ASSERT_TRUE(written->has_value());
    EXPECT_EQ(**written, std::format("0x{:064x}", 1));

    ASSERT_EQ(sender.sent.size(), 1u);
    EXPECT_EQ(sender.sent[0].to, contract);
    EXPECT_EQ(sender.sent[0].value_wei, 0u);
    EXPECT_DOUBLE_EQ(sender.sent[0].gas_multiplier, 1.3);
    EXPECT_EQ(sender.sent[0].data, adapters::encodeStoreTweet(entry));
    EXPECT_EQ(sender.receipt_waits, 0u);

    const chain::Bytes & data = sender.sent[0].data;
    const std::string encoded(data.begin(), data.end());
    EXPECT_NE(encoded.find(LOCATOR), std::string::npos);
    EXPECT_NE(encoded.find("bafydata"), std::string::npos);
}

TEST_F(UnitTest, Adapters_Registry_WriteFailures)
{
    MockRpcNode node;
    node.fail_eth_call = true;
    const chain::RpcClient rpc("http://node", node.asRpcCall());

    // a failed existence probe does not block the write
    const FakeTransactionSender sender;
    adapters::RegistryClient registry(adapters::RegistryClientConfig{.contract_address = makeAddressFromSuffix("registry")}, rpc, sender);
    const auto written = registry.write(sampleEntry());
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(sender.sent.size(), 1u);

    FakeTransactionSender broke;
    broke.fail_send = true;
    adapters::RegistryClient unfunded(adapters::RegistryClientConfig{.contract_address = makeAddressFromSuffix("registry")}, rpc, broke);
    const auto send_failure = unfunded.write(sampleEntry());
    ASSERT_FALSE(send_failure.has_value());
    EXPECT_EQ(send_failure.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);

    FakeTransactionSender reverting;
    reverting.revert_receipt = true;
    adapters::RegistryClient waiting(adapters::RegistryClientConfig{.contract_address = makeAddressFromSuffix("registry"), .wait_for_receipt = true}, rpc, reverting);
    const auto reverted = waiting.write(sampleEntry());
    ASSERT_FALSE(reverted.has_value());
    EXPECT_EQ(reverted.error().kind, pipeline::CollaboratorError::Kind::REJECTED);
    EXPECT_EQ(reverting.receipt_waits, 1u);
}

// ---------------------------------------------------------------------------------------------------------------------
// deposit

TEST_F(UnitTest, Adapters_Deposit_EncodesBackendResubmission)
{
    const auto backend = makeAddressFromSuffix("backend");
    const chain::Bytes data = adapters::encodeDepositCall(LOCATOR, backend);

    const auto selector = crypto::constructSelector(
        "depositIP("
            "address,string,bytes,address,"
            "(string,uint256,uint256,address,uint96),"
            "bytes32,"
            "(uint256,address,address,bool,uint256,bool,bool,uint256,uint256,bool,bool,bool,bool,uint256,string),"
            "(uint256,address,address,uint256,uint256,uint256),"
            "(string,address)[])");
    ASSERT_GT(data.size(), 4u + 32u);
    EXPECT_TRUE(std::equal(selector.begin(), selector.end(), data.begin()));

    const auto recipient_word = encodeAddressWord(backend);
    EXPECT_TRUE(std::equal(recipient_word.begin(), recipient_word.end(), data.begin() + 4));

    const std::string encoded(data.begin(), data.end());
    EXPECT_NE(encoded.find(LOCATOR), std::string::npos);

    const auto hash = crypto::contentHash(LOCATOR);
    const std::string hash_bytes(reinterpret_cast<const char*>(hash.bytes), sizeof(hash.bytes));
    EXPECT_NE(encoded.find(hash_bytes), std::string::npos);
}

TEST_F(UnitTest, Adapters_Deposit_SubmitSendsFee)
{
    const FakeTransactionSender sender;
    const auto contract = makeAddressFromSuffix("deposit");
    adapters::DepositSubmitter submitter(adapters::DepositSubmitterConfig{.contract_address = contract, .submission_fee_wei = 1'000'000}, sender);

    const auto tx_hash = submitter.submit(LOCATOR, 0.9);
    ASSERT_TRUE(tx_hash.has_value());
    EXPECT_EQ(*tx_hash, std::format("0x{:064x}", 1));

    ASSERT_EQ(sender.sent.size(), 1u);
    EXPECT_EQ(sender.sent[0].to, contract);
    EXPECT_EQ(sender.sent[0].value_wei, 1'000'000u);
    EXPECT_EQ(sender.sent[0].data, adapters::encodeDepositCall(LOCATOR, sender.sender));

    FakeTransactionSender broke;
    broke.fail_send = true;
    adapters::DepositSubmitter failing(adapters::DepositSubmitterConfig{.contract_address = contract}, broke);
    const auto failed = failing.submit(LOCATOR, 0.9);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, pipeline::CollaboratorError::Kind::UNAVAILABLE);
}
