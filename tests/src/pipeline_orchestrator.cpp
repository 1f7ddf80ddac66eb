#include "unit-tests.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "fixtures.hpp"

using namespace tad;
using namespace tad::tests;

namespace
{
    constexpr const char* LOCATOR = "https://x.com/satoshi/status/1700000000000000000";

    pipeline::CollaboratorError unavailable(const std::string & message)
    {
        return pipeline::CollaboratorError{.kind = pipeline::CollaboratorError::Kind::UNAVAILABLE, .message = message};
    }

    class FakeFetcher final : public pipeline::IContentFetcher
    {
    public:
        bool fail = false;
        std::vector<std::string> locators;

        pipeline::Outcome<pipeline::FetchedContent> fetch(const std::string & locator) override
        {
            locators.push_back(locator);
            if(fail)
            {
                return std::unexpected(pipeline::CollaboratorError{.kind = pipeline::CollaboratorError::Kind::NOT_FOUND, .message = "tweet deleted"});
            }
            return pipeline::FetchedContent{
                .url = "",
                .tweet_id = "1700000000000000000",
                .body = "$FLR to the moon, this is not a rug",
                .author = "Satoshi",
                .handle = "@satoshi",
                .verified = true,
                .likes = 1'204,
                .retweets = 12,
                .replies = 3,
                .captured_at = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'100)),
                .screenshot_url = "https://gateway.pinata.cloud/ipfs/bafyshot"
            };
        }
    };

    class FakeRemovalScorer final : public pipeline::IRemovalRiskScorer
    {
    public:
        std::optional<double> score;

        pipeline::Outcome<pipeline::RemovalRisk> scoreRemovalRisk(const std::string &) override
        {
            if(!score)
            {
                return std::unexpected(unavailable("no api key"));
            }
            return pipeline::RemovalRisk{.score = *score, .analysis = "inflammatory"};
        }
    };

    class FakeSentimentScorer final : public pipeline::ISentimentScorer
    {
    public:
        std::optional<double> controversy;
        bool throws = false;

        pipeline::Outcome<pipeline::SentimentScore> scoreSentiment(const std::string &) override
        {
            if(throws)
            {
                throw std::runtime_error("model crashed");
            }
            if(!controversy)
            {
                return std::unexpected(unavailable("model loading"));
            }
            return pipeline::SentimentScore{.label = "negative", .controversy = *controversy};
        }
    };

    class FakeClassifier final : public pipeline::IEcosystemClassifier
    {
    public:
        std::string token = "FLR";

        pipeline::Outcome<pipeline::EcosystemLabel> classify(const std::string &) override
        {
            return pipeline::EcosystemLabel{.token = token, .confidence = 0.5, .chain = "Flare"};
        }
    };

    class FakeStorage final : public pipeline::IStorage
    {
    public:
        bool fail = false;
        std::vector<std::filesystem::path> stored;

        pipeline::Outcome<pipeline::StorageReceipt> store(const std::filesystem::path & local_path) override
        {
            if(fail)
            {
                return std::unexpected(unavailable("storacha bridge unreachable"));
            }
            EXPECT_TRUE(std::filesystem::exists(local_path));
            stored.push_back(local_path);
            return pipeline::StorageReceipt{
                .data_cid = "bafydata",
                .root_cid = "bafyroot",
                .car_cid = "bagcar",
                .deal_id = std::string("42")
            };
        }
    };

    class FakeRegistry final : public pipeline::IRegistry
    {
    public:
        bool present = false;
        bool fail_write = false;
        std::vector<pipeline::RegistryEntry> writes;

        pipeline::Outcome<bool> exists(const evmc::bytes32 &) override
        {
            return present;
        }

        pipeline::Outcome<std::optional<std::string>> write(const pipeline::RegistryEntry & entry) override
        {
            if(fail_write)
            {
                return std::unexpected(pipeline::CollaboratorError{.kind = pipeline::CollaboratorError::Kind::REJECTED, .message = "reverted"});
            }
            writes.push_back(entry);
            return std::optional<std::string>("0xregistered");
        }
    };

    class FakeResubmitter final : public pipeline::IResubmitter
    {
    public:
        bool fail = false;
        std::vector<std::pair<std::string, double>> submissions;

        pipeline::Outcome<std::string> submit(const std::string & locator, double score) override
        {
            if(fail)
            {
                return std::unexpected(unavailable("out of gas"));
            }
            submissions.emplace_back(locator, score);
            return std::string("0xresubmitted");
        }
    };

    class FixedPriceSource final : public price::IPriceSource
    {
    public:
        std::string_view name() const override
        {
            return "FTSO";
        }

        price::SourceResult<double> fetchPrice(const std::string &) const override
        {
            return 0.0213;
        }
    };

    chain::SubmissionEvent makeEvent(const std::string & validation, std::uint64_t block_number = 100)
    {
        chain::SubmissionEvent event;
        event.block_number = block_number;
        event.transaction_hash = hexPrefixed(crypto::keccak256(validation));
        event.log_index = 0;
        event.content_hash = crypto::contentHash(validation);
        event.depositor = makeAddressFromSuffix("depositor");
        event.recipient = makeAddressFromSuffix("recipient");
        event.validation = validation;
        event.emitted_at = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));
        return event;
    }

    /**
     * @brief Full set of fakes wired into an orchestrator writing under a fresh directory.
     */
    struct PipelineHarness
    {
        explicit PipelineHarness(const std::string & test_name)
            : dir(makeStoragePath("orchestrator", test_name))
        {
            removal.score = 0.9;
            sentiment.controversy = 0.65;

            std::vector<std::unique_ptr<price::IPriceSource>> sources;
            sources.push_back(std::make_unique<FixedPriceSource>());
            prices = std::make_unique<price::PriceResolver>(std::move(sources));
        }

        std::unique_ptr<pipeline::Orchestrator> make(bool with_registry = true, bool with_resubmitter = true)
        {
            return std::make_unique<pipeline::Orchestrator>(
                pipeline::Collaborators{
                    .fetcher = &fetcher,
                    .removal_scorer = &removal,
                    .sentiment_scorer = &sentiment,
                    .classifier = &classifier,
                    .prices = prices.get(),
                    .storage = &storage,
                    .registry = with_registry ? &registry : nullptr,
                    .resubmitter = with_resubmitter ? &resubmitter : nullptr
                },
                pipeline::OrchestratorConfig{
                    .records_path = dir / "records",
                    .ledger_path = dir / "resubmitted.json",
                    .resubmission_threshold = 0.75,
                    .stats_every = 0,
                    .clock = [] { return std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'500)); }
                });
        }

        std::filesystem::path dir;
        FakeFetcher fetcher;
        FakeRemovalScorer removal;
        FakeSentimentScorer sentiment;
        FakeClassifier classifier;
        std::unique_ptr<price::PriceResolver> prices;
        FakeStorage storage;
        FakeRegistry registry;
        FakeResubmitter resubmitter;
    };
}

TEST_F(UnitTest, Pipeline_Orchestrator_InvalidLocatorAbortsBeforeFetch)
{
    PipelineHarness harness("invalid_locator");
    auto orchestrator = harness.make();

    EXPECT_EQ(orchestrator->process(makeEvent("https://example.com/not/a/tweet")), pipeline::ProcessResult::ABORTED);
    EXPECT_TRUE(harness.fetcher.locators.empty());
    EXPECT_EQ(orchestrator->stats().errored, 1u);
    EXPECT_EQ(orchestrator->stats().processed, 0u);
}

TEST_F(UnitTest, Pipeline_Orchestrator_HighScoreIsStoredRegisteredAndResubmittedOnce)
{
    PipelineHarness harness("high_score");
    auto orchestrator = harness.make();

    ASSERT_EQ(orchestrator->process(makeEvent(LOCATOR)), pipeline::ProcessResult::COMPLETED);

    ASSERT_EQ(harness.fetcher.locators.size(), 1u);
    EXPECT_EQ(harness.fetcher.locators[0], LOCATOR);
    EXPECT_EQ(harness.storage.stored.size(), 1u);
    ASSERT_EQ(harness.registry.writes.size(), 1u);
    ASSERT_EQ(harness.resubmitter.submissions.size(), 1u);
    EXPECT_EQ(harness.resubmitter.submissions[0].first, LOCATOR);
    EXPECT_NEAR(harness.resubmitter.submissions[0].second, 0.80, 1e-9);

    const pipeline::PipelineStats & stats = orchestrator->stats();
    EXPECT_EQ(stats.processed, 1u);
    EXPECT_EQ(stats.stored, 1u);
    EXPECT_EQ(stats.registered, 1u);
    EXPECT_EQ(stats.resubmitted, 1u);
    EXPECT_EQ(stats.errored, 0u);

    const pipeline::RegistryEntry & entry = harness.registry.writes[0];
    EXPECT_EQ(entry.content_hash, crypto::contentHash(LOCATOR));
    EXPECT_EQ(entry.url, LOCATOR);
    EXPECT_EQ(entry.likes, 1'204u);
    // percent fields truncate 0.9 and the 0.80 combined score
    EXPECT_GE(entry.removal_pct, 89u);
    EXPECT_LE(entry.removal_pct, 90u);
    EXPECT_GE(entry.controversy_pct, 79u);
    EXPECT_LE(entry.controversy_pct, 80u);
    EXPECT_EQ(entry.screenshot_cid, "bafyshot");
    EXPECT_EQ(entry.data_cid, "bafydata");
    EXPECT_EQ(entry.root_cid, "bafyroot");
    EXPECT_EQ(entry.deal_id, "42");
    EXPECT_EQ(entry.ecosystem, "FLR");
    EXPECT_EQ(entry.submitter, makeAddressFromSuffix("depositor"));
}

TEST_F(UnitTest, Pipeline_Orchestrator_PersistsRecordWithAnalysisAndPrice)
{
    PipelineHarness harness("record");
    auto orchestrator = harness.make();

    ASSERT_EQ(orchestrator->process(makeEvent(LOCATOR)), pipeline::ProcessResult::COMPLETED);

    const auto files = orchestrator->records().list();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_TRUE(files[0].filename().string().starts_with("tweet_20231114_"));

    const auto record = orchestrator->records().load(files[0]);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->content_hash(), hexPrefixed(crypto::contentHash(LOCATOR)));
    EXPECT_EQ(record->tweet().url(), LOCATOR);
    EXPECT_EQ(record->tweet().handle(), "@satoshi");
    EXPECT_EQ(record->tweet().metrics().likes(), 1'204u);
    EXPECT_NEAR(record->analysis().combined_score(), 0.80, 1e-9);
    EXPECT_NEAR(record->analysis().removal_risk(), 0.9, 1e-9);
    EXPECT_EQ(record->analysis().ecosystem().token(), "FLR");
    EXPECT_EQ(record->price().source(), "FTSO");
    EXPECT_TRUE(record->price().success());
    EXPECT_EQ(record->submission().block_number(), 100u);
}

TEST_F(UnitTest, Pipeline_Orchestrator_AlreadyRegisteredSkipsWriteAndResubmission)
{
    PipelineHarness harness("already_registered");
    harness.registry.present = true;
    auto orchestrator = harness.make();

    EXPECT_EQ(orchestrator->process(makeEvent(LOCATOR)), pipeline::ProcessResult::COMPLETED);
    EXPECT_TRUE(harness.registry.writes.empty());
    EXPECT_TRUE(harness.resubmitter.submissions.empty());
    EXPECT_EQ(orchestrator->stats().registered, 0u);
}

TEST_F(UnitTest, Pipeline_Orchestrator_StorageFailureAbortsEvent)
{
    PipelineHarness harness("storage_failure");
    harness.storage.fail = true;
    auto orchestrator = harness.make();

    EXPECT_EQ(orchestrator->process(makeEvent(LOCATOR)), pipeline::ProcessResult::ABORTED);
    EXPECT_TRUE(harness.registry.writes.empty());
    EXPECT_TRUE(harness.resubmitter.submissions.empty());
    EXPECT_EQ(orchestrator->stats().processed, 1u);
    EXPECT_EQ(orchestrator->stats().stored, 0u);
    EXPECT_EQ(orchestrator->stats().errored, 1u);

    // the local copy is kept
    EXPECT_EQ(orchestrator->records().list().size(), 1u);
}

TEST_F(UnitTest, Pipeline_Orchestrator_FetchFailureAbortsEvent)
{
    PipelineHarness harness("fetch_failure");
    harness.fetcher.fail = true;
    auto orchestrator = harness.make();

    EXPECT_EQ(orchestrator->process(makeEvent(LOCATOR)), pipeline::ProcessResult::ABORTED);
    EXPECT_TRUE(harness.storage.stored.empty());
    EXPECT_TRUE(orchestrator->records().list().empty());
    EXPECT_EQ(orchestrator->stats().errored, 1u);
}

TEST_F(UnitTest, Pipeline_Orchestrator_SecondProcessingDoesNotResubmitAgain)
{
    PipelineHarness harness("one_shot");
    auto orchestrator = harness.make();

    EXPECT_EQ(orchestrator->process(makeEvent(LOCATOR, 100)), pipeline::ProcessResult::COMPLETED);
    EXPECT_EQ(orchestrator->process(makeEvent(LOCATOR, 101)), pipeline::ProcessResult::COMPLETED);

    EXPECT_EQ(harness.resubmitter.submissions.size(), 1u);
    EXPECT_EQ(orchestrator->stats().resubmitted, 1u);
}

TEST_F(UnitTest, Pipeline_Orchestrator_ResubmissionLedgerSurvivesRestart)
{
    PipelineHarness harness("restart");
    {
        auto first = harness.make();
        EXPECT_EQ(first->process(makeEvent(LOCATOR)), pipeline::ProcessResult::COMPLETED);
    }
    {
        auto second = harness.make();
        EXPECT_EQ(second->process(makeEvent(LOCATOR)), pipeline::ProcessResult::COMPLETED);
        EXPECT_EQ(second->stats().resubmitted, 0u);
    }
    EXPECT_EQ(harness.resubmitter.submissions.size(), 1u);
}

TEST_F(UnitTest, Pipeline_Orchestrator_LowScoreIsNotResubmitted)
{
    PipelineHarness harness("low_score");
    harness.removal.score = 0.2;
    harness.sentiment.controversy = 0.3;
    auto orchestrator = harness.make();

    EXPECT_EQ(orchestrator->process(makeEvent(LOCATOR)), pipeline::ProcessResult::COMPLETED);
    EXPECT_TRUE(harness.resubmitter.submissions.empty());
    EXPECT_EQ(harness.registry.writes.size(), 1u);
}

TEST_F(UnitTest, Pipeline_Orchestrator_ScorerFailuresDegradeToZeroScore)
{
    PipelineHarness harness("scorers_down");
    harness.removal.score.reset();
    harness.sentiment.throws = true;
    auto orchestrator = harness.make();

    EXPECT_EQ(orchestrator->process(makeEvent(LOCATOR)), pipeline::ProcessResult::COMPLETED);
    EXPECT_TRUE(harness.resubmitter.submissions.empty());

    const auto files = orchestrator->records().list();
    ASSERT_EQ(files.size(), 1u);
    const auto record = orchestrator->records().load(files[0]);
    ASSERT_TRUE(record.has_value());
    EXPECT_DOUBLE_EQ(record->analysis().combined_score(), 0.0);
    EXPECT_FALSE(record->analysis().has_removal_risk());
}

TEST_F(UnitTest, Pipeline_Orchestrator_RegistryFailureIsCountedButEventCompletes)
{
    PipelineHarness harness("registry_failure");
    harness.registry.fail_write = true;
    auto orchestrator = harness.make();

    EXPECT_EQ(orchestrator->process(makeEvent(LOCATOR)), pipeline::ProcessResult::COMPLETED);
    EXPECT_EQ(orchestrator->stats().errored, 1u);
    EXPECT_EQ(orchestrator->stats().registered, 0u);
    EXPECT_EQ(harness.resubmitter.submissions.size(), 1u);
}

TEST_F(UnitTest, Pipeline_Orchestrator_OptionalStagesMayBeAbsent)
{
    PipelineHarness harness("minimal");
    auto orchestrator = harness.make(false, false);

    EXPECT_EQ(orchestrator->process(makeEvent(LOCATOR)), pipeline::ProcessResult::COMPLETED);
    EXPECT_EQ(orchestrator->stats().stored, 1u);
    EXPECT_EQ(orchestrator->stats().registered, 0u);
    EXPECT_EQ(orchestrator->stats().resubmitted, 0u);
    EXPECT_EQ(orchestrator->stats().errored, 0u);
}
