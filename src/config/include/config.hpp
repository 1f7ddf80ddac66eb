#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <optional>
#include <string>

#include "retry.hpp"

namespace tad::config
{
    struct ConfigError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            MISSING_REQUIRED,
            INVALID_VALUE,
            IO_ERROR
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    template<class T>
    using Result = std::expected<T, ConfigError>;

    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;
        std::filesystem::path data_path;
        std::filesystem::path records_path;
        std::filesystem::path checkpoint_file;
        std::filesystem::path ledger_file;
    };

    struct ChainConfig
    {
        std::string rpc_url = "https://api.node.glif.io/rpc/v1";
        std::string deposit_contract;
        std::string registry_contract;
        std::string private_key;
        std::uint64_t chain_id = 314;
        std::uint64_t confirmations = 0;
        std::uint64_t lookback = 100;
    };

    struct PollingConfig
    {
        std::chrono::seconds interval{30};
        std::uint64_t max_block_span = 1000;
        std::size_t stats_every = 10;
    };

    struct PipelineConfig
    {
        double resubmission_threshold = 0.75;
        std::uint64_t submission_fee_wei = 0;
    };

    struct PriceConfig
    {
        std::chrono::seconds cache_ttl{60};
        std::chrono::milliseconds batch_delay{100};
        std::string coingecko_api_key;
        std::string binance_api_key;
        std::string ftso_rpc_url = "https://coston2-api.flare.network/ext/C/rpc";
        std::string ftso_contract;
    };

    struct AiConfig
    {
        std::string openai_api_key;
        std::string openai_model = "gpt-4";
        std::string huggingface_api_key;
        std::string financial_model = "ProsusAI/finbert";
        std::string social_model = "cardiffnlp/twitter-roberta-base-sentiment-latest";
    };

    struct StorageConfig
    {
        std::string pinata_jwt;
        std::string space_did;
        std::string bridge_url = "https://up.storacha.network/bridge";
    };

    struct DaemonConfig
    {
        Config paths;
        ChainConfig chain;
        PollingConfig polling;
        PipelineConfig pipeline;
        PriceConfig price;
        AiConfig ai;
        StorageConfig storage;

        std::string scraper_command = "python3 twitter_scraper_undetected.py";
        std::string log_level = "info";

        std::chrono::seconds http_timeout{15};

        // scraper and local ipfs/w3 tools
        std::chrono::seconds process_timeout{180};
        net::RetryPolicy retry{};
    };

    /**
     * @brief Default layout relative to the executable: <root>/logs, <root>/data, <root>/data/records.
     */
    DaemonConfig makeDefaultConfig(const std::filesystem::path & bin_path);

    using EnvLookup = std::function<std::optional<std::string>(const std::string & name)>;

    /**
     * @brief Reads the process environment.
     */
    std::optional<std::string> processEnvironment(const std::string & name);

    /**
     * @brief Overrides `cfg` with recognised environment variables. Empty values are ignored.
     */
    Result<void> loadFromEnvironment(DaemonConfig & cfg, const EnvLookup & lookup = processEnvironment);

    /**
     * @brief Checks required settings and numeric ranges.
     */
    Result<void> validate(const DaemonConfig & cfg);

    /**
     * @brief Creates the data and records directories and the parents of the checkpoint and ledger files.
     *
     * Stops at the first directory that cannot be created.
     */
    Result<void> prepareDirectories(const DaemonConfig & cfg);
}

template <>
struct std::formatter<tad::config::ConfigError::Kind> : std::formatter<std::string>
{
    auto format(const tad::config::ConfigError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case tad::config::ConfigError::Kind::MISSING_REQUIRED:
                return formatter<string>::format("Missing required", ctx);
            case tad::config::ConfigError::Kind::INVALID_VALUE:
                return formatter<string>::format("Invalid value", ctx);
            case tad::config::ConfigError::Kind::IO_ERROR:
                return formatter<string>::format("I/O error", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
