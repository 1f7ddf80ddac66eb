#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>

#include <spdlog/spdlog.h>

#include "address.hpp"
#include "hex.hpp"
#include "utils.hpp"

namespace tad::config
{
    namespace
    {
        ConfigError _invalid(const std::string & name, const std::string & value)
        {
            return ConfigError{
                .kind = ConfigError::Kind::INVALID_VALUE,
                .message = std::format("{}='{}' is not a valid value", name, value)
            };
        }

        template<class T>
        std::optional<T> _parseNumber(const std::string & text)
        {
            T value{};
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if(ec != std::errc() || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        std::optional<std::string> _lookup(const EnvLookup & lookup, const std::string & name)
        {
            auto value = lookup(name);
            if(!value)
            {
                return std::nullopt;
            }
            std::string trimmed = utils::trim(*value);
            if(trimmed.empty())
            {
                return std::nullopt;
            }
            return trimmed;
        }

        void _readString(const EnvLookup & lookup, const std::string & name, std::string & target)
        {
            if(auto value = _lookup(lookup, name))
            {
                target = std::move(*value);
            }
        }

        void _readPath(const EnvLookup & lookup, const std::string & name, std::filesystem::path & target)
        {
            if(auto value = _lookup(lookup, name))
            {
                target = std::filesystem::path(*value);
            }
        }

        template<class T>
        Result<void> _readNumber(const EnvLookup & lookup, const std::string & name, T & target)
        {
            const auto value = _lookup(lookup, name);
            if(!value)
            {
                return {};
            }

            const auto parsed = _parseNumber<T>(*value);
            if(!parsed)
            {
                return std::unexpected(_invalid(name, *value));
            }
            target = *parsed;
            return {};
        }
    }

    DaemonConfig makeDefaultConfig(const std::filesystem::path & bin_path)
    {
        DaemonConfig cfg;
        cfg.paths.bin_path = bin_path;
        cfg.paths.logs_path = bin_path.parent_path() / "logs";
        cfg.paths.data_path = bin_path.parent_path() / "data";
        cfg.paths.records_path = cfg.paths.data_path / "records";
        cfg.paths.checkpoint_file = cfg.paths.data_path / "last_block.txt";
        cfg.paths.ledger_file = cfg.paths.data_path / "resubmitted.json";
        return cfg;
    }

    std::optional<std::string> processEnvironment(const std::string & name)
    {
        const char* value = std::getenv(name.c_str());
        if(value == nullptr)
        {
            return std::nullopt;
        }
        return std::string(value);
    }

    Result<void> loadFromEnvironment(DaemonConfig & cfg, const EnvLookup & lookup)
    {
        // data dir first, derived paths follow it unless overridden explicitly
        if(auto data_dir = _lookup(lookup, "DATA_DIR"))
        {
            cfg.paths.data_path = std::filesystem::path(*data_dir);
            cfg.paths.records_path = cfg.paths.data_path / "records";
            cfg.paths.checkpoint_file = cfg.paths.data_path / "last_block.txt";
            cfg.paths.ledger_file = cfg.paths.data_path / "resubmitted.json";
        }
        _readPath(lookup, "TWEETS_DIR", cfg.paths.records_path);
        _readPath(lookup, "LAST_BLOCK_FILE", cfg.paths.checkpoint_file);

        _readString(lookup, "FILECOIN_MAINNET_RPC", cfg.chain.rpc_url);
        _readString(lookup, "IP_DEPOSIT_CONTRACT", cfg.chain.deposit_contract);
        _readString(lookup, "TWEET_REGISTRY_CONTRACT", cfg.chain.registry_contract);
        _readString(lookup, "FILECOIN_PRIVATE_KEY", cfg.chain.private_key);

        if(auto res = _readNumber(lookup, "CHAIN_ID", cfg.chain.chain_id); !res) return res;
        if(auto res = _readNumber(lookup, "CONFIRMATIONS", cfg.chain.confirmations); !res) return res;

        std::int64_t poll_interval = cfg.polling.interval.count();
        if(auto res = _readNumber(lookup, "POLL_INTERVAL", poll_interval); !res) return res;
        cfg.polling.interval = std::chrono::seconds(poll_interval);

        if(auto res = _readNumber(lookup, "MAX_BLOCK_RANGE", cfg.polling.max_block_span); !res) return res;

        if(auto threshold = _lookup(lookup, "AUTO_SUBMIT_THRESHOLD"))
        {
            const auto parsed = _parseNumber<double>(*threshold);
            if(!parsed)
            {
                return std::unexpected(_invalid("AUTO_SUBMIT_THRESHOLD", *threshold));
            }
            cfg.pipeline.resubmission_threshold = *parsed;
        }
        if(auto res = _readNumber(lookup, "SUBMISSION_FEE_WEI", cfg.pipeline.submission_fee_wei); !res) return res;

        _readString(lookup, "COINGECKO_API_KEY", cfg.price.coingecko_api_key);
        _readString(lookup, "BINANCE_API_KEY", cfg.price.binance_api_key);
        _readString(lookup, "COSTON2_RPC_URL", cfg.price.ftso_rpc_url);
        _readString(lookup, "FTSO_CONSUMER_ADDRESS", cfg.price.ftso_contract);

        _readString(lookup, "OPEN_AI_API_KEY", cfg.ai.openai_api_key);
        _readString(lookup, "OPENAI_MODEL", cfg.ai.openai_model);
        _readString(lookup, "HUGGINGFACE_API_KEY", cfg.ai.huggingface_api_key);

        _readString(lookup, "PINATA_JWT", cfg.storage.pinata_jwt);
        _readString(lookup, "W3UP_SPACE_DID", cfg.storage.space_did);

        _readString(lookup, "SCRAPER_COMMAND", cfg.scraper_command);

        std::int64_t process_timeout = cfg.process_timeout.count();
        if(auto res = _readNumber(lookup, "PROCESS_TIMEOUT", process_timeout); !res) return res;
        cfg.process_timeout = std::chrono::seconds(process_timeout);

        if(auto level = _lookup(lookup, "LOG_LEVEL"))
        {
            cfg.log_level = utils::toLower(*level);
        }
        return {};
    }

    Result<void> validate(const DaemonConfig & cfg)
    {
        if(cfg.chain.rpc_url.empty())
        {
            return std::unexpected(ConfigError{
                .kind = ConfigError::Kind::MISSING_REQUIRED,
                .message = "RPC URL is required (FILECOIN_MAINNET_RPC)"
            });
        }

        if(cfg.chain.deposit_contract.empty())
        {
            return std::unexpected(ConfigError{
                .kind = ConfigError::Kind::MISSING_REQUIRED,
                .message = "deposit contract address is required (IP_DEPOSIT_CONTRACT)"
            });
        }
        if(!chain::parseAddress(cfg.chain.deposit_contract))
        {
            return std::unexpected(_invalid("IP_DEPOSIT_CONTRACT", cfg.chain.deposit_contract));
        }

        if(!cfg.chain.registry_contract.empty() && !chain::parseAddress(cfg.chain.registry_contract))
        {
            return std::unexpected(_invalid("TWEET_REGISTRY_CONTRACT", cfg.chain.registry_contract));
        }
        if(!cfg.price.ftso_contract.empty() && !chain::parseAddress(cfg.price.ftso_contract))
        {
            return std::unexpected(_invalid("FTSO_CONSUMER_ADDRESS", cfg.price.ftso_contract));
        }

        if(!cfg.chain.private_key.empty())
        {
            const auto key = chain::hexToBytes(cfg.chain.private_key);
            if(!key || key->size() != 32)
            {
                return std::unexpected(ConfigError{
                    .kind = ConfigError::Kind::INVALID_VALUE,
                    .message = "FILECOIN_PRIVATE_KEY must be 32 bytes of hex"
                });
            }
        }

        if(cfg.polling.interval.count() <= 0)
        {
            return std::unexpected(_invalid("POLL_INTERVAL", std::to_string(cfg.polling.interval.count())));
        }
        if(cfg.polling.max_block_span == 0)
        {
            return std::unexpected(_invalid("MAX_BLOCK_RANGE", "0"));
        }
        if(cfg.pipeline.resubmission_threshold < 0.0 || cfg.pipeline.resubmission_threshold > 1.0)
        {
            return std::unexpected(_invalid("AUTO_SUBMIT_THRESHOLD", std::to_string(cfg.pipeline.resubmission_threshold)));
        }
        if(cfg.price.cache_ttl.count() < 0)
        {
            return std::unexpected(_invalid("price cache TTL", std::to_string(cfg.price.cache_ttl.count())));
        }
        if(cfg.http_timeout.count() <= 0)
        {
            return std::unexpected(_invalid("HTTP timeout", std::to_string(cfg.http_timeout.count())));
        }
        if(cfg.process_timeout.count() <= 0)
        {
            return std::unexpected(_invalid("PROCESS_TIMEOUT", std::to_string(cfg.process_timeout.count())));
        }
        if(cfg.retry.max_attempts == 0)
        {
            return std::unexpected(_invalid("retry attempts", "0"));
        }

        if(cfg.scraper_command.empty())
        {
            spdlog::warn("No scraper command configured, every event will fail at fetch");
        }
        return {};
    }

    Result<void> prepareDirectories(const DaemonConfig & cfg)
    {
        for(const std::filesystem::path & dir : {
            cfg.paths.data_path,
            cfg.paths.records_path,
            cfg.paths.checkpoint_file.parent_path(),
            cfg.paths.ledger_file.parent_path()})
        {
            if(dir.empty())
            {
                continue;
            }

            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if(ec)
            {
                return std::unexpected(ConfigError{
                    .kind = ConfigError::Kind::IO_ERROR,
                    .message = std::format("cannot create {}: {}", dir.string(), ec.message())
                });
            }
        }
        return {};
    }
}
