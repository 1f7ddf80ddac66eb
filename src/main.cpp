#include "tweet_archive_daemon.hpp"

static void _configureLogger(const std::filesystem::path & logs_path, const std::string & console_level)
{
    std::filesystem::create_directories(logs_path);

    // Create sinks
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    const std::string log_name = tad::utils::currentTimestamp() + "-TweetArchiveDaemon.log";
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (logs_path / log_name).string(), true);

    // set different log levels per sink
    console_sink->set_level(spdlog::level::from_str(console_level));
    file_sink->set_level(spdlog::level::debug);
    console_sink->set_pattern("[%T] [%^%l%$] %v");
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

    spdlog::logger logger("multi_sink", {console_sink, file_sink});
    logger.set_level(spdlog::level::debug);
    logger.flush_on(spdlog::level::info);

    spdlog::set_default_logger(std::make_shared<spdlog::logger>(logger));
}

static int _listRecords(const tad::pipeline::RecordStore & records)
{
    const auto paths = records.list();
    spdlog::info("{} record(s) in {}", paths.size(), records.directory().string());

    for(const auto & path : paths)
    {
        const auto record = records.load(path);
        if(!record)
        {
            spdlog::warn("{}: {}", path.filename().string(), record.error().message);
            continue;
        }
        spdlog::info("{} | {} | @{} | score {:.2f} | {}",
            path.filename().string(), record->stored_at(), record->tweet().handle(),
            record->analysis().combined_score(), record->tweet().url());
    }
    return 0;
}

int main(int argc, char* argv[])
{
    const std::filesystem::path bin_path = std::filesystem::absolute(std::filesystem::path(argv[0])).parent_path();
    tad::config::DaemonConfig cfg = tad::config::makeDefaultConfig(bin_path);

    tad::cmd::ArgParser arg_parser;
    arg_parser.addArg("-h", tad::cmd::CommandLineArgDef::NArgs::Zero, tad::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--help", tad::cmd::CommandLineArgDef::NArgs::Zero, tad::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--version", tad::cmd::CommandLineArgDef::NArgs::Zero, tad::cmd::CommandLineArgDef::Type::Bool, "Display version and exit");
    arg_parser.addArg("--once", tad::cmd::CommandLineArgDef::NArgs::Zero, tad::cmd::CommandLineArgDef::Type::Bool, "Run a single poll cycle and exit");
    arg_parser.addArg("--test-event", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::String, "Process one synthetic submission for the given tweet URL and exit");
    arg_parser.addArg("--list-records", tad::cmd::CommandLineArgDef::NArgs::Zero, tad::cmd::CommandLineArgDef::Type::Bool, "List locally stored records and exit");
    arg_parser.addArg("--rpc", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::String, "JSON-RPC endpoint of the ledger");
    arg_parser.addArg("--deposit-contract", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::String, "Address emitting DepositProcessed events");
    arg_parser.addArg("--registry-contract", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::String, "Tweet registry address");
    arg_parser.addArg("--poll-interval", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::Int, "Seconds between poll cycles");
    arg_parser.addArg("--max-block-range", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::Int, "Max number of blocks per eth_getLogs request");
    arg_parser.addArg("--confirmations", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::Int, "Finality confirmation depth");
    arg_parser.addArg("--threshold", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::Float, "Combined score at which a tweet is resubmitted");
    arg_parser.addArg("--http-timeout", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::Int, "Timeout of outbound calls in seconds");
    arg_parser.addArg("--process-timeout", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::Int, "Timeout of scraper and local tool runs in seconds");
    arg_parser.addArg("--retry-attempts", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::Int, "Attempts per outbound call, 1 disables retries");
    arg_parser.addArg("--retry-backoff-ms", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::Int, "Initial retry backoff in milliseconds");
    arg_parser.addArg("--log-level", tad::cmd::CommandLineArgDef::NArgs::One, tad::cmd::CommandLineArgDef::Type::String, "Console log level (trace, debug, info, warn, error)");

    const auto arg_diagnostics = arg_parser.parse(argc, argv);

    const auto env_res = tad::config::loadFromEnvironment(cfg);

    if(const auto level = arg_parser.getArg<std::vector<std::string>>("--log-level"))
    {
        cfg.log_level = tad::utils::toLower(level->at(0));
    }

    const bool terminal_configured = tad::native::configureTerminal();
    _configureLogger(cfg.paths.logs_path, cfg.log_level);

    if(!terminal_configured)
    {
        std::printf("%s", tad::utils::getLogo(tad::utils::LogoASCII).c_str());
        std::fflush(stdout);
        spdlog::warn("Terminal configuration was not fully applied");
    }
    else
    {
        std::printf("%s", tad::utils::getLogo(tad::utils::LogoUnicode).c_str());
        std::fflush(stdout);
        spdlog::debug("Terminal configuration applied successfully");
    }

    const std::string build_timestamp = tad::utils::loadBuildTimestamp(cfg.paths.bin_path / "build_timestamp");
    spdlog::debug("Build timestamp: {}", build_timestamp);
    spdlog::debug("Version: {}.{}.{}", tad::MAJOR_VERSION, tad::MINOR_VERSION, tad::PATCH_VERSION);

    spdlog::debug("Tweet archive daemon started with {} arguments", argc);
    for(int i = 0; i < argc; ++i)
    {
        spdlog::debug("Argument at [{}] : {}", i, argv[i]);
    }

    for(const std::string & diagnostic : arg_diagnostics)
    {
        spdlog::warn("Command line: {}", diagnostic);
    }

    if(arg_parser.getArg<bool>("--version").value_or(false))
    {
        spdlog::info("Tweet archive daemon build timestamp: {}", build_timestamp);
        spdlog::info("Version: {}.{}.{}", tad::MAJOR_VERSION, tad::MINOR_VERSION, tad::PATCH_VERSION);
        return 0;
    }

    if(arg_parser.getArg<bool>("--help").value_or(false) || arg_parser.getArg<bool>("-h").value_or(false))
    {
        spdlog::info(arg_parser.constructHelpMessage());
        return 0;
    }

    if(!env_res)
    {
        spdlog::error("Configuration error ({}): {}", std::format("{}", env_res.error().kind), env_res.error().message);
        return 1;
    }

    if(const auto rpc = arg_parser.getArg<std::vector<std::string>>("--rpc"))                         cfg.chain.rpc_url = rpc->at(0);
    if(const auto deposit = arg_parser.getArg<std::vector<std::string>>("--deposit-contract"))        cfg.chain.deposit_contract = deposit->at(0);
    if(const auto registry = arg_parser.getArg<std::vector<std::string>>("--registry-contract"))      cfg.chain.registry_contract = registry->at(0);
    if(const auto threshold = arg_parser.getArg<std::vector<float>>("--threshold"))                   cfg.pipeline.resubmission_threshold = threshold->at(0);

    const int poll_interval_arg = arg_parser.getArg<std::vector<int>>("--poll-interval").value_or(std::vector<int>{static_cast<int>(cfg.polling.interval.count())}).at(0);
    const int max_block_range_arg = arg_parser.getArg<std::vector<int>>("--max-block-range").value_or(std::vector<int>{static_cast<int>(cfg.polling.max_block_span)}).at(0);
    const int confirmations_arg = arg_parser.getArg<std::vector<int>>("--confirmations").value_or(std::vector<int>{static_cast<int>(cfg.chain.confirmations)}).at(0);
    const int http_timeout_arg = arg_parser.getArg<std::vector<int>>("--http-timeout").value_or(std::vector<int>{static_cast<int>(cfg.http_timeout.count())}).at(0);
    const int process_timeout_arg = arg_parser.getArg<std::vector<int>>("--process-timeout").value_or(std::vector<int>{static_cast<int>(cfg.process_timeout.count())}).at(0);
    const int retry_attempts_arg = arg_parser.getArg<std::vector<int>>("--retry-attempts").value_or(std::vector<int>{static_cast<int>(cfg.retry.max_attempts)}).at(0);
    const int retry_backoff_arg = arg_parser.getArg<std::vector<int>>("--retry-backoff-ms").value_or(std::vector<int>{static_cast<int>(cfg.retry.initial_backoff.count())}).at(0);

    if(poll_interval_arg <= 0 || max_block_range_arg <= 0 || confirmations_arg < 0 || http_timeout_arg <= 0 || process_timeout_arg <= 0 || retry_attempts_arg <= 0 || retry_backoff_arg < 0)
    {
        spdlog::error("Invalid numeric options");
        return 1;
    }

    cfg.polling.interval = std::chrono::seconds(poll_interval_arg);
    cfg.polling.max_block_span = static_cast<std::uint64_t>(max_block_range_arg);
    cfg.chain.confirmations = static_cast<std::uint64_t>(confirmations_arg);
    cfg.http_timeout = std::chrono::seconds(http_timeout_arg);
    cfg.process_timeout = std::chrono::seconds(process_timeout_arg);
    cfg.retry.max_attempts = static_cast<std::size_t>(retry_attempts_arg);
    cfg.retry.initial_backoff = std::chrono::milliseconds(retry_backoff_arg);

    const tad::pipeline::RecordStore record_store(cfg.paths.records_path);
    if(arg_parser.getArg<bool>("--list-records").value_or(false))
    {
        return _listRecords(record_store);
    }

    if(const auto valid = tad::config::validate(cfg); !valid)
    {
        spdlog::error("Configuration error ({}): {}", std::format("{}", valid.error().kind), valid.error().message);
        return 1;
    }

    if(const auto dirs = tad::config::prepareDirectories(cfg); !dirs)
    {
        spdlog::error("Configuration error ({}): {}", std::format("{}", dirs.error().kind), dirs.error().message);
        return 1;
    }

    spdlog::info("Current working path: {}", std::filesystem::current_path().string());
    spdlog::info("Data directory: {}", cfg.paths.data_path.string());

    const tad::net::http::RequestOptions http_options{
        .timeout = cfg.http_timeout,
        .retry = cfg.retry
    };
    const tad::chain::RpcCall rpc_call = tad::chain::makeHttpRpcCall(http_options);

    // validated above
    const tad::chain::Address deposit_address = *tad::chain::parseAddress(cfg.chain.deposit_contract);

    tad::chain::EventPoller poller(
        tad::chain::PollerConfig{
            .rpc_url = cfg.chain.rpc_url,
            .deposit_address = deposit_address,
            .max_block_span = cfg.polling.max_block_span,
            .confirmations = cfg.chain.confirmations
        },
        rpc_call);

    tad::chain::CheckpointStore checkpoint(cfg.paths.checkpoint_file, cfg.chain.lookback);

    // price sources in priority order
    std::vector<std::unique_ptr<tad::price::IPriceSource>> price_sources;
    price_sources.push_back(std::make_unique<tad::price::FtsoSource>(
        tad::price::FtsoConfig{
            .rpc_url = cfg.price.ftso_rpc_url,
            .contract_address = tad::chain::parseAddress(cfg.price.ftso_contract).value_or(tad::chain::Address{})
        },
        rpc_call));
    price_sources.push_back(std::make_unique<tad::price::CoinGeckoSource>(cfg.price.coingecko_api_key, tad::price::makeHttpGet(http_options)));
    price_sources.push_back(std::make_unique<tad::price::BinanceSource>(cfg.price.binance_api_key, tad::price::makeHttpGet(http_options)));

    tad::price::PriceResolver price_resolver(std::move(price_sources), tad::price::ResolverOptions{
        .cache_ttl = cfg.price.cache_ttl,
        .batch_delay = cfg.price.batch_delay
    });

    const tad::adapters::JsonPost json_post = tad::adapters::makeJsonPost(http_options);

    tad::adapters::CommandContentFetcher fetcher(cfg.scraper_command, tad::adapters::makeProcessRunner(cfg.process_timeout));

    const tad::adapters::OpenAiClient openai(tad::adapters::OpenAiConfig{
        .api_key = cfg.ai.openai_api_key,
        .model = cfg.ai.openai_model
    }, json_post);
    tad::adapters::OpenAiRemovalRiskScorer removal_scorer(openai);
    tad::adapters::OpenAiEcosystemClassifier classifier(openai);

    tad::adapters::HuggingFaceSentimentScorer sentiment_scorer(tad::adapters::HuggingFaceConfig{
        .api_key = cfg.ai.huggingface_api_key,
        .financial_model = cfg.ai.financial_model,
        .social_model = cfg.ai.social_model
    }, json_post);

    tad::adapters::StorachaStorage storage(tad::adapters::StorachaConfig{
        .space_did = cfg.storage.space_did,
        .pinata_jwt = cfg.storage.pinata_jwt,
        .bridge_url = cfg.storage.bridge_url
    }, tad::adapters::makeStorageTransport(http_options, cfg.process_timeout));

    const tad::chain::RpcClient rpc_client(cfg.chain.rpc_url, rpc_call);

    std::unique_ptr<tad::chain::TransactionSigner> signer;
    std::unique_ptr<tad::adapters::RegistryClient> registry;
    std::unique_ptr<tad::adapters::DepositSubmitter> resubmitter;

    if(!cfg.chain.private_key.empty())
    {
        signer = std::make_unique<tad::chain::TransactionSigner>(tad::chain::SignerConfig{
            .rpc_url = cfg.chain.rpc_url,
            .private_key_hex = cfg.chain.private_key,
            .chain_id = cfg.chain.chain_id
        }, rpc_call);

        const auto backend_address = signer->senderAddress();
        if(!backend_address)
        {
            spdlog::error("Invalid backend key ({}): {}", std::format("{}", backend_address.error().kind), backend_address.error().message);
            return 1;
        }
        spdlog::info("Backend account: {}", tad::chain::addressToHex(*backend_address));

        if(const auto registry_address = tad::chain::parseAddress(cfg.chain.registry_contract))
        {
            registry = std::make_unique<tad::adapters::RegistryClient>(
                tad::adapters::RegistryClientConfig{.contract_address = *registry_address}, rpc_client, *signer);
        }
        else
        {
            spdlog::warn("No registry contract configured, register stage disabled");
        }

        resubmitter = std::make_unique<tad::adapters::DepositSubmitter>(
            tad::adapters::DepositSubmitterConfig{
                .contract_address = deposit_address,
                .submission_fee_wei = cfg.pipeline.submission_fee_wei
            }, *signer);
    }
    else
    {
        spdlog::warn("No private key configured, registry writes and resubmission disabled");
    }

    tad::pipeline::Orchestrator orchestrator(
        tad::pipeline::Collaborators{
            .fetcher = &fetcher,
            .removal_scorer = &removal_scorer,
            .sentiment_scorer = &sentiment_scorer,
            .classifier = &classifier,
            .prices = &price_resolver,
            .storage = &storage,
            .registry = registry.get(),
            .resubmitter = resubmitter.get()
        },
        tad::pipeline::OrchestratorConfig{
            .records_path = cfg.paths.records_path,
            .ledger_path = cfg.paths.ledger_file,
            .resubmission_threshold = cfg.pipeline.resubmission_threshold,
            .stats_every = cfg.polling.stats_every
        });

    tad::daemon::Daemon daemon(poller, checkpoint, orchestrator, tad::daemon::DaemonOptions{
        .poll_interval = cfg.polling.interval,
        .once = arg_parser.getArg<bool>("--once").value_or(false)
    });

    if(const auto test_event = arg_parser.getArg<std::vector<std::string>>("--test-event"))
    {
        const auto result = daemon.processTestEvent(test_event->at(0));
        return result == tad::pipeline::ProcessResult::COMPLETED ? 0 : 1;
    }

    spdlog::info("Monitoring deposit contract {} (threshold {:.2f})", cfg.chain.deposit_contract, cfg.pipeline.resubmission_threshold);

    asio::io_context io_context;
    try
    {
        daemon.run(io_context);
    }
    catch(const std::exception & e)
    {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    spdlog::debug("Program finished");
    return 0;
}
