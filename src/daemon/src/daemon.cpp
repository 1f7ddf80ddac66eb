#include "daemon.hpp"

#include <csignal>
#include <exception>
#include <format>

#include <spdlog/spdlog.h>

#include "crypto.hpp"

namespace tad::daemon
{
    Daemon::Daemon(chain::EventPoller & poller, chain::CheckpointStore & checkpoint, pipeline::Orchestrator & orchestrator, DaemonOptions options)
        : _poller(poller),
          _checkpoint(checkpoint),
          _orchestrator(orchestrator),
          _options(options),
          _sleep_timer(_worker_context)
    {
    }

    Daemon::~Daemon()
    {
        requestShutdown();
        if(_worker.joinable())
        {
            _worker.join();
        }
    }

    bool Daemon::shutdownRequested() const noexcept
    {
        return _shutdown.load();
    }

    void Daemon::requestShutdown()
    {
        if(_shutdown.exchange(true))
        {
            return;
        }
        asio::post(_worker_context, [this]() { _sleep_timer.cancel(); });
    }

    CycleReport Daemon::runCycle()
    {
        CycleReport report;

        const auto head = _poller.currentHeight();
        if(!head)
        {
            spdlog::error("Cannot read chain head ({}): {}", std::format("{}", head.error().kind), head.error().message);
            return report;
        }

        const std::uint64_t checkpoint = _checkpoint.load(*head);
        const auto batch = _poller.pollOnce(checkpoint, *head);
        if(!batch)
        {
            return report;
        }

        report.events = batch->events.size();
        if(!batch->events.empty())
        {
            spdlog::info("Found {} submission(s) in blocks [{}, {}]", batch->events.size(), batch->from_block, batch->to_block);
        }

        for(const chain::SubmissionEvent & event : batch->events)
        {
            if(shutdownRequested())
            {
                spdlog::info("Shutdown requested, leaving checkpoint at {}", checkpoint);
                return report;
            }

            if(_orchestrator.process(event) == pipeline::ProcessResult::COMPLETED)
            {
                ++report.completed;
            }
        }

        report.checkpoint_committed = _checkpoint.save(batch->to_block);
        if(!report.checkpoint_committed)
        {
            spdlog::warn("Checkpoint not advanced to {}", batch->to_block);
        }
        return report;
    }

    pipeline::ProcessResult Daemon::processTestEvent(const std::string & locator)
    {
        chain::SubmissionEvent event;
        event.transaction_hash = "0x" + std::string(64, '0');
        event.content_hash = crypto::contentHash(locator);
        event.validation = locator;
        event.emitted_at = std::chrono::system_clock::now();

        spdlog::info("Processing test event for {}", locator);
        const auto result = _orchestrator.process(event);
        _orchestrator.logStats();
        return result;
    }

    asio::awaitable<void> Daemon::_loop()
    {
        spdlog::info("Polling {} every {}s", _poller.config().rpc_url, _options.poll_interval.count());

        while(!shutdownRequested())
        {
            runCycle();

            if(_options.once || shutdownRequested())
            {
                break;
            }

            _sleep_timer.expires_after(_options.poll_interval);
            std::error_code ec;
            co_await _sleep_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            if(ec && ec != asio::error::operation_aborted)
            {
                spdlog::warn("Poll timer failed: {}", ec.message());
            }
        }

        _orchestrator.logStats();
        spdlog::info("Poll loop stopped");
    }

    void Daemon::run(asio::io_context & signal_context)
    {
        asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([this](const std::error_code & ec, int signal_number)
        {
            if(ec)
            {
                return;
            }
            spdlog::info("Received signal {}, finishing current event", signal_number);
            requestShutdown();
        });

        asio::co_spawn(_worker_context, _loop(),
            [&signal_context, &signals](std::exception_ptr error)
            {
                if(error)
                {
                    try
                    {
                        std::rethrow_exception(error);
                    }
                    catch(const std::exception & e)
                    {
                        spdlog::error("Poll loop terminated: {}", e.what());
                    }
                }
                asio::post(signal_context, [&signals]() { signals.cancel(); });
            });

        _worker = std::thread([this]() { _worker_context.run(); });

        signal_context.run();

        if(_worker.joinable())
        {
            _worker.join();
        }
    }
}
