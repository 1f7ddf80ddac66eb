#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

#include <asio.hpp>

#include "checkpoint.hpp"
#include "orchestrator.hpp"
#include "poller.hpp"

namespace tad::daemon
{
    struct DaemonOptions
    {
        std::chrono::seconds poll_interval{30};
        bool once = false;
    };

    struct CycleReport
    {
        std::size_t events = 0;
        std::size_t completed = 0;
        bool checkpoint_committed = false;
    };

    /**
     * @brief The poll loop: poll, hand each event to the orchestrator, commit the checkpoint, sleep.
     *
     * The loop runs as a coroutine on a worker io_context. Shutdown is cooperative:
     * the flag is checked between events and the sleep timer is cancelled.
     */
    class Daemon
    {
    public:
        Daemon(chain::EventPoller & poller, chain::CheckpointStore & checkpoint, pipeline::Orchestrator & orchestrator, DaemonOptions options);

        ~Daemon();

        Daemon(const Daemon &) = delete;
        Daemon & operator=(const Daemon &) = delete;

        /**
         * @brief One poll cycle. The checkpoint advances only when every event of the batch was handed off.
         */
        CycleReport runCycle();

        /**
         * @brief Pushes a synthetic submission carrying `locator` through the pipeline.
         */
        pipeline::ProcessResult processTestEvent(const std::string & locator);

        /**
         * @brief Runs the loop on a worker thread until it finishes or SIGINT/SIGTERM arrives.
         *
         * `signal_context` is run on the calling thread and owns the signal handlers.
         */
        void run(asio::io_context & signal_context);

        void requestShutdown();

        bool shutdownRequested() const noexcept;

    private:
        asio::awaitable<void> _loop();

        chain::EventPoller & _poller;
        chain::CheckpointStore & _checkpoint;
        pipeline::Orchestrator & _orchestrator;
        DaemonOptions _options;

        std::atomic<bool> _shutdown{false};

        asio::io_context _worker_context;
        asio::steady_timer _sleep_timer;
        std::thread _worker;
    };
}
