#pragma once

#include <string>
#include <vector>

#include "collaborators.hpp"
#include "transport.hpp"

namespace tad::adapters
{
    /**
     * @brief Fetches tweet content by running an external scraper command.
     *
     * The command line is split on whitespace and the locator is appended as the last
     * argument. The scraper prints a JSON object with content, user, handle, verified,
     * likes, retweets, replies, timestamp, tweet_id and screenshot.
     * Only standard output is parsed. A run killed at the runner's deadline fails as UNAVAILABLE.
     */
    class CommandContentFetcher final : public pipeline::IContentFetcher
    {
    public:
        CommandContentFetcher(std::string command_line, ProcessRunner runner);

        pipeline::Outcome<pipeline::FetchedContent> fetch(const std::string & locator) override;

    private:
        std::vector<std::string> _command;
        ProcessRunner _runner;
    };
}
