#include "scraper_fetcher.hpp"

#include <format>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "content_record.hpp"
#include "parser.hpp"

namespace tad::adapters
{
    CommandContentFetcher::CommandContentFetcher(std::string command_line, ProcessRunner runner)
        : _runner(std::move(runner))
    {
        std::istringstream input(command_line);
        for(std::string part; input >> part;)
        {
            _command.push_back(std::move(part));
        }
    }

    pipeline::Outcome<pipeline::FetchedContent> CommandContentFetcher::fetch(const std::string & locator)
    {
        if(_command.empty() || !_runner)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = "scraper command not configured"
            });
        }

        std::vector<std::string> args(_command.begin() + 1, _command.end());
        args.push_back(locator);

        spdlog::info("Scraping {}", locator);
        const native::ProcessResult run = _runner(_command.front(), std::move(args));
        if(run.timed_out)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = std::format("scraper {}", describeFailure(run))
            });
        }
        if(run.exit_code != 0)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = std::format("scraper exited with code {}: {}", run.exit_code, describeFailure(run))
            });
        }

        const auto json_obj = lastJsonObject(run.output);
        if(!json_obj)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::INVALID_RESPONSE,
                .message = "scraper printed no JSON object"
            });
        }

        auto content = parse::parseFromJson<pipeline::FetchedContent>(*json_obj, parse::use_json);
        if(!content)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::INVALID_RESPONSE,
                .message = std::format("scraper output rejected: {}", content.error().message)
            });
        }

        if(content->url.empty())
        {
            content->url = locator;
        }
        if(content->tweet_id.empty())
        {
            const auto slash = locator.find_last_of('/');
            content->tweet_id = slash == std::string::npos ? locator : locator.substr(slash + 1);
        }
        return std::move(*content);
    }
}
