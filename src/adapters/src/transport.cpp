#include "transport.hpp"

#include <format>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

#include "native.h"
#include "utils.hpp"

namespace tad::adapters
{
    using json = nlohmann::json;

    JsonPost makeJsonPost(net::http::RequestOptions options)
    {
        return [options = std::move(options)](const std::string & url, const json & body, const net::http::Headers & headers)
        {
            return net::http::postJson(url, body, headers, options);
        };
    }

    FilePut makeFilePut(net::http::RequestOptions options)
    {
        return [options = std::move(options)](const std::string & url, const std::filesystem::path & path, const net::http::Headers & headers)
        {
            return net::http::putFile(url, path, headers, options);
        };
    }

    MultipartPost makeMultipartPost(net::http::RequestOptions options)
    {
        return [options = std::move(options)](const std::string & url, const std::string & field, const std::filesystem::path & path, const net::http::Headers & headers)
        {
            return net::http::postMultipartFile(url, field, path, headers, options);
        };
    }

    ProcessRunner makeProcessRunner(const std::chrono::milliseconds timeout)
    {
        return [timeout](const std::string & command, std::vector<std::string> args)
        {
            return native::runProcess(command, std::move(args), timeout);
        };
    }

    ProcessToFileRunner makeProcessToFileRunner(const std::chrono::milliseconds timeout)
    {
        return [timeout](const std::string & command, std::vector<std::string> args, const std::filesystem::path & output_path)
        {
            return native::runProcessToFile(command, std::move(args), output_path, timeout);
        };
    }

    std::string describeFailure(const native::ProcessResult & result)
    {
        const std::string errors = utils::trim(result.errors);
        if(result.timed_out)
        {
            return errors.empty() ? "timed out" : std::format("timed out: {}", errors);
        }
        return errors.empty() ? utils::trim(result.output) : errors;
    }

    std::optional<json> lastJsonObject(const std::string & output)
    {
        json whole = json::parse(output, nullptr, false);
        if(!whole.is_discarded() && whole.is_object())
        {
            return whole;
        }

        std::vector<std::string> lines;
        std::istringstream input(output);
        for(std::string line; std::getline(input, line);)
        {
            lines.push_back(std::move(line));
        }

        for(auto it = lines.rbegin(); it != lines.rend(); ++it)
        {
            json parsed = json::parse(*it, nullptr, false);
            if(!parsed.is_discarded() && parsed.is_object())
            {
                return parsed;
            }
        }
        return std::nullopt;
    }
}
