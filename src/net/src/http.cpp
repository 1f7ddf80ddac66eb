#include "http.hpp"

#include <charconv>
#include <format>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "native.h"

namespace tad::net::http
{
    namespace
    {
        constexpr std::string_view STATUS_MARKER = "\n__tad_http_status__:";

        // curl exit code for "operation timed out"
        constexpr int CURL_TIMEOUT_EXIT_CODE = 28;

        constexpr std::chrono::seconds CURL_KILL_GRACE{5};

        constexpr std::size_t MAX_LOGGED_BODY = 512;

        std::string _truncate(const std::string & value)
        {
            if(value.size() <= MAX_LOGGED_BODY)
            {
                return value;
            }
            return value.substr(0, MAX_LOGGED_BODY) + "...";
        }

        std::vector<std::string> _baseArgs(const std::string & method, const std::string & url, const Headers & headers, const RequestOptions & options)
        {
            std::vector<std::string> args{
                "-sS",
                "-X", method,
                "--max-time", std::to_string(options.timeout.count()),
                "-w", std::string(STATUS_MARKER) + "%{http_code}"
            };

            for(const auto & [name, value] : headers)
            {
                args.push_back("-H");
                args.push_back(std::format("{}: {}", name, value));
            }

            return args;
        }

        Result<Response> _curlOnce(const std::vector<std::string> & args, const std::chrono::seconds timeout)
        {
            // backstop for a curl that ignores --max-time
            const auto [exit_code, output, errors, timed_out] = native::runProcess("curl", args, timeout + CURL_KILL_GRACE);
            if(timed_out || exit_code == CURL_TIMEOUT_EXIT_CODE)
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::TIMEOUT,
                    .message = _truncate(errors)
                });
            }

            if(exit_code != 0)
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::PROCESS_FAILED,
                    .message = std::format("curl exited with {}: {}", exit_code, _truncate(errors))
                });
            }

            const auto marker_pos = output.rfind(STATUS_MARKER);
            if(marker_pos == std::string::npos)
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::MALFORMED_RESPONSE,
                    .message = "missing status trailer in curl output"
                });
            }

            Response response;
            response.body = output.substr(0, marker_pos);

            const std::string status_text = output.substr(marker_pos + STATUS_MARKER.size());
            const auto [ptr, ec] = std::from_chars(status_text.data(), status_text.data() + status_text.size(), response.status);
            if(ec != std::errc())
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::MALFORMED_RESPONSE,
                    .message = std::format("unparsable HTTP status '{}'", status_text)
                });
            }

            if(response.status >= 400)
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::HTTP_STATUS,
                    .message = std::format("HTTP {}: {}", response.status, _truncate(response.body)),
                    .status = response.status
                });
            }

            return response;
        }

        Result<Response> _perform(std::vector<std::string> args, const std::string & url, const RequestOptions & options, const std::string & method)
        {
            if(url.empty())
            {
                return std::unexpected(Error{
                    .kind = Error::Kind::INVALID_INPUT,
                    .message = "empty URL"
                });
            }

            args.push_back(url);
            return withRetry(options.retry, [&args, &options]() { return _curlOnce(args, options.timeout); }, std::format("{} {}", method, url));
        }
    }

    Result<Response> get(const std::string & url, const Headers & headers, const RequestOptions & options)
    {
        return _perform(_baseArgs("GET", url, headers, options), url, options, "GET");
    }

    Result<Response> postJson(const std::string & url, const nlohmann::json & body, const Headers & headers, const RequestOptions & options)
    {
        auto args = _baseArgs("POST", url, headers, options);
        args.push_back("-H");
        args.push_back("Content-Type: application/json");
        args.push_back("--data-binary");
        args.push_back(body.dump());
        return _perform(std::move(args), url, options, "POST");
    }

    Result<Response> putFile(const std::string & url, const std::filesystem::path & path, const Headers & headers, const RequestOptions & options)
    {
        auto args = _baseArgs("PUT", url, headers, options);
        args.push_back("--upload-file");
        args.push_back(path.string());
        return _perform(std::move(args), url, options, "PUT");
    }

    Result<Response> postMultipartFile(const std::string & url, const std::string & field, const std::filesystem::path & path, const Headers & headers, const RequestOptions & options)
    {
        auto args = _baseArgs("POST", url, headers, options);
        args.push_back("-F");
        args.push_back(std::format("{}=@{}", field, path.string()));
        return _perform(std::move(args), url, options, "POST");
    }

    std::string urlEncode(const std::string & value)
    {
        static constexpr char HEX[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(value.size() * 3);
        for(const unsigned char c : value)
        {
            if((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~')
            {
                out.push_back(static_cast<char>(c));
                continue;
            }
            out.push_back('%');
            out.push_back(HEX[(c >> 4) & 0x0F]);
            out.push_back(HEX[c & 0x0F]);
        }
        return out;
    }
}
