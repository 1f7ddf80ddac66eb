#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "http.hpp"
#include "native.h"

namespace tad::adapters
{
    using JsonPost = std::function<net::Result<net::http::Response>(const std::string & url, const nlohmann::json & body, const net::http::Headers & headers)>;

    using ProcessRunner = std::function<native::ProcessResult(const std::string & command, std::vector<std::string> args)>;

    using ProcessToFileRunner = std::function<native::ProcessResult(const std::string & command, std::vector<std::string> args, const std::filesystem::path & output_path)>;

    using FilePut = std::function<net::Result<net::http::Response>(const std::string & url, const std::filesystem::path & path, const net::http::Headers & headers)>;

    using MultipartPost = std::function<net::Result<net::http::Response>(const std::string & url, const std::string & field, const std::filesystem::path & path, const net::http::Headers & headers)>;

    JsonPost makeJsonPost(net::http::RequestOptions options = {});

    FilePut makeFilePut(net::http::RequestOptions options = {});

    MultipartPost makeMultipartPost(net::http::RequestOptions options = {});

    /**
     * @brief ProcessRunner backed by native::runProcess.
     *
     * A child still running after `timeout` is killed and reported with `timed_out` set.
     */
    ProcessRunner makeProcessRunner(std::chrono::milliseconds timeout);

    ProcessToFileRunner makeProcessToFileRunner(std::chrono::milliseconds timeout);

    /**
     * @brief Human readable cause of a failed run, standard error first.
     */
    std::string describeFailure(const native::ProcessResult & result);

    /**
     * @brief Last JSON object found in a tool's output.
     *
     * Tools may print progress lines before the result; the whole output is tried first,
     * then each line from the end.
     */
    std::optional<nlohmann::json> lastJsonObject(const std::string & output);
}
