#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "net_error.hpp"
#include "retry.hpp"

namespace tad::net::http
{
    using Headers = std::vector<std::pair<std::string, std::string>>;

    struct Response
    {
        long status = 0;
        std::string body;
    };

    struct RequestOptions
    {
        std::chrono::seconds timeout{15};
        RetryPolicy retry{};
    };

    /**
     * @brief Performs a GET request. Statuses >= 400 are reported as HTTP_STATUS errors.
     */
    Result<Response> get(const std::string & url, const Headers & headers = {}, const RequestOptions & options = {});

    /**
     * @brief POSTs `body` serialized as application/json.
     */
    Result<Response> postJson(const std::string & url, const nlohmann::json & body, const Headers & headers = {}, const RequestOptions & options = {});

    /**
     * @brief PUTs the raw file content.
     */
    Result<Response> putFile(const std::string & url, const std::filesystem::path & path, const Headers & headers = {}, const RequestOptions & options = {});

    /**
     * @brief POSTs the file as a multipart/form-data field.
     */
    Result<Response> postMultipartFile(const std::string & url, const std::string & field, const std::filesystem::path & path, const Headers & headers = {}, const RequestOptions & options = {});

    std::string urlEncode(const std::string & value);
}
