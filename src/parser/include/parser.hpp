#pragma once

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include <google/protobuf/util/json_util.h>

#include "parse_error.hpp"

namespace tad::parse
{   
    /**
     * @brief Selects the protobuf JSON mapping for generated messages.
     */
    struct use_protobuf_t{};

    /**
     * @brief Selects nlohmann::json field mapping for plain structs.
     */
    struct use_json_t{};

    static constexpr use_protobuf_t use_protobuf{};
    static constexpr use_json_t use_json{};

    /**
     * @brief Converts a JSON string to a T using JSON.
     * 
     * @tparam T The message type.
     * @param json The JSON string to convert.
     */
    template<class T>
    Result<T> parseFromJson(json json, use_json_t);

    /**
     * @brief Converts a JSON string to a T using Protobuf.
     * 
     * @tparam T The message type.
     * @param json The JSON string to convert.
     */
    template<class T>
    Result<T> parseFromJson(std::string json_str, use_protobuf_t);

    /**
     * @brief Converts a T to a JSON object using JSON.
     * 
     * @tparam T The message type.
     * @param message The message to convert.
     */
    template<class T>
    Result<json> parseToJson(T message, use_json_t);

    /**
     * @brief Converts a T to a JSON string using Protobuf.
     * 
     * @tparam T The message type.
     * @param message The message to convert.
     */
    template<class T>
    Result<std::string> parseToJson(T message, use_protobuf_t);

}
