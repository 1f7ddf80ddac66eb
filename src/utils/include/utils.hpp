#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <format>
#include <string>
#include <string_view>

namespace tad::utils
{
    std::string loadBuildTimestamp(const std::filesystem::path & path);

    /**
     * @brief Local time formatted for file names, e.g. 2025-01-31-14_05_09.
     */
    std::string currentTimestamp();

    /**
     * @brief UTC time in ISO-8601 with second precision, e.g. 2025-01-31T14:05:09Z.
     */
    std::string isoTimestamp(std::chrono::system_clock::time_point time_point);

    /**
     * @brief UTC time compacted for record names, e.g. 20250131_140509.
     */
    std::string compactTimestamp(std::chrono::system_clock::time_point time_point);

    bool equalsIgnoreCase(std::string_view a, std::string_view b);

    std::string toUpper(std::string value);

    std::string toLower(std::string value);

    std::string trim(std::string_view value);

    /**
     * @brief At most `max_bytes` of UTF-8 text, cut before any partial code point.
     */
    std::string truncateUtf8(std::string_view value, std::size_t max_bytes);
}
