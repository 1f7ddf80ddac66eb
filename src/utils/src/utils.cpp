#include "utils.hpp"

#include <algorithm>
#include <cctype>

namespace tad::utils
{
    std::string loadBuildTimestamp(const std::filesystem::path & path) 
    {
        std::ifstream file(path);
        if (!file.is_open()) return "Unknown";
        std::string timestamp;
        std::getline(file, timestamp);
        return timestamp;
    }

    std::string currentTimestamp()
    {
        const auto zt{ std::chrono::zoned_time{
            std::chrono::current_zone(),
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())}
            };
        std::string ts = std::format("{:%F-%H_%M_%S}", zt);
        return ts;
    }

    std::string isoTimestamp(std::chrono::system_clock::time_point time_point)
    {
        return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(time_point));
    }

    std::string compactTimestamp(std::chrono::system_clock::time_point time_point)
    {
        return std::format("{:%Y%m%d_%H%M%S}", std::chrono::floor<std::chrono::seconds>(time_point));
    }

    bool equalsIgnoreCase(std::string_view a, std::string_view b)
    {
        return a.size() == b.size() &&
            std::equal(a.begin(), a.end(), b.begin(), [](char lhs, char rhs) {
                return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
            });
    }

    std::string toUpper(std::string value)
    {
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return value;
    }

    std::string toLower(std::string value)
    {
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(std::string_view value)
    {
        const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        while(!value.empty() && is_space(value.front()))
        {
            value.remove_prefix(1);
        }
        while(!value.empty() && is_space(value.back()))
        {
            value.remove_suffix(1);
        }
        return std::string(value);
    }

    std::string truncateUtf8(std::string_view value, const std::size_t max_bytes)
    {
        if(value.size() <= max_bytes)
        {
            return std::string(value);
        }

        std::size_t cut = max_bytes;
        // step back over continuation bytes 10xxxxxx onto the lead byte
        while(cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80)
        {
            --cut;
        }
        return std::string(value.substr(0, cut));
    }
}
