#pragma once

#include <vector>
#include <optional>
#include <string>
#include <cstdint>

namespace tad::utils
{
    /**
     * @brief Reads a 32-byte big-endian ABI word as size_t.
     *
     * @return std::nullopt when the word does not fit or lies outside the buffer.
     */
    std::optional<std::size_t> readWordAsSizeT(const std::uint8_t* data, std::size_t data_size, std::size_t offset);

    std::optional<std::string> decodeAbiString(const std::uint8_t* data, std::size_t data_size, std::size_t string_offset);

    std::optional<std::vector<std::uint8_t>> decodeAbiBytes(const std::uint8_t* data, std::size_t data_size, std::size_t bytes_offset);
}
