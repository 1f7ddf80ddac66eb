#pragma once

#include <fstream>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace tad::file
{
    std::optional<std::string> loadTextFile(std::filesystem::path path);

    std::optional<std::vector<std::byte>> loadBinaryFile(std::filesystem::path path);

    /**
     * @brief Replaces the file content atomically.
     *
     * Content is written to a sibling temporary file which is then renamed over the target,
     * so readers observe either the old or the new content, never a partial write.
     * Parent directories are created when missing.
     *
     * @return true on success.
     */
    bool writeTextFileAtomic(const std::filesystem::path & path, const std::string & content);
}
