#include "file.hpp"

#include <format>

namespace tad::file
{
    std::optional<std::string> loadTextFile(std::filesystem::path path)
    {
        if(std::filesystem::exists(path) == false)
        {
            spdlog::debug(std::format("File {} does not exist.", path.string()));
            return std::nullopt;
        }
        
        std::ifstream file(path, std::ios::in);

        if(file.good() == false)
        {  
            spdlog::error(std::format("Failed to open file {}", path.string()));
            return std::nullopt;
        }

        const std::string file_content = std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        file.close();

        return file_content;
    }

    std::optional<std::vector<std::byte>> loadBinaryFile(std::filesystem::path path)
    {    
        if (!std::filesystem::exists(path)) {
            spdlog::error("Cannot find {} file.", path.string());
            return std::nullopt;
        }
    
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            spdlog::error("Failed to open file {}", path.string());
            return std::nullopt;
        }
    
        const std::streamsize size = file.tellg();
        if (size <= 0) {
            spdlog::error("File {} is empty or unreadable.", path.string());
            return std::nullopt;
        }
    
        std::vector<std::byte> buffer(static_cast<std::size_t>(size));
        file.seekg(0);
        if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
            spdlog::error("Failed to read file {}", path.string());
            return std::nullopt;
        }
    
        return buffer;
    }

    bool writeTextFileAtomic(const std::filesystem::path & path, const std::string & content)
    {
        std::error_code ec;
        if(path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path(), ec);
            if(ec)
            {
                spdlog::error("Failed to create directory {}: {}", path.parent_path().string(), ec.message());
                return false;
            }
        }

        std::filesystem::path temp_path = path;
        temp_path += ".tmp";

        {
            std::ofstream output(temp_path, std::ios::out | std::ios::trunc);
            if(!output.is_open())
            {
                spdlog::error("Failed to open {} for writing", temp_path.string());
                return false;
            }

            output << content;
            output.flush();
            if(!output.good())
            {
                spdlog::error("Failed to write {}", temp_path.string());
                return false;
            }
        }

        std::filesystem::rename(temp_path, path, ec);
        if(ec)
        {
            spdlog::error("Failed to move {} over {}: {}", temp_path.string(), path.string(), ec.message());
            std::filesystem::remove(temp_path, ec);
            return false;
        }

        return true;
    }
}
