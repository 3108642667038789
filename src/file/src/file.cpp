#include "file.hpp"

namespace pdp::file
{
    std::optional<std::string> loadTextFile(const std::filesystem::path & path)
    {
        if(std::filesystem::exists(path) == false)
        {
            spdlog::error(std::format("Cannot find {}", path.string()));
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

    bool saveTextFile(const std::filesystem::path & path, const std::string & content)
    {
        std::error_code ec;
        if(path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path(), ec);
            if(ec)
            {
                spdlog::error(std::format("Failed to create directory {}: {}", path.parent_path().string(), ec.message()));
                return false;
            }
        }

        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if(file.good() == false)
        {
            spdlog::error(std::format("Failed to open file {}", path.string()));
            return false;
        }

        file << content;
        return file.good();
    }
}
