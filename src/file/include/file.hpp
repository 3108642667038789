#pragma once

#include <format>
#include <fstream>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace pdp::file
{
    std::optional<std::string> loadTextFile(const std::filesystem::path & path);

    /**
     * @brief Writes `content` to `path`, creating parent directories. Existing content is replaced.
     */
    bool saveTextFile(const std::filesystem::path & path, const std::string & content);
}
