#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <format>
#include <optional>
#include <string>

namespace pdp::utils
{
    std::string loadBuildTimestamp(const std::filesystem::path & path);

    std::string currentTimestamp();

    std::string toLower(std::string value);

    std::string withHexPrefix(std::string value);

    std::string toHexQuantity(std::uint64_t value);

    /**
     * @brief Parses `0x` prefixed hex quantities and plain decimal strings.
     */
    std::optional<std::uint64_t> parseQuantity(const std::string & value);
}
