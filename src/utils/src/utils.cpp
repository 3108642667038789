#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace pdp::utils
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

    std::string toLower(std::string value)
    {
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string withHexPrefix(std::string value)
    {
        if(value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0)
        {
            return value;
        }
        return std::string("0x") + value;
    }

    std::string toHexQuantity(const std::uint64_t value)
    {
        return std::format("0x{:x}", value);
    }

    std::optional<std::uint64_t> parseQuantity(const std::string & value)
    {
        if(value.empty())
        {
            return std::nullopt;
        }

        int base = 10;
        std::string_view digits = value;
        if(value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0)
        {
            base = 16;
            digits.remove_prefix(2);
            if(digits.empty())
            {
                return 0;
            }
        }

        std::uint64_t out = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out, base);
        if(ec != std::errc{} || ptr != digits.data() + digits.size())
        {
            return std::nullopt;
        }
        return out;
    }
}
