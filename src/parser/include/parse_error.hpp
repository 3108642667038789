#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace pdp::parse
{
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN         = 0U,

            INVALID_VALUE   = 1U,
            OUT_OF_RANGE    = 2U,
            TYPE_MISMATCH   = 3U,
            MISSING_FIELD   = 4U
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct std::formatter<pdp::parse::Error::Kind> : std::formatter<std::string> {
    auto format(const pdp::parse::Error::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case pdp::parse::Error::Kind::INVALID_VALUE : return formatter<string>::format("Invalid value", ctx);
            case pdp::parse::Error::Kind::OUT_OF_RANGE : return formatter<string>::format("Out of range", ctx);
            case pdp::parse::Error::Kind::TYPE_MISMATCH : return formatter<string>::format("Type mismatch", ctx);
            case pdp::parse::Error::Kind::MISSING_FIELD : return formatter<string>::format("Missing field", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
