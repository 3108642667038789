#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <variant>

#include "address.hpp"

namespace pdp::abi
{
    enum class AbiType : std::uint8_t
    {
        STRING = 0,
        ADDRESS,
        BOOL,
        BYTES,
        UINT256
    };

    bool isDynamic(AbiType type);

    /**
     * @brief One decoded ABI field. The active alternative always matches `type()`.
     */
    class AbiValue
    {
    public:
        using Storage = std::variant<std::string, chain::Address, bool, evmc::bytes, evmc::uint256be>;

        AbiValue() = default;

        static AbiValue fromString(std::string value);
        static AbiValue fromAddress(chain::Address value);
        static AbiValue fromBool(bool value);
        static AbiValue fromBytes(evmc::bytes value);
        static AbiValue fromUint256(evmc::uint256be value);

        /**
         * @brief Zero value of the given type: empty string or bytes, zero address, false, zero integer.
         */
        static AbiValue defaultOf(AbiType type);

        AbiType type() const;

        const std::string & asString() const;
        const chain::Address & asAddress() const;
        bool asBool() const;
        const evmc::bytes & asBytes() const;
        const evmc::uint256be & asUint256() const;

    private:
        explicit AbiValue(Storage value);

        Storage _value;
    };
}

template <>
struct std::formatter<pdp::abi::AbiType> : std::formatter<std::string> {
    auto format(const pdp::abi::AbiType & type, format_context& ctx) const {
        switch(type)
        {
            case pdp::abi::AbiType::STRING : return formatter<string>::format("string", ctx);
            case pdp::abi::AbiType::ADDRESS : return formatter<string>::format("address", ctx);
            case pdp::abi::AbiType::BOOL : return formatter<string>::format("bool", ctx);
            case pdp::abi::AbiType::BYTES : return formatter<string>::format("bytes", ctx);
            case pdp::abi::AbiType::UINT256 : return formatter<string>::format("uint256", ctx);

            default:  return formatter<string>::format("unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
