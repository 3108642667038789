#include "abi_value.hpp"

namespace pdp::abi
{
    bool isDynamic(AbiType type)
    {
        return type == AbiType::STRING || type == AbiType::BYTES;
    }

    AbiValue::AbiValue(Storage value)
    :   _value(std::move(value))
    {
    }

    AbiValue AbiValue::fromString(std::string value)
    {
        return AbiValue(Storage{std::in_place_type<std::string>, std::move(value)});
    }

    AbiValue AbiValue::fromAddress(chain::Address value)
    {
        return AbiValue(Storage{std::in_place_type<chain::Address>, value});
    }

    AbiValue AbiValue::fromBool(bool value)
    {
        return AbiValue(Storage{std::in_place_type<bool>, value});
    }

    AbiValue AbiValue::fromBytes(evmc::bytes value)
    {
        return AbiValue(Storage{std::in_place_type<evmc::bytes>, std::move(value)});
    }

    AbiValue AbiValue::fromUint256(evmc::uint256be value)
    {
        return AbiValue(Storage{std::in_place_type<evmc::uint256be>, value});
    }

    AbiValue AbiValue::defaultOf(AbiType type)
    {
        switch(type)
        {
            case AbiType::STRING:   return fromString({});
            case AbiType::ADDRESS:  return fromAddress({});
            case AbiType::BOOL:     return fromBool(false);
            case AbiType::BYTES:    return fromBytes({});
            case AbiType::UINT256:  return fromUint256({});
        }
        return fromString({});
    }

    AbiType AbiValue::type() const
    {
        return static_cast<AbiType>(_value.index());
    }

    const std::string & AbiValue::asString() const
    {
        return std::get<std::string>(_value);
    }

    const chain::Address & AbiValue::asAddress() const
    {
        return std::get<chain::Address>(_value);
    }

    bool AbiValue::asBool() const
    {
        return std::get<bool>(_value);
    }

    const evmc::bytes & AbiValue::asBytes() const
    {
        return std::get<evmc::bytes>(_value);
    }

    const evmc::uint256be & AbiValue::asUint256() const
    {
        return std::get<evmc::uint256be>(_value);
    }
}
