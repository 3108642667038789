#include "decode_abi.hpp"

#include <array>
#include <format>
#include <limits>

#include <spdlog/spdlog.h>

namespace pdp::abi
{
    namespace
    {
        std::string _toString(evmc::bytes_view content)
        {
            return std::string(reinterpret_cast<const char*>(content.data()), content.size());
        }

        AbiValue _decodeField(evmc::bytes_view data, std::size_t head_offset, AbiType type)
        {
            switch(type)
            {
                case AbiType::ADDRESS:
                {
                    const auto address = chain::readAddressWord(data, head_offset);
                    return address ? AbiValue::fromAddress(*address) : AbiValue::defaultOf(type);
                }
                case AbiType::BOOL:
                    return AbiValue::fromBool(!utils::isZero(utils::toUint256(data, head_offset)));

                case AbiType::UINT256:
                    return AbiValue::fromUint256(utils::toUint256(data, head_offset));

                case AbiType::STRING:
                case AbiType::BYTES:
                {
                    const auto tail_offset = utils::readWordAsSizeT(data, head_offset);
                    if(!tail_offset)
                    {
                        spdlog::debug(std::format("ABI {} offset at head {} is out of range", type, head_offset));
                        return AbiValue::defaultOf(type);
                    }

                    const auto content = readDynamicBytes(data, *tail_offset);
                    if(!content)
                    {
                        spdlog::debug(std::format("ABI {} tail at {} is out of range", type, *tail_offset));
                        return AbiValue::defaultOf(type);
                    }

                    if(type == AbiType::STRING)
                    {
                        return AbiValue::fromString(_toString(*content));
                    }
                    return AbiValue::fromBytes(utils::toBytes(*content));
                }
            }
            return AbiValue::defaultOf(type);
        }
    }

    std::optional<evmc::bytes_view> readDynamicBytes(evmc::bytes_view data, std::size_t offset)
    {
        const auto length = utils::readWordAsSizeT(data, offset);
        if(!length)
        {
            return std::nullopt;
        }

        // readWordAsSizeT guarantees offset + 32 <= data.size()
        return utils::view(data, offset + utils::WORD_SIZE, *length);
    }

    std::vector<AbiValue> decodeTuple(evmc::bytes_view data, std::span<const AbiType> layout)
    {
        std::vector<AbiValue> values;
        values.reserve(layout.size());

        if(data.size() < layout.size() * utils::WORD_SIZE)
        {
            for(const AbiType type : layout)
            {
                values.push_back(AbiValue::defaultOf(type));
            }
            return values;
        }

        for(std::size_t i = 0; i < layout.size(); ++i)
        {
            values.push_back(_decodeField(data, i * utils::WORD_SIZE, layout[i]));
        }
        return values;
    }

    StringAddressBoolBytesResult decodeStringAddressBoolBytes(evmc::bytes_view data)
    {
        static constexpr std::array<AbiType, 4> LAYOUT{AbiType::STRING, AbiType::ADDRESS, AbiType::BOOL, AbiType::BYTES};

        const auto values = decodeTuple(data, LAYOUT);
        return StringAddressBoolBytesResult{
            .string_value = values[0].asString(),
            .address_value = values[1].asAddress(),
            .bool_value = values[2].asBool(),
            .bytes_value = values[3].asBytes()
        };
    }

    BytesStringResult decodeBytesString(evmc::bytes_view data)
    {
        static constexpr std::array<AbiType, 2> LAYOUT{AbiType::BYTES, AbiType::STRING};

        const auto values = decodeTuple(data, LAYOUT);
        return BytesStringResult{
            .bytes_value = values[0].asBytes(),
            .string_value = values[1].asString()
        };
    }

    AddServiceProviderParams decodeAddServiceProviderFunction(evmc::bytes_view call_data)
    {
        static constexpr std::array<AbiType, 3> LAYOUT{AbiType::ADDRESS, AbiType::STRING, AbiType::STRING};

        // offsets inside the arguments are relative to the end of the selector
        const evmc::bytes_view args = call_data.size() >= utils::SELECTOR_SIZE
            ? call_data.substr(utils::SELECTOR_SIZE)
            : evmc::bytes_view{};

        const auto values = decodeTuple(args, LAYOUT);
        return AddServiceProviderParams{
            .provider = values[0].asAddress(),
            .pdp_url = values[1].asString(),
            .piece_retrieval_url = values[2].asString()
        };
    }

    std::optional<std::vector<std::uint64_t>> decodeUint64Array(evmc::bytes_view data, std::size_t array_offset)
    {
        const auto length_res = utils::readWordAsSizeT(data, array_offset);
        if(!length_res)
        {
            return std::nullopt;
        }

        const std::size_t length = *length_res;
        const std::size_t first_value_offset = array_offset + utils::WORD_SIZE;

        if(length > (std::numeric_limits<std::size_t>::max() / utils::WORD_SIZE))
        {
            return std::nullopt;
        }

        if(!utils::view(data, first_value_offset, length * utils::WORD_SIZE))
        {
            return std::nullopt;
        }

        std::vector<std::uint64_t> out;
        out.reserve(length);

        for(std::size_t i = 0; i < length; ++i)
        {
            const auto value = utils::readUint64Word(data, first_value_offset + i * utils::WORD_SIZE);
            if(!value)
            {
                return std::nullopt;
            }
            out.push_back(*value);
        }

        return out;
    }
}
