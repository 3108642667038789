#include "bytes.hpp"

#include <algorithm>
#include <cstring>

namespace pdp::utils
{
    namespace
    {
        bool _fits(evmc::bytes_view data, std::size_t start, std::size_t length)
        {
            return start <= data.size() && length <= (data.size() - start);
        }
    }

    bool equals(evmc::bytes_view a, std::size_t a_start, evmc::bytes_view b, std::size_t b_start, std::size_t length)
    {
        if(!_fits(a, a_start, length) || !_fits(b, b_start, length))
        {
            return false;
        }

        return std::memcmp(a.data() + a_start, b.data() + b_start, length) == 0;
    }

    bool equals(evmc::bytes_view a, std::size_t a_start, evmc::bytes_view b)
    {
        return equals(a, a_start, b, 0, b.size());
    }

    evmc::uint256be toUint256(evmc::bytes_view data, std::size_t offset)
    {
        evmc::uint256be word{};
        if(!_fits(data, offset, WORD_SIZE))
        {
            return word;
        }

        std::memcpy(word.bytes, data.data() + offset, WORD_SIZE);
        return word;
    }

    std::int32_t toI32(evmc::bytes_view data, std::size_t offset)
    {
        if(!_fits(data, offset, WORD_SIZE))
        {
            return 0;
        }

        const std::uint8_t* word = data.data() + offset;
        const std::uint32_t raw_value =
            (static_cast<std::uint32_t>(word[28]) << 24) |
            (static_cast<std::uint32_t>(word[29]) << 16) |
            (static_cast<std::uint32_t>(word[30]) << 8) |
            static_cast<std::uint32_t>(word[31]);

        return static_cast<std::int32_t>(raw_value);
    }

    std::optional<evmc::bytes_view> view(evmc::bytes_view data, std::size_t start, std::size_t length)
    {
        if(!_fits(data, start, length))
        {
            return std::nullopt;
        }
        return data.substr(start, length);
    }

    evmc::bytes toBytes(evmc::bytes_view data)
    {
        return evmc::bytes(data.data(), data.size());
    }

    std::optional<std::uint64_t> toUint64(const evmc::uint256be & word)
    {
        constexpr std::size_t prefix = WORD_SIZE - sizeof(std::uint64_t);
        for(std::size_t i = 0; i < prefix; ++i)
        {
            if(word.bytes[i] != 0)
            {
                return std::nullopt;
            }
        }

        std::uint64_t value = 0;
        for(std::size_t i = prefix; i < WORD_SIZE; ++i)
        {
            value = (value << 8) | word.bytes[i];
        }
        return value;
    }

    std::optional<std::size_t> readWordAsSizeT(evmc::bytes_view data, std::size_t offset)
    {
        if(!_fits(data, offset, WORD_SIZE))
        {
            return std::nullopt;
        }

        std::size_t value = 0;

        constexpr std::size_t prefix = WORD_SIZE - sizeof(std::size_t);
        for(std::size_t i = 0; i < prefix; ++i)
        {
            if(data[offset + i] != 0)
            {
                return std::nullopt;
            }
        }

        for(std::size_t i = prefix; i < WORD_SIZE; ++i)
        {
            value = (value << 8) | data[offset + i];
        }

        return value;
    }

    std::optional<std::uint64_t> readUint64Word(evmc::bytes_view data, std::size_t offset)
    {
        if(!_fits(data, offset, WORD_SIZE))
        {
            return std::nullopt;
        }
        return toUint64(toUint256(data, offset));
    }

    evmc::uint256be fromUint64(std::uint64_t value)
    {
        evmc::uint256be word{};
        for(std::size_t i = 0; i < sizeof(std::uint64_t); ++i)
        {
            word.bytes[WORD_SIZE - 1 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
        }
        return word;
    }

    bool isZero(const evmc::uint256be & word)
    {
        return std::all_of(std::begin(word.bytes), std::end(word.bytes), [](std::uint8_t b) { return b == 0; });
    }

    std::string toDecimalString(const evmc::uint256be & word)
    {
        // repeated long division of the big-endian digits by 10
        std::uint8_t digits[WORD_SIZE];
        std::memcpy(digits, word.bytes, WORD_SIZE);

        std::string out;
        bool non_zero = !isZero(word);
        while(non_zero)
        {
            std::uint32_t remainder = 0;
            non_zero = false;
            for(std::size_t i = 0; i < WORD_SIZE; ++i)
            {
                const std::uint32_t current = (remainder << 8) | digits[i];
                digits[i] = static_cast<std::uint8_t>(current / 10);
                remainder = current % 10;
                if(digits[i] != 0)
                {
                    non_zero = true;
                }
            }
            out.push_back(static_cast<char>('0' + remainder));
        }

        if(out.empty())
        {
            return "0";
        }

        std::reverse(out.begin(), out.end());
        return out;
    }
}
