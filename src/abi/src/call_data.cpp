#include "call_data.hpp"

#include <spdlog/spdlog.h>

namespace pdp::abi
{
    namespace
    {
        // operation (1) | to (20) | value (32) | data length (32) | data
        constexpr std::size_t MULTI_SEND_ENTRY_HEADER = 1 + utils::ADDRESS_SIZE + 2 * utils::WORD_SIZE;

        std::optional<evmc::bytes_view> _find(evmc::bytes_view call_data, std::size_t depth);

        std::optional<evmc::bytes_view> _unwrapExecTransaction(evmc::bytes_view call_data, std::size_t depth)
        {
            const evmc::bytes_view args = call_data.substr(utils::SELECTOR_SIZE);

            // `bytes data` is the third argument
            const auto data_offset = utils::readWordAsSizeT(args, 2 * utils::WORD_SIZE);
            if(!data_offset)
            {
                return std::nullopt;
            }

            const auto inner = readDynamicBytes(args, *data_offset);
            if(!inner)
            {
                spdlog::debug("execTransaction data points outside of the call");
                return std::nullopt;
            }

            return _find(*inner, depth + 1);
        }

        std::optional<evmc::bytes_view> _unwrapMultiSend(evmc::bytes_view call_data, std::size_t depth)
        {
            const evmc::bytes_view args = call_data.substr(utils::SELECTOR_SIZE);

            const auto transactions_offset = utils::readWordAsSizeT(args, 0);
            if(!transactions_offset)
            {
                return std::nullopt;
            }

            const auto transactions = readDynamicBytes(args, *transactions_offset);
            if(!transactions)
            {
                spdlog::debug("multiSend transactions point outside of the call");
                return std::nullopt;
            }

            std::size_t position = 0;
            while(position + MULTI_SEND_ENTRY_HEADER <= transactions->size())
            {
                const auto data_length = utils::readWordAsSizeT(*transactions, position + 1 + utils::ADDRESS_SIZE + utils::WORD_SIZE);
                if(!data_length)
                {
                    return std::nullopt;
                }

                const auto data = utils::view(*transactions, position + MULTI_SEND_ENTRY_HEADER, *data_length);
                if(!data)
                {
                    spdlog::debug("multiSend entry at {} is truncated", position);
                    return std::nullopt;
                }

                if(const auto found = _find(*data, depth + 1))
                {
                    return found;
                }

                position += MULTI_SEND_ENTRY_HEADER + *data_length;
            }

            return std::nullopt;
        }

        std::optional<evmc::bytes_view> _find(evmc::bytes_view call_data, std::size_t depth)
        {
            if(depth > MAX_CALL_NESTING)
            {
                spdlog::warn("Call nesting deeper than {} levels, giving up", MAX_CALL_NESTING);
                return std::nullopt;
            }

            if(hasSelector(call_data, ADD_SERVICE_PROVIDER_SELECTOR))
            {
                return call_data;
            }

            if(hasSelector(call_data, EXEC_TRANSACTION_SELECTOR))
            {
                return _unwrapExecTransaction(call_data, depth);
            }

            if(hasSelector(call_data, MULTI_SEND_SELECTOR))
            {
                return _unwrapMultiSend(call_data, depth);
            }

            return std::nullopt;
        }
    }

    bool hasSelector(evmc::bytes_view call_data, const Selector & selector)
    {
        return utils::equals(call_data, 0, evmc::bytes_view{selector.data(), selector.size()});
    }

    std::optional<evmc::bytes_view> findAddServiceProviderCall(evmc::bytes_view transaction_input)
    {
        return _find(transaction_input, 0);
    }
}
