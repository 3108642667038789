#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "abi_value.hpp"
#include "address.hpp"
#include "bytes.hpp"

namespace pdp::abi
{
    struct StringAddressBoolBytesResult
    {
        std::string string_value;
        chain::Address address_value{};
        bool bool_value = false;
        evmc::bytes bytes_value;
    };

    struct BytesStringResult
    {
        evmc::bytes bytes_value;
        std::string string_value;
    };

    struct AddServiceProviderParams
    {
        chain::Address provider{};
        std::string pdp_url;
        std::string piece_retrieval_url;
    };

    /**
     * @brief Locates the tail of a dynamic `bytes`/`string` value.
     *
     * The tail starts at `offset` with a 32 byte length word, followed by the content.
     * Padding after the content is ignored.
     *
     * @return A view of the content, or std::nullopt when the length word or the content
     *         would read past `data`.
     */
    std::optional<evmc::bytes_view> readDynamicBytes(evmc::bytes_view data, std::size_t offset);

    /**
     * @brief Decodes a head/tail encoded tuple of the given field types.
     *
     * Always returns one value per field. When `data` is shorter than the head
     * every field holds its zero value. Otherwise each field is decoded on its own and
     * a dynamic field whose offset or length points outside `data` falls back to its zero value.
     */
    std::vector<AbiValue> decodeTuple(evmc::bytes_view data, std::span<const AbiType> layout);

    /**
     * @brief (string, address, bool, bytes)
     */
    StringAddressBoolBytesResult decodeStringAddressBoolBytes(evmc::bytes_view data);

    /**
     * @brief (bytes, string)
     */
    BytesStringResult decodeBytesString(evmc::bytes_view data);

    /**
     * @brief addServiceProvider(address provider, string pdpUrl, string pieceRetrievalUrl) call data.
     *
     * The leading 4 byte selector is skipped and not checked.
     */
    AddServiceProviderParams decodeAddServiceProviderFunction(evmc::bytes_view call_data);

    /**
     * @brief uint256[] located at `array_offset`. Elements must fit into 64 bits.
     */
    std::optional<std::vector<std::uint64_t>> decodeUint64Array(evmc::bytes_view data, std::size_t array_offset);
}
