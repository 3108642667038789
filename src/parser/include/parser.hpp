#pragma once

#include <string>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include "parse_error.hpp"

namespace pdp::parse
{
    /**
     * @brief Tag selecting protobuf's JSON mapping for record messages.
     */
    struct use_protobuf_t{};

    /**
     * @brief Tag selecting nlohmann::json based parsing.
     */
    struct use_json_t{};

    static constexpr use_protobuf_t use_protobuf{};

    static constexpr use_json_t use_json{};

    /**
     * @brief Converts a JSON object to a T.
     *
     * Specialized next to each type that supports it.
     *
     * @tparam T The target type.
     * @param json The JSON object to convert.
     */
    template<class T>
    Result<T> parseFromJson(json json, use_json_t);

    /**
     * @brief Prints any protobuf record as pretty JSON, keeping the proto field names.
     */
    Result<std::string> parseToJson(const google::protobuf::Message & message, use_protobuf_t);

    /**
     * @brief Fills `message` from its protobuf JSON representation. Unknown fields are ignored.
     */
    Result<void> parseFromJson(const std::string & json_str, google::protobuf::Message & message, use_protobuf_t);

    /**
     * @brief Converts a JSON string to a protobuf record of type T.
     *
     * @tparam T The message type.
     * @param json_str The JSON string to convert.
     */
    template<class T>
    Result<T> parseFromJson(const std::string & json_str, use_protobuf_t)
    {
        T message;
        const auto res = parseFromJson(json_str, message, use_protobuf);
        if(!res) return std::unexpected(res.error());
        return message;
    }
}
