#include "parser.hpp"

#include <google/protobuf/stubs/common.h>

namespace pdp::parse
{
    Result<std::string> parseToJson(const google::protobuf::Message & message, use_protobuf_t)
    {
        google::protobuf::util::JsonPrintOptions options;
        options.add_whitespace = true; // Pretty print
        options.preserve_proto_field_names = true; // Use snake_case from proto
#if GOOGLE_PROTOBUF_VERSION >= 5026000
        options.always_print_fields_with_no_presence = true;
#else
        options.always_print_primitive_fields = true;
#endif

        std::string json_output;

        auto status = google::protobuf::util::MessageToJsonString(message, &json_output, options);

        if(!status.ok())
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE,
                std::format("invalid {}: {}", std::string(message.GetTypeName()), status.ToString())});
        }

        return json_output;
    }

    Result<void> parseFromJson(const std::string & json_str, google::protobuf::Message & message, use_protobuf_t)
    {
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;

        auto status = google::protobuf::util::JsonStringToMessage(json_str, &message, options);

        if(!status.ok())
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE,
                std::format("invalid {}: {}", std::string(message.GetTypeName()), status.ToString())});
        }

        return {};
    }
}
