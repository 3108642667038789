#include "json_file_store.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "parser.hpp"

namespace pdp::store
{
    namespace
    {
        std::string _sanitizeRecordName(std::string name)
        {
            for(char & c : name)
            {
                if(c == '\\' || c == '/' || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|')
                {
                    c = '_';
                }
            }
            return name;
        }
    }

    JsonFileStore::JsonFileStore(std::filesystem::path root)
    : _root(std::move(root))
    {
    }

    const std::filesystem::path & JsonFileStore::root() const noexcept
    {
        return _root;
    }

    std::filesystem::path JsonFileStore::recordPath(const std::string & type_name, const std::string & key) const
    {
        return _root / type_name / (_sanitizeRecordName(key) + ".json");
    }

    bool JsonFileStore::load(const std::string & key, google::protobuf::Message & out) const
    {
        const auto input_path = recordPath(recordTypeName(out), key);

        std::error_code ec;
        if(!std::filesystem::exists(input_path, ec))
        {
            return false;
        }

        std::ifstream input(input_path);
        if(!input.is_open())
        {
            spdlog::warn("Failed to open record '{}'", input_path.string());
            return false;
        }

        std::stringstream buffer;
        buffer << input.rdbuf();

        out.Clear();
        const auto parse_res = parse::parseFromJson(buffer.str(), out, parse::use_protobuf);
        if(!parse_res)
        {
            spdlog::error(std::format("Failed to parse record '{}': {} {}", input_path.string(), parse_res.error().kind, parse_res.error().message));
            return false;
        }
        return true;
    }

    bool JsonFileStore::save(const std::string & key, const google::protobuf::Message & record)
    {
        const auto out_dir = _root / recordTypeName(record);
        try
        {
            std::filesystem::create_directories(out_dir);
        }
        catch(const std::exception & e)
        {
            spdlog::warn("Failed to create storage directory '{}': {}", out_dir.string(), e.what());
            return false;
        }

        const auto json_res = parse::parseToJson(record, parse::use_protobuf);
        if(!json_res)
        {
            spdlog::warn("Failed to serialize record '{}': {}", key, json_res.error().message);
            return false;
        }

        const auto output_path = recordPath(recordTypeName(record), key);
        std::ofstream output(output_path, std::ios::out | std::ios::trunc);
        if(!output.is_open())
        {
            spdlog::warn("Failed to open record output '{}'", output_path.string());
            return false;
        }

        output << *json_res;
        return output.good();
    }
}
