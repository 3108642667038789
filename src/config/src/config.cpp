#include "config.hpp"

#include <array>
#include <fstream>

#include <spdlog/spdlog.h>

namespace pdp::config
{
    namespace
    {
        parse::Result<std::uint32_t> _readUnsigned(const json & json_obj, const char * key, std::uint32_t min, std::uint32_t max)
        {
            const auto & value = json_obj.at(key);
            if(!value.is_number_unsigned())
            {
                return std::unexpected(parse::Error{parse::Error::Kind::TYPE_MISMATCH, std::format("{} must be an unsigned number", key)});
            }

            const auto number = value.get<std::uint64_t>();
            if(number < min || number > max)
            {
                return std::unexpected(parse::Error{parse::Error::Kind::OUT_OF_RANGE, std::format("{} must be in [{}, {}]", key, min, max)});
            }
            return static_cast<std::uint32_t>(number);
        }

        parse::Result<std::string> _readString(const json & json_obj, const char * key)
        {
            const auto & value = json_obj.at(key);
            if(!value.is_string())
            {
                return std::unexpected(parse::Error{parse::Error::Kind::TYPE_MISMATCH, std::format("{} must be a string", key)});
            }
            return value.get<std::string>();
        }
    }

    Config defaultConfig(const std::filesystem::path & bin_path)
    {
        Config cfg;
        cfg.bin_path = bin_path;
        cfg.logs_path = bin_path.parent_path() / "logs";
        cfg.storage_path = bin_path.parent_path() / "storage";
        cfg.contract_address = chain::parseAddress(DEFAULT_CONTRACT_ADDRESS);
        return cfg;
    }

    bool isValidLogLevel(const std::string & level)
    {
        static constexpr std::array<const char *, 7> LEVELS{"trace", "debug", "info", "warn", "error", "critical", "off"};
        for(const char * known : LEVELS)
        {
            if(level == known) return true;
        }
        return false;
    }

    parse::Result<Config> mergeConfig(Config cfg, const json & json_obj)
    {
        if(!json_obj.is_object())
        {
            return std::unexpected(parse::Error{parse::Error::Kind::TYPE_MISMATCH, "config must be a JSON object"});
        }

        if(json_obj.contains("storage_path"))
        {
            const auto storage_path = _readString(json_obj, "storage_path");
            if(!storage_path) return std::unexpected(storage_path.error());
            cfg.storage_path = *storage_path;
        }

        if(json_obj.contains("logs_path"))
        {
            const auto logs_path = _readString(json_obj, "logs_path");
            if(!logs_path) return std::unexpected(logs_path.error());
            cfg.logs_path = *logs_path;
        }

        if(json_obj.contains("contract_address"))
        {
            const auto address_str = _readString(json_obj, "contract_address");
            if(!address_str) return std::unexpected(address_str.error());

            if(address_str->empty())
            {
                cfg.contract_address.reset();
            }
            else
            {
                const auto address = chain::parseAddress(*address_str);
                if(!address)
                {
                    return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE, std::format("invalid contract_address '{}'", *address_str)});
                }
                cfg.contract_address = *address;
            }
        }

        if(json_obj.contains("challenges_per_proof"))
        {
            const auto challenges = _readUnsigned(json_obj, "challenges_per_proof", 1, 1024);
            if(!challenges) return std::unexpected(challenges.error());
            cfg.challenges_per_proof = *challenges;
        }

        if(json_obj.contains("sum_tree_max_height"))
        {
            const auto height = _readUnsigned(json_obj, "sum_tree_max_height", 1, 63);
            if(!height) return std::unexpected(height.error());
            cfg.sum_tree_max_height = *height;
        }

        if(json_obj.contains("log_level"))
        {
            const auto level = _readString(json_obj, "log_level");
            if(!level) return std::unexpected(level.error());
            if(!isValidLogLevel(*level))
            {
                return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE, std::format("unknown log_level '{}'", *level)});
            }
            cfg.log_level = *level;
        }

        return cfg;
    }

    parse::Result<Config> loadConfigFile(const std::filesystem::path & path, Config base)
    {
        std::ifstream file(path);
        if(!file.is_open())
        {
            return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE, std::format("cannot open config file '{}'", path.string())});
        }

        const json json_obj = json::parse(file, nullptr, false);
        if(json_obj.is_discarded())
        {
            return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE, std::format("config file '{}' is not valid JSON", path.string())});
        }

        spdlog::debug("Loading config from {}", path.string());
        return mergeConfig(std::move(base), json_obj);
    }
}

namespace pdp::parse
{
    template<>
    Result<config::Config> parseFromJson(json json_obj, use_json_t)
    {
        return config::mergeConfig(config::Config{}, json_obj);
    }
}
