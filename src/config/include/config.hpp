#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "address.hpp"
#include "parser.hpp"

namespace pdp::config
{
    // warm storage service on mainnet
    static constexpr const char * DEFAULT_CONTRACT_ADDRESS = "0xf49ba5eaCdFD5EE3744efEdf413791935FE4D4c5";

    static constexpr std::uint32_t DEFAULT_CHALLENGES_PER_PROOF = 5;
    static constexpr std::uint32_t DEFAULT_SUM_TREE_MAX_HEIGHT = 32;

    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;
        std::filesystem::path storage_path;

        // only logs emitted by this contract are projected, all logs when empty
        std::optional<chain::Address> contract_address;

        std::uint32_t challenges_per_proof = DEFAULT_CHALLENGES_PER_PROOF;
        std::uint32_t sum_tree_max_height = DEFAULT_SUM_TREE_MAX_HEIGHT;

        std::string log_level = "info";
    };

    /**
     * @brief Logs and storage directories next to the executable `bin_path`.
     */
    Config defaultConfig(const std::filesystem::path & bin_path);

    bool isValidLogLevel(const std::string & level);

    /**
     * @brief Reads a JSON config file on top of `base`. Keys missing from the file keep their `base` value.
     */
    parse::Result<Config> loadConfigFile(const std::filesystem::path & path, Config base);

    /**
     * @brief Applies the keys present in `json_obj` to `cfg`.
     */
    parse::Result<Config> mergeConfig(Config cfg, const json & json_obj);
}

namespace pdp::parse
{
    template<>
    Result<config::Config> parseFromJson(json json_obj, use_json_t);
}
