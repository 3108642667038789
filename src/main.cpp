#include "pdp_indexer.hpp"

static void _configureLogger(const std::filesystem::path& logs_path, spdlog::level::level_enum console_level)
{
    std::filesystem::create_directories(logs_path);

    // Create sinks
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    const std::string log_name = pdp::utils::currentTimestamp() + "-PDPIndexer.log";
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (logs_path / log_name).string(), true);

    // set different log levels per sink
    console_sink->set_level(console_level);
    file_sink->set_level(spdlog::level::debug);
    console_sink->set_pattern("[%T] [%^%l%$] %v");
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

    spdlog::logger logger("multi_sink", {console_sink, file_sink});
    logger.set_level(spdlog::level::debug);
    logger.flush_on(spdlog::level::info);

    spdlog::set_default_logger(std::make_shared<spdlog::logger>(logger));
}

int main(int argc, char* argv[])
{
    pdp::config::Config cfg = pdp::config::defaultConfig(std::filesystem::path(argv[0]));

    pdp::cmd::ArgParser arg_parser;
    arg_parser.addArg("-h", pdp::cmd::CommandLineArgDef::NArgs::Zero, pdp::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--help", pdp::cmd::CommandLineArgDef::NArgs::Zero, pdp::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--version", pdp::cmd::CommandLineArgDef::NArgs::Zero, pdp::cmd::CommandLineArgDef::Type::Bool, "Display version and exit");
    arg_parser.addArg("--config", pdp::cmd::CommandLineArgDef::NArgs::One, pdp::cmd::CommandLineArgDef::Type::String, "JSON config file");
    arg_parser.addArg("--logs", pdp::cmd::CommandLineArgDef::NArgs::Many, pdp::cmd::CommandLineArgDef::Type::String, "JSON files holding eth_getLogs results to project");
    arg_parser.addArg("--storage", pdp::cmd::CommandLineArgDef::NArgs::One, pdp::cmd::CommandLineArgDef::Type::String, "Directory of the record store");
    arg_parser.addArg("--contract", pdp::cmd::CommandLineArgDef::NArgs::One, pdp::cmd::CommandLineArgDef::Type::String, "Only project logs of this contract, empty string for all");
    arg_parser.addArg("--log-level", pdp::cmd::CommandLineArgDef::NArgs::One, pdp::cmd::CommandLineArgDef::Type::String, "Console log level");

    if(!arg_parser.parse(argc, argv))
    {
        std::printf("%s", arg_parser.constructHelpMessage().c_str());
        return 1;
    }

    if(arg_parser.getArg<bool>("--help").value_or(false) || arg_parser.getArg<bool>("-h").value_or(false))
    {
        std::printf("%s", arg_parser.constructHelpMessage().c_str());
        return 0;
    }

    if(const auto config_arg = arg_parser.getArg<std::vector<std::string>>("--config"))
    {
        const auto config_res = pdp::config::loadConfigFile(config_arg->at(0), cfg);
        if(!config_res)
        {
            std::fprintf(stderr, "%s\n", std::format("Invalid config: {} {}", config_res.error().kind, config_res.error().message).c_str());
            return 1;
        }
        cfg = *config_res;
    }

    if(const auto storage_arg = arg_parser.getArg<std::vector<std::string>>("--storage"))
    {
        cfg.storage_path = storage_arg->at(0);
    }

    if(const auto contract_arg = arg_parser.getArg<std::vector<std::string>>("--contract"))
    {
        if(contract_arg->at(0).empty())
        {
            cfg.contract_address.reset();
        }
        else if(const auto address = pdp::chain::parseAddress(contract_arg->at(0)))
        {
            cfg.contract_address = *address;
        }
        else
        {
            std::fprintf(stderr, "Invalid --contract address\n");
            return 1;
        }
    }

    if(const auto level_arg = arg_parser.getArg<std::vector<std::string>>("--log-level"))
    {
        if(!pdp::config::isValidLogLevel(level_arg->at(0)))
        {
            std::fprintf(stderr, "Invalid --log-level\n");
            return 1;
        }
        cfg.log_level = level_arg->at(0);
    }

    _configureLogger(cfg.logs_path, spdlog::level::from_str(cfg.log_level));

    const std::string build_timestamp = pdp::utils::loadBuildTimestamp(cfg.bin_path.parent_path() / "build_timestamp");
    spdlog::debug("Build timestamp: {}", build_timestamp);

    spdlog::debug("Version: {}.{}.{}", pdp::MAJOR_VERSION, pdp::MINOR_VERSION, pdp::PATCH_VERSION);

    if(arg_parser.getArg<bool>("--version").value_or(false))
    {
        spdlog::info("PDP indexer build timestamp: {}", build_timestamp);
        spdlog::info("Version: {}.{}.{}", pdp::MAJOR_VERSION, pdp::MINOR_VERSION, pdp::PATCH_VERSION);
        return 0;
    }

    spdlog::debug("PDP indexer started with {} arguments", argc);
    for(int i = 0; i < argc; ++i)
    {
        spdlog::debug("Argument at [{}] : {}", i, argv[i]);
    }

    const auto log_files = arg_parser.getArg<std::vector<std::string>>("--logs");
    if(!log_files)
    {
        spdlog::error("No --logs given, nothing to project");
        return 1;
    }

    std::vector<pdp::chain::EventLog> logs;
    for(const std::string & log_file : *log_files)
    {
        const auto content = pdp::file::loadTextFile(log_file);
        if(!content)
        {
            return 1;
        }

        const json logs_json = json::parse(*content, nullptr, false);
        if(logs_json.is_discarded())
        {
            spdlog::error("{} is not valid JSON", log_file);
            return 1;
        }

        // either a bare array or a JSON-RPC response
        auto parsed = pdp::chain::parseLogs(logs_json.contains("result") ? logs_json["result"] : logs_json);
        spdlog::info("Loaded {} logs from {}", parsed.size(), log_file);
        std::ranges::move(parsed, std::back_inserter(logs));
    }

    spdlog::info("Storage path: {}", cfg.storage_path.string());
    if(cfg.contract_address)
    {
        spdlog::info("Watching contract {}", pdp::chain::toHexString(*cfg.contract_address));
    }

    pdp::store::JsonFileStore store(cfg.storage_path);
    pdp::sumtree::SumTree sum_tree(store, cfg.sum_tree_max_height);
    pdp::projector::EventProjector projector(store, sum_tree, pdp::projector::ProjectorConfig{
        .contract_address = cfg.contract_address,
        .challenges_per_proof = cfg.challenges_per_proof
    });

    const auto summary = projector.projectAll(std::move(logs));

    spdlog::shutdown();
    return summary.failed == 0 ? 0 : 2;
}
