#include "cmd.hpp"

#include <charconv>
#include <format>

#include <spdlog/spdlog.h>

namespace pdp::cmd
{
    namespace
    {
        std::optional<int> _toInt(const std::string & value)
        {
            int out = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
            if(ec != std::errc{} || ptr != value.data() + value.size())
            {
                return std::nullopt;
            }
            return out;
        }
    }

    void ArgParser::addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string help)
    {
        _defs.push_back(CommandLineArgDef{
            .name = std::move(name),
            .nargs = nargs,
            .type = type,
            .help = std::move(help)
        });
    }

    const CommandLineArgDef * ArgParser::_find(const std::string & name) const
    {
        for(const CommandLineArgDef & def : _defs)
        {
            if(def.name == name) return &def;
        }
        return nullptr;
    }

    bool ArgParser::parse(int argc, char* argv[])
    {
        _values.clear();

        for(int i = 1; i < argc; ++i)
        {
            const std::string name = argv[i];
            const CommandLineArgDef * def = _find(name);
            if(def == nullptr)
            {
                spdlog::error("Unknown argument {}", name);
                return false;
            }

            auto & values = _values[name];
            if(def->nargs == CommandLineArgDef::NArgs::Zero)
            {
                continue;
            }

            while(i + 1 < argc && _find(argv[i + 1]) == nullptr)
            {
                const std::string value = argv[++i];
                if(def->type == CommandLineArgDef::Type::Int && !_toInt(value))
                {
                    spdlog::error("Argument {} expects an integer, got '{}'", name, value);
                    return false;
                }
                values.push_back(value);

                if(def->nargs == CommandLineArgDef::NArgs::One) break;
            }

            if(values.empty())
            {
                spdlog::error("Argument {} expects a value", name);
                return false;
            }
        }
        return true;
    }

    template<>
    std::optional<bool> ArgParser::getArg(const std::string & name) const
    {
        if(!_values.contains(name)) return std::nullopt;
        return true;
    }

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg(const std::string & name) const
    {
        const auto it = _values.find(name);
        if(it == _values.end()) return std::nullopt;
        return it->second;
    }

    template<>
    std::optional<std::vector<int>> ArgParser::getArg(const std::string & name) const
    {
        const auto it = _values.find(name);
        if(it == _values.end()) return std::nullopt;

        std::vector<int> out;
        for(const std::string & value : it->second)
        {
            const auto number = _toInt(value);
            if(!number) return std::nullopt;
            out.push_back(*number);
        }
        return out;
    }

    std::string ArgParser::constructHelpMessage() const
    {
        std::string message = "Arguments:\n";
        for(const CommandLineArgDef & def : _defs)
        {
            const char * value_hint = "";
            if(def.nargs != CommandLineArgDef::NArgs::Zero)
            {
                value_hint = def.type == CommandLineArgDef::Type::Int ? " <int>" : " <value>";
            }
            message += std::format("  {}{}\n      {}\n", def.name, value_hint, def.help);
        }
        return message;
    }
}
