#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pdp::cmd
{
    struct CommandLineArgDef
    {
        enum class NArgs : std::uint8_t
        {
            Zero = 0,
            One,
            Many
        };

        enum class Type : std::uint8_t
        {
            Bool = 0,
            Int,
            String
        };

        std::string name;
        NArgs nargs = NArgs::Zero;
        Type type = Type::Bool;
        std::string help;
    };

    class ArgParser
    {
    public:
        ArgParser() = default;

        void addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string help);

        /**
         * @brief Parses argv. Unknown flags and missing or mistyped values are reported and fail the parse.
         */
        bool parse(int argc, char* argv[]);

        /**
         * @brief Value of a parsed argument.
         *
         * `bool` for flags without values, `std::vector<int>` or `std::vector<std::string>` otherwise.
         */
        template<class T>
        std::optional<T> getArg(const std::string & name) const;

        std::string constructHelpMessage() const;

    private:
        const CommandLineArgDef * _find(const std::string & name) const;

        std::vector<CommandLineArgDef> _defs;
        std::map<std::string, std::vector<std::string>> _values;
    };
}

namespace pdp::cmd
{
    template<>
    std::optional<bool> ArgParser::getArg(const std::string & name) const;

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg(const std::string & name) const;

    template<>
    std::optional<std::vector<int>> ArgParser::getArg(const std::string & name) const;
}
