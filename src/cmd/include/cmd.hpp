#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace tad::cmd
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
            Float,
            String
        };

        std::string name;
        NArgs nargs = NArgs::Zero;
        Type type = Type::Bool;
        std::string help;
    };

    /**
     * @brief Small command line parser.
     *
     * Flags (NArgs::Zero) are read as bool. Options taking values are read as
     * std::vector<int>, std::vector<float> or std::vector<std::string> depending on their type.
     * Unknown arguments and values that do not convert are reported by parse() and skipped.
     */
    class ArgParser
    {
    public:
        using Values = std::variant<bool, std::vector<int>, std::vector<float>, std::vector<std::string>>;

        void addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string help);

        /**
         * @return Diagnostics for rejected arguments; empty when everything was understood.
         */
        std::vector<std::string> parse(int argc, const char* const argv[]);
        std::vector<std::string> parse(const std::vector<std::string> & args);

        template<class T>
        std::optional<T> getArg(const std::string & name) const
        {
            const auto it = _values.find(name);
            if(it == _values.end())
            {
                return std::nullopt;
            }
            if(const T* value = std::get_if<T>(&it->second))
            {
                return *value;
            }
            return std::nullopt;
        }

        std::string constructHelpMessage() const;

    private:
        std::vector<CommandLineArgDef> _defs;
        std::map<std::string, Values> _values;
    };
}
