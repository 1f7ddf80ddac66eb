#include "cmd.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <system_error>

namespace tad::cmd
{
    namespace
    {
        template<class T>
        std::optional<T> _convert(const std::string & text)
        {
            T value{};
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if(ec != std::errc() || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        bool _looksLikeOption(const std::string & token)
        {
            // negative numbers are values
            if(token.size() < 2 || token.front() != '-') return false;
            return !(std::isdigit(static_cast<unsigned char>(token[1])) || token[1] == '.');
        }

        const char* _typeName(CommandLineArgDef::Type type)
        {
            switch(type)
            {
                case CommandLineArgDef::Type::Int:      return "int";
                case CommandLineArgDef::Type::Float:    return "float";
                case CommandLineArgDef::Type::String:   return "string";
                default:                                return "";
            }
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

    std::vector<std::string> ArgParser::parse(int argc, const char* const argv[])
    {
        std::vector<std::string> args;
        for(int i = 1; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        return parse(args);
    }

    std::vector<std::string> ArgParser::parse(const std::vector<std::string> & args)
    {
        std::vector<std::string> diagnostics;

        for(std::size_t i = 0; i < args.size(); ++i)
        {
            const auto def = std::find_if(_defs.begin(), _defs.end(),
                [&](const CommandLineArgDef & candidate) { return candidate.name == args[i]; });

            if(def == _defs.end())
            {
                diagnostics.push_back(std::format("unknown argument '{}'", args[i]));
                continue;
            }

            if(def->nargs == CommandLineArgDef::NArgs::Zero)
            {
                _values[def->name] = true;
                continue;
            }

            std::vector<std::string> raw;
            while(i + 1 < args.size() && !_looksLikeOption(args[i + 1]))
            {
                raw.push_back(args[++i]);
                if(def->nargs == CommandLineArgDef::NArgs::One) break;
            }

            if(raw.empty())
            {
                diagnostics.push_back(std::format("'{}' expects a value", def->name));
                continue;
            }

            switch(def->type)
            {
                case CommandLineArgDef::Type::Int:
                {
                    std::vector<int> values;
                    for(const std::string & text : raw)
                    {
                        if(const auto value = _convert<int>(text)) values.push_back(*value);
                        else diagnostics.push_back(std::format("'{}' is not an integer for {}", text, def->name));
                    }
                    if(!values.empty()) _values[def->name] = std::move(values);
                    break;
                }
                case CommandLineArgDef::Type::Float:
                {
                    std::vector<float> values;
                    for(const std::string & text : raw)
                    {
                        if(const auto value = _convert<float>(text)) values.push_back(*value);
                        else diagnostics.push_back(std::format("'{}' is not a number for {}", text, def->name));
                    }
                    if(!values.empty()) _values[def->name] = std::move(values);
                    break;
                }
                case CommandLineArgDef::Type::String:
                    _values[def->name] = std::move(raw);
                    break;

                case CommandLineArgDef::Type::Bool:
                    _values[def->name] = true;
                    break;
            }
        }
        return diagnostics;
    }

    std::string ArgParser::constructHelpMessage() const
    {
        std::size_t width = 0;
        for(const CommandLineArgDef & def : _defs)
        {
            const std::string type = _typeName(def.type);
            width = std::max(width, def.name.size() + (def.nargs == CommandLineArgDef::NArgs::Zero ? 0 : type.size() + 3));
        }

        std::string message = "Usage:\n";
        for(const CommandLineArgDef & def : _defs)
        {
            std::string usage = def.name;
            if(def.nargs != CommandLineArgDef::NArgs::Zero)
            {
                usage += std::format(" <{}>", _typeName(def.type));
                if(def.nargs == CommandLineArgDef::NArgs::Many) usage += "...";
            }
            message += std::format("  {:<{}}  {}\n", usage, width + 3, def.help);
        }
        return message;
    }
}
