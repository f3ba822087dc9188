#pragma once

#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Bad command line: unknown option, missing value, malformed number
 *
 * CLI::run prints the command help and exits with code 2.
 */
class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& message) : std::invalid_argument(message) {}
};

// Argument value holder; repeatable options keep every occurrence
struct ArgValue {
    std::vector<std::string> values;
    bool is_set = false;

    ArgValue() = default;
    ArgValue(const std::string& v, bool set) : values{v}, is_set(set) {}

    operator bool() const { return is_set; }

    /**
     * @brief Last occurrence, empty if unset
     */
    const std::string& value() const {
        static const std::string empty;
        return values.empty() ? empty : values.back();
    }

    int as_int(int default_val = 0) const {
        if (!is_set) return default_val;
        size_t used = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(value(), &used);
        } catch (const std::exception&) {
            throw UsageError("Expected an integer, got '" + value() + "'");
        }
        if (used != value().size()) {
            throw UsageError("Expected an integer, got '" + value() + "'");
        }
        return parsed;
    }

    size_t as_size(size_t default_val = 0) const {
        if (!is_set) return default_val;
        int parsed = as_int();
        if (parsed < 0) {
            throw UsageError("Expected a non-negative integer, got '" + value() + "'");
        }
        return static_cast<size_t>(parsed);
    }

    double as_double(double default_val = 0.0) const {
        if (!is_set) return default_val;
        size_t used = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(value(), &used);
        } catch (const std::exception&) {
            throw UsageError("Expected a number, got '" + value() + "'");
        }
        if (used != value().size()) {
            throw UsageError("Expected a number, got '" + value() + "'");
        }
        return parsed;
    }

    /**
     * @brief Every occurrence, each split on delim
     */
    std::vector<std::string> as_list(char delim = ',') const {
        std::vector<std::string> result;
        if (!is_set) return result;
        for (const auto& v : values) {
            std::stringstream ss(v);
            std::string item;
            while (std::getline(ss, item, delim)) {
                if (!item.empty()) result.push_back(item);
            }
        }
        return result;
    }
};

// Parsed arguments container
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name) const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue();
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    const std::string& require(const std::string& name) const {
        auto it = named.find(name);
        if (it == named.end() || !it->second.is_set) {
            throw UsageError("Missing required argument: --" + name);
        }
        return it->second.value();
    }
};

// Argument definition
struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;                   ///< No value; presence means true
    std::vector<std::string> choices;       ///< Allowed values, any if empty
    bool repeatable = false;                ///< Later occurrences add, not replace
};

// Command definition
struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        for (const auto& arg : args) {
            if (arg.required) {
                std::cout << " --" << arg.name << " <value>";
            }
        }
        std::cout << " [options]\n\n" << description << "\n\nOptions:\n";

        for (const auto& arg : args) {
            std::cout << "  --" << arg.name;
            if (!arg.short_name.empty()) std::cout << ", -" << arg.short_name;
            if (!arg.is_flag) {
                std::cout << " <";
                for (size_t i = 0; i < arg.choices.size(); ++i) {
                    std::cout << (i > 0 ? "|" : "") << arg.choices[i];
                }
                std::cout << (arg.choices.empty() ? "value" : "") << ">";
            }
            std::cout << "\n      " << arg.description;
            if (!arg.default_value.empty()) std::cout << " (default: " << arg.default_value << ")";
            if (arg.repeatable) std::cout << " [repeatable]";
            if (arg.required) std::cout << " [required]";
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

/**
 * @brief Parse the tokens that follow the command name
 *
 * Accepts --name value, --name=value and -s value. Everything after a bare
 * "--" is positional. Defaults are applied after parsing.
 *
 * @throws UsageError for unknown options, missing values, values outside
 *         choices, and missing required options
 */
inline Args parse_command_args(const Command& cmd, const std::vector<std::string>& tokens) {
    Args result;

    std::map<std::string, const ArgDef*> by_name;
    std::map<std::string, const ArgDef*> by_short;
    for (const auto& arg : cmd.args) {
        by_name["--" + arg.name] = &arg;
        if (!arg.short_name.empty()) by_short["-" + arg.short_name] = &arg;
    }

    auto store = [&result](const ArgDef& def, const std::string& value) {
        if (!def.choices.empty() &&
            std::find(def.choices.begin(), def.choices.end(), value) == def.choices.end()) {
            std::string allowed;
            for (const auto& c : def.choices) allowed += (allowed.empty() ? "" : ", ") + c;
            throw UsageError("Invalid value '" + value + "' for --" + def.name +
                             " (expected one of: " + allowed + ")");
        }
        ArgValue& slot = result.named[def.name];
        if (!def.repeatable) slot.values.clear();
        slot.values.push_back(value);
        slot.is_set = true;
    };

    bool options_done = false;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];

        if (options_done || token.empty() || token[0] != '-' || token == "-") {
            result.positional.push_back(token);
            continue;
        }
        if (token == "--") {
            options_done = true;
            continue;
        }

        const ArgDef* def = nullptr;
        std::string inline_value;
        bool has_inline = false;

        if (token.rfind("--", 0) == 0) {
            auto eq_pos = token.find('=');
            auto it = by_name.find(token.substr(0, eq_pos));
            if (it != by_name.end()) def = it->second;
            if (eq_pos != std::string::npos) {
                inline_value = token.substr(eq_pos + 1);
                has_inline = true;
            }
        } else {
            auto it = by_short.find(token);
            if (it != by_short.end()) def = it->second;
        }

        if (!def) {
            throw UsageError("Unknown argument: " + token);
        }

        if (def->is_flag) {
            if (has_inline) {
                throw UsageError("Flag --" + def->name + " takes no value");
            }
            store(*def, "true");
        } else if (has_inline) {
            store(*def, inline_value);
        } else {
            if (i + 1 >= tokens.size()) {
                throw UsageError("Argument " + token + " requires a value");
            }
            store(*def, tokens[++i]);
        }
    }

    for (const auto& arg : cmd.args) {
        if (result.has(arg.name)) continue;
        if (arg.required) {
            throw UsageError("Missing required argument: --" + arg.name);
        }
        if (!arg.default_value.empty()) {
            result.named[arg.name] = ArgValue(arg.default_value, true);
        }
    }

    return result;
}

// Main CLI class
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        commands_[cmd.name] = std::move(cmd);
    }

    /**
     * @return Handler exit code; 2 for usage errors, 1 for other failures
     */
    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return 2;
        }

        std::string cmd_name = argv[1];

        if (cmd_name == "--help" || cmd_name == "-h") {
            print_help();
            return 0;
        }

        if (cmd_name == "--version" || cmd_name == "-v") {
            std::cout << program_name_ << " version " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return 2;
        }

        const Command& cmd = it->second;
        std::vector<std::string> tokens(argv + 2, argv + argc);

        if (std::find(tokens.begin(), tokens.end(), "--help") != tokens.end() ||
            std::find(tokens.begin(), tokens.end(), "-h") != tokens.end()) {
            cmd.print_help(program_name_);
            return 0;
        }

        try {
            return cmd.handler(parse_command_args(cmd, tokens));
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            cmd.print_help(program_name_);
            return 2;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - corpus indexing, taxonomy and claim hygiene\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << name;
            for (size_t i = name.length(); i < 16; ++i) std::cout << " ";
            std::cout << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
        std::cout << "\nVersion: " << version_ << "\n";
    }

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace atlas
