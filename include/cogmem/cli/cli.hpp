#pragma once

#include "cogmem/core/errors.hpp"
#include "cogmem/core/time_utils.hpp"
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cogmem {
namespace cli {

// Argument value holder
struct ArgValue {
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }
    operator std::string() const { return value; }

    int as_int(int default_val = 0) const {
        if (!is_set) return default_val;
        try { return std::stoi(value); }
        catch (const std::exception&) { return default_val; }
    }

    double as_double(double default_val = 0.0) const {
        if (!is_set) return default_val;
        try { return std::stod(value); }
        catch (const std::exception&) { return default_val; }
    }

    /**
     * @brief ISO-8601 time, or "now" / unset for the wall clock
     *
     * @throws std::invalid_argument on malformed input
     */
    Timestamp as_timestamp() const {
        if (!is_set || value.empty() || value == "now") return now_utc();
        return from_iso8601(value);
    }

    std::vector<std::string> as_list(char delim = ',') const {
        std::vector<std::string> result;
        if (!is_set) return result;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, delim)) {
            if (!item.empty()) result.push_back(item);
        }
        return result;
    }
};

// Parsed arguments container
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name, const std::string& default_val = "") const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{default_val, !default_val.empty()};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    std::string require(const std::string& name) const {
        auto it = named.find(name);
        if (it == named.end() || !it->second.is_set) {
            throw std::runtime_error("Missing required argument: --" + name);
        }
        return it->second.value;
    }

    /**
     * @brief Positional argument by index
     */
    std::string positional_at(size_t index, const std::string& what) const {
        if (index >= positional.size()) {
            throw std::runtime_error("Missing argument: <" + what + ">");
        }
        return positional[index];
    }
};

// Argument definition
struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;  // If true, no value expected (presence = true)
};

// Command definition
struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;
    std::string positional_usage;   // e.g. "<text>"

    void print_help(const std::string& program_name, const std::vector<ArgDef>& global_args) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        if (!positional_usage.empty()) {
            std::cout << " " << positional_usage;
        }
        for (const auto& arg : args) {
            if (arg.required) {
                std::cout << " --" << arg.name << " <value>";
            }
        }
        std::cout << " [options]\n\n";
        std::cout << description << "\n\n";
        std::cout << "Options:\n";
        print_args(args);
        std::cout << "\nGlobal options:\n";
        print_args(global_args);
        std::cout << "\n";
    }

    static void print_args(const std::vector<ArgDef>& defs) {
        for (const auto& arg : defs) {
            std::cout << "  --" << arg.name;
            if (!arg.short_name.empty()) {
                std::cout << ", -" << arg.short_name;
            }
            if (!arg.is_flag) {
                std::cout << " <value>";
            }
            std::cout << "\n";
            std::cout << "      " << arg.description;
            if (!arg.default_value.empty()) {
                std::cout << " (default: " << arg.default_value << ")";
            }
            if (arg.required) {
                std::cout << " [required]";
            }
            std::cout << "\n";
        }
    }
};

/**
 * @brief Subcommand dispatcher with options shared by every command
 *
 * Exit codes: 0 success, 1 usage or runtime error, 2 permission denied,
 * 3 storage unavailable.
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        commands_[cmd.name] = std::move(cmd);
    }

    /**
     * @brief Option accepted by every command (--db, --user, ...)
     */
    void add_global_arg(ArgDef def) {
        global_args_.push_back(std::move(def));
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return 1;
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
            return 1;
        }

        const Command& cmd = it->second;

        // Check for command-level help
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cmd.print_help(program_name_, global_args_);
                return 0;
            }
        }

        // Parse arguments
        Args args;
        try {
            args = parse_args(argc - 2, argv + 2, cmd);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            cmd.print_help(program_name_, global_args_);
            return 1;
        }

        // Run handler
        try {
            return cmd.handler(args);
        } catch (const PermissionDenied& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 2;
        } catch (const StorageUnavailable& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 3;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - Cognitive memory engine\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << name;
            // Pad to 16 chars
            for (size_t i = name.length(); i < 16; ++i) std::cout << " ";
            std::cout << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
        std::cout << "\nVersion: " << version_ << "\n";
    }

private:
    Args parse_args(int argc, char** argv, const Command& cmd) {
        Args result;

        std::vector<const ArgDef*> all_defs;
        for (const auto& arg : cmd.args) all_defs.push_back(&arg);
        for (const auto& arg : global_args_) all_defs.push_back(&arg);

        // Build lookup maps
        std::map<std::string, const ArgDef*> by_name;
        std::map<std::string, const ArgDef*> by_short;
        for (const auto* arg : all_defs) {
            by_name["--" + arg->name] = arg;
            if (!arg->short_name.empty()) {
                by_short["-" + arg->short_name] = arg;
            }
        }

        // Parse
        for (int i = 0; i < argc; ++i) {
            std::string arg = argv[i];

            const ArgDef* def = nullptr;
            if (arg.rfind("--", 0) == 0) {
                // Check for --name=value format
                auto eq_pos = arg.find('=');
                if (eq_pos != std::string::npos) {
                    std::string name_part = arg.substr(0, eq_pos);
                    std::string value_part = arg.substr(eq_pos + 1);
                    auto it = by_name.find(name_part);
                    if (it != by_name.end()) {
                        def = it->second;
                        result.named[def->name] = ArgValue{value_part, true};
                        continue;
                    }
                }
                auto it = by_name.find(arg);
                if (it != by_name.end()) def = it->second;
            } else if (arg.rfind("-", 0) == 0 && arg.length() == 2) {
                auto it = by_short.find(arg);
                if (it != by_short.end()) def = it->second;
            } else {
                result.positional.push_back(arg);
                continue;
            }

            if (!def) {
                throw std::runtime_error("Unknown argument: " + arg);
            }

            if (def->is_flag) {
                result.named[def->name] = ArgValue{"true", true};
            } else {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Argument " + arg + " requires a value");
                }
                result.named[def->name] = ArgValue{argv[++i], true};
            }
        }

        // Apply defaults and check required
        for (const auto* arg : all_defs) {
            if (result.named.find(arg->name) == result.named.end()) {
                if (arg->required) {
                    throw std::runtime_error("Missing required argument: --" + arg->name);
                }
                if (!arg->default_value.empty()) {
                    result.named[arg->name] = ArgValue{arg->default_value, true};
                }
            }
        }

        return result;
    }

    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
    std::vector<ArgDef> global_args_;
};

} // namespace cli
} // namespace cogmem
