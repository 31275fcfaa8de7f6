#pragma once

#include "common/errors.hpp"
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace kgsynth {

// Argument value holder
struct ArgValue {
    std::string value;
    bool is_set = false;

    // Throws std::runtime_error unless the whole value is a number
    double as_double() const {
        size_t consumed = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(value, &consumed);
        } catch (const std::exception&) {
            throw std::runtime_error("Expected a number, got '" + value + "'");
        }
        if (consumed != value.size()) {
            throw std::runtime_error("Expected a number, got '" + value + "'");
        }
        return parsed;
    }

    bool as_flag() const { return is_set && value == "true"; }
};

// Parsed arguments container
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    // Unset arguments come back with is_set == false; defaults live in the config structs
    ArgValue get(const std::string& name) const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }
};

// Argument definition
struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    bool is_flag = false;  // If true, no value expected (presence = true)
};

// Command definition
struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;
    std::string positional_usage;  // e.g. "<input_file>", shown in help

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        if (!positional_usage.empty()) {
            std::cout << " " << positional_usage;
        }
        std::cout << " [options]\n\n";
        std::cout << description << "\n\n";
        std::cout << "Options:\n";
        for (const auto& arg : args) {
            std::cout << "  --" << arg.name;
            if (!arg.short_name.empty()) {
                std::cout << ", -" << arg.short_name;
            }
            if (!arg.is_flag) {
                std::cout << " <value>";
            }
            std::cout << "\n";
            std::cout << "      " << arg.description << "\n";
        }
        std::cout << "\n";
    }
};

// Main CLI class
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        commands_[cmd.name] = std::move(cmd);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return to_int(ExitCode::Usage);
        }

        std::string cmd_name = argv[1];

        if (cmd_name == "--help" || cmd_name == "-h") {
            print_help();
            return to_int(ExitCode::Success);
        }

        if (cmd_name == "--version" || cmd_name == "-v") {
            std::cout << program_name_ << " version " << version_ << "\n";
            return to_int(ExitCode::Success);
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return to_int(ExitCode::Usage);
        }

        const Command& cmd = it->second;

        // Check for command-level help
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cmd.print_help(program_name_);
                return to_int(ExitCode::Success);
            }
        }

        // Parse arguments
        Args args;
        try {
            args = parse_args(argc - 2, argv + 2, cmd);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            cmd.print_help(program_name_);
            return to_int(ExitCode::Usage);
        }

        // Run handler; fatal errors carry their own exit code
        try {
            return cmd.handler(args);
        } catch (const Error& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return to_int(e.exit_code());
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return to_int(ExitCode::Usage);
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - Knowledge Graph Synthesis CLI\n\n";
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

        // Build lookup maps
        std::map<std::string, const ArgDef*> by_name;
        std::map<std::string, const ArgDef*> by_short;
        for (const auto& arg : cmd.args) {
            by_name["--" + arg.name] = &arg;
            if (!arg.short_name.empty()) {
                by_short["-" + arg.short_name] = &arg;
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

        return result;
    }

    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace kgsynth
