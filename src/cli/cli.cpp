#include "cli/cli.hpp"
#include "core/errors.hpp"
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sdb {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

void print_option(const ArgDef& arg) {
    std::cout << "  --" << arg.name;
    if (!arg.short_name.empty()) {
        std::cout << ", -" << arg.short_name;
    }
    if (!arg.is_flag) {
        std::cout << " <value>";
    }
    std::cout << "\n      " << arg.description;
    if (!arg.default_value.empty()) {
        std::cout << " (default: " << arg.default_value << ")";
    }
    if (arg.required) {
        std::cout << " [required]";
    }
    std::cout << "\n";
}

} // namespace

// ==========================================
// ArgValue / Args
// ==========================================

int ArgValue::as_int(int default_val) const {
    if (!is_set) return default_val;
    try {
        size_t consumed = 0;
        int result = std::stoi(value, &consumed);
        if (consumed == value.size()) return result;
    } catch (const std::logic_error&) {
        // reported below
    }
    throw ValidationError("--" + name + " expects an integer, got '" + value + "'");
}

double ArgValue::as_double(double default_val) const {
    if (!is_set) return default_val;
    try {
        size_t consumed = 0;
        double result = std::stod(value, &consumed);
        if (consumed == value.size()) return result;
    } catch (const std::logic_error&) {
        // reported below
    }
    throw ValidationError("--" + name + " expects a number, got '" + value + "'");
}

double ArgValue::as_unit(double default_val) const {
    double result = as_double(default_val);
    if (result < 0.0 || result > 1.0) {
        throw ValidationError("--" + name + " must be between 0.0 and 1.0, got " + value);
    }
    return result;
}

std::vector<std::string> ArgValue::as_list(char delim) const {
    std::vector<std::string> result;
    if (!is_set) return result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

ArgValue Args::get(const std::string& name, const std::string& default_val) const {
    auto it = named.find(name);
    if (it != named.end()) return it->second;
    return ArgValue{name, default_val, !default_val.empty()};
}

bool Args::has(const std::string& name) const {
    auto it = named.find(name);
    return it != named.end() && it->second.is_set;
}

std::string Args::require(const std::string& name) const {
    if (!has(name)) {
        throw ValidationError("missing required argument: --" + name);
    }
    return named.at(name).value;
}

// ==========================================
// CLI
// ==========================================

CLI::CLI(const std::string& program_name, const std::string& version)
    : program_name_(program_name), version_(version) {}

void CLI::add_global_arg(ArgDef arg) {
    global_args_.push_back(std::move(arg));
}

void CLI::register_command(Command cmd) {
    std::string name = cmd.name;
    commands_[name] = std::move(cmd);
}

const Command* CLI::find_command(const std::string& name) const {
    auto it = commands_.find(name);
    return it != commands_.end() ? &it->second : nullptr;
}

std::vector<ArgDef> CLI::effective_args(const Command& cmd) const {
    std::vector<ArgDef> args = cmd.args;
    for (ArgDef global : global_args_) {
        if (global.name == INPUT_ARG) {
            global.required = cmd.input_required;
        }
        args.push_back(std::move(global));
    }
    return args;
}

int CLI::run(int argc, char** argv) {
    if (argc < 2) {
        print_help();
        return 1;
    }

    std::string cmd_name = argv[1];
    if (cmd_name == "--help" || cmd_name == "-h") {
        print_help();
        return 0;
    }
    if (cmd_name == "--version") {
        std::cout << program_name_ << " " << version_ << "\n";
        return 0;
    }

    const Command* cmd = find_command(cmd_name);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmd_name << "\n";
        std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
        return 1;
    }

    std::vector<std::string> rest(argv + 2, argv + argc);
    for (const auto& arg : rest) {
        if (arg == "--help" || arg == "-h") {
            print_command_help(*cmd);
            return 0;
        }
    }

    Args args;
    try {
        args = parse_args(*cmd, rest);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_command_help(*cmd);
        return 1;
    }

    try {
        return cmd->handler(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

Args CLI::parse_args(const Command& cmd, const std::vector<std::string>& argv) const {
    std::vector<ArgDef> defs = effective_args(cmd);

    std::map<std::string, const ArgDef*> by_name;
    std::map<std::string, const ArgDef*> by_short;
    for (const auto& def : defs) {
        by_name["--" + def.name] = &def;
        if (!def.short_name.empty()) {
            by_short["-" + def.short_name] = &def;
        }
    }

    Args result;
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];

        const ArgDef* def = nullptr;
        std::string inline_value;
        bool has_inline = false;

        if (arg.rfind("--", 0) == 0) {
            auto eq_pos = arg.find('=');
            auto it = by_name.find(arg.substr(0, eq_pos));
            if (it != by_name.end()) def = it->second;
            if (eq_pos != std::string::npos) {
                inline_value = arg.substr(eq_pos + 1);
                has_inline = true;
            }
        } else if (arg.size() == 2 && arg[0] == '-') {
            auto it = by_short.find(arg);
            if (it != by_short.end()) def = it->second;
        } else {
            result.positional.push_back(arg);
            continue;
        }

        if (!def) {
            throw ValidationError("unknown argument for '" + cmd.name + "': " + arg);
        }

        if (def->is_flag) {
            if (has_inline) {
                throw ValidationError("--" + def->name + " does not take a value");
            }
            result.named[def->name] = ArgValue{def->name, "true", true};
        } else if (has_inline) {
            result.named[def->name] = ArgValue{def->name, inline_value, true};
        } else {
            if (i + 1 >= argv.size()) {
                throw ValidationError("--" + def->name + " requires a value");
            }
            result.named[def->name] = ArgValue{def->name, argv[++i], true};
        }
    }

    for (const auto& def : defs) {
        if (result.named.count(def.name) > 0) {
            continue;
        }
        if (def.required) {
            throw ValidationError("missing required argument: --" + def.name);
        }
        if (!def.default_value.empty()) {
            result.named[def.name] = ArgValue{def.name, def.default_value, true};
        }
    }

    return result;
}

void CLI::print_help() const {
    std::cout << program_name_ << " - semantic tension graph\n\n";
    std::cout << "Usage: " << program_name_ << " <command> [options]\n\n";
    std::cout << "Commands:\n";
    for (const auto& [name, cmd] : commands_) {
        std::cout << "  " << name;
        for (size_t i = name.length(); i < 12; ++i) std::cout << " ";
        std::cout << cmd.description << "\n";
    }

    if (!global_args_.empty()) {
        std::cout << "\nOptions accepted by every command:\n";
        for (const auto& arg : global_args_) {
            print_option(arg);
        }
    }

    std::cout << "\nRun '" << program_name_ << " <command> --help' for command options.\n";
    std::cout << "Version: " << version_ << "\n";
}

void CLI::print_command_help(const Command& cmd) const {
    std::cout << "\nUsage: " << program_name_ << " " << cmd.name;
    if (cmd.input_required) {
        std::cout << " --" << INPUT_ARG << " <graph.json>";
    }
    for (const auto& arg : cmd.args) {
        if (arg.required) {
            std::cout << " --" << arg.name << " <value>";
        }
    }
    std::cout << " [options]\n\n" << cmd.description << "\n\n";

    if (!cmd.args.empty()) {
        std::cout << "Options:\n";
        for (const auto& arg : cmd.args) {
            print_option(arg);
        }
        std::cout << "\n";
    }

    std::cout << "Shared options:\n";
    auto args = effective_args(cmd);
    for (size_t i = cmd.args.size(); i < args.size(); ++i) {
        print_option(args[i]);
    }
    std::cout << "\n";
}

} // namespace sdb
