#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace sdb {

// ============================================================================
// Command Line Helper for sdb
// ============================================================================

/**
 * @brief One parsed option value
 *
 * Numeric accessors reject malformed text with a ValidationError naming the
 * option instead of silently falling back to the default.
 */
struct ArgValue {
    std::string name;
    std::string value;
    bool is_set = false;

    explicit operator bool() const { return is_set; }

    int as_int(int default_val = 0) const;
    double as_double(double default_val = 0.0) const;

    /**
     * @brief as_double() restricted to [0, 1] (confidence, tension)
     */
    double as_unit(double default_val) const;

    /**
     * @brief Delimited items, trimmed, empties dropped
     */
    std::vector<std::string> as_list(char delim = ',') const;
};

class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name, const std::string& default_val = "") const;
    bool has(const std::string& name) const;

    /**
     * @throws ValidationError when the option was not given
     */
    std::string require(const std::string& name) const;
};

struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;       ///< Presence means "true"
};

/**
 * @brief A subcommand; the shared graph options are added by the CLI
 */
struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;
    bool input_required = true; ///< --input must name a graph document
};

/**
 * @brief Dispatcher for `sdb <command> [options]`
 *
 * Options registered with add_global_arg() (input, config, json, verbose)
 * are accepted by every command and listed once in the help text. Errors
 * from parsing or from a handler are printed and turned into exit code 1.
 */
class CLI {
public:
    static constexpr const char* INPUT_ARG = "input";

    CLI(const std::string& program_name, const std::string& version);

    void add_global_arg(ArgDef arg);
    void register_command(Command cmd);

    int run(int argc, char** argv);

    /**
     * @brief Parse the options following the command name
     * @throws ValidationError for unknown, incomplete or missing options
     */
    Args parse_args(const Command& cmd, const std::vector<std::string>& argv) const;

    const Command* find_command(const std::string& name) const;

    void print_help() const;
    void print_command_help(const Command& cmd) const;

private:
    std::string program_name_;
    std::string version_;
    std::vector<ArgDef> global_args_;
    std::map<std::string, Command> commands_;

    // Command options first, then globals; --input is required per command
    std::vector<ArgDef> effective_args(const Command& cmd) const;
};

} // namespace sdb
