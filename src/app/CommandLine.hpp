/**
 * @file CommandLine.hpp
 * @brief Argument parsing for the fleetkeeper shell.
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace fleetkeeper::app {

/**
 * @class UsageError
 * @brief Malformed command line (unknown command, missing argument, bad number).
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct ParsedCommand
 * @brief "fleetkeeper [globals] <command> [positional...] [--option value...] [--switch...]"
 */
struct ParsedCommand {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;   ///< Without the leading "--".
    std::set<std::string> switches;                ///< Value-less options.

    bool has(const std::string& option) const { return options.count(option) != 0; }
    bool hasSwitch(const std::string& name) const { return switches.count(name) != 0; }

    std::optional<std::string> option(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }

    /** @throws UsageError if fewer than index+1 positional arguments were given. */
    const std::string& arg(size_t index, const std::string& what) const;
};

class CommandLine {
public:
    /**
     * @brief Splits args (argv without the program name).
     * @throws UsageError on a dangling option or a missing command.
     */
    static ParsedCommand Parse(const std::vector<std::string>& args);

    /** @brief Strict decimal parse. @throws UsageError */
    static double ParseDouble(const std::string& text, const std::string& what);

    /** @brief Strict integer parse. @throws UsageError */
    static int ParseInt(const std::string& text, const std::string& what);

    static std::string Usage();

    static bool IsKnownCommand(const std::string& command);

    /** @brief True for commands that change registry state and therefore save. */
    static bool IsMutating(const std::string& command);
};

} // namespace fleetkeeper::app
