/**
 * @file CommandLine.cpp
 * @brief Implementation of CommandLine.
 */

#include "app/CommandLine.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace fleetkeeper::app {

namespace {

// Options that never take a value.
const std::set<std::string> kSwitches = {
    "authorised", "clear-launch", "verbose", "help"
};

} // namespace

const std::string& ParsedCommand::arg(size_t index, const std::string& what) const {
    if (index >= positional.size()) {
        throw UsageError("Missing argument: " + what);
    }
    return positional[index];
}

ParsedCommand CommandLine::Parse(const std::vector<std::string>& args) {
    ParsedCommand parsed;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& token = args[i];
        if (token.size() > 2 && token.compare(0, 2, "--") == 0) {
            std::string name = token.substr(2);
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                parsed.options[name.substr(0, eq)] = name.substr(eq + 1);
                continue;
            }
            if (kSwitches.count(name)) {
                parsed.switches.insert(name);
                continue;
            }
            if (i + 1 >= args.size()) {
                throw UsageError("Option --" + name + " requires a value");
            }
            parsed.options[name] = args[++i];
        } else if (parsed.command.empty()) {
            parsed.command = token;
        } else {
            parsed.positional.push_back(token);
        }
    }

    if (parsed.command.empty() && !parsed.hasSwitch("help")) {
        throw UsageError("No command given");
    }
    return parsed;
}

double CommandLine::ParseDouble(const std::string& text, const std::string& what) {
    if (text.empty()) throw UsageError(what + " must be a number");
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size() || !std::isfinite(value)) {
        throw UsageError(what + " must be a finite number, got '" + text + "'");
    }
    return value;
}

int CommandLine::ParseInt(const std::string& text, const std::string& what) {
    if (text.empty()) throw UsageError(what + " must be an integer");
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size() ||
        value < -2147483647L || value > 2147483647L) {
        throw UsageError(what + " must be an integer, got '" + text + "'");
    }
    return static_cast<int>(value);
}

bool CommandLine::IsKnownCommand(const std::string& command) {
    static const std::set<std::string> kCommands = {
        "add", "update", "remove", "position", "arrival",
        "list", "filter", "sort", "history", "log", "report"
    };
    return kCommands.count(command) != 0;
}

bool CommandLine::IsMutating(const std::string& command) {
    return command == "add" || command == "update" || command == "remove" ||
           command == "position" || command == "arrival";
}

std::string CommandLine::Usage() {
    std::ostringstream ss;
    ss << "Usage: fleetkeeper [--root DIR] [--data FILE] [--verbose] <command> [args]\n"
       << "\n"
       << "Commands:\n"
       << "  add <id> <name> <home_port> <flag> [--launch YYYY-MM-DD]\n"
       << "      [--class standard|cargo|military] [--cargo TONS] [--weapons N] [--authorised]\n"
       << "  update <id> [--name N] [--port P] [--flag F] [--launch YYYY-MM-DD | --clear-launch]\n"
       << "      [--class standard|cargo|military] [--cargo TONS] [--weapons N] [--authorised]\n"
       << "  remove <id>\n"
       << "  position <id> <latitude> <longitude> [--at ISO-8601]\n"
       << "  arrival <id> <port> [--at ISO-8601] [--note TEXT]\n"
       << "  list [--sort KEY]\n"
       << "  filter [--name N] [--port P] [--flag F] [--sort KEY]\n"
       << "  sort [KEY]            KEY: name, home_port, flag, id, launch_date\n"
       << "  history <id>\n"
       << "  log\n"
       << "  report\n";
    return ss.str();
}

} // namespace fleetkeeper::app
