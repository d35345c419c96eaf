#include "../include/argumentparser.hpp"

#include <algorithm>
#include <ostream>

using namespace std;

const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

const vector<string> ArgumentParser::validLogTypes = {"console", "sync_file",
                                                      "async_file"};

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--version" || arg == "-v") {
      args.version_message = true;
    } else if (arg == "--detach") {
      args.detach = true;
    } else if (matches(arg, "--log-type")) {
      parseLogType(readValue(arg, "--log-type", i, argc, argv), args);
      args.use_cli_logging = true;
    } else if (matches(arg, "--log-level")) {
      string level = readValue(arg, "--log-level", i, argc, argv);
      if (find(validLogLevels.begin(), validLogLevels.end(), level) ==
          validLogLevels.end()) {
        throw invalid_argument("ArgumentParser: Invalid log level: " + level);
      }
      args.log_level = level;
      args.use_cli_logging = true;
    } else if (matches(arg, "--config-file")) {
      args.config_path = readValue(arg, "--config-file", i, argc, argv);
    } else if (matches(arg, "--runtime-dir")) {
      args.runtime_dir = readValue(arg, "--runtime-dir", i, argc, argv);
    } else if (matches(arg, "--config-dir")) {
      args.config_dir = readValue(arg, "--config-dir", i, argc, argv);
    } else if (matches(arg, "--package-dir")) {
      args.package_dir = readValue(arg, "--package-dir", i, argc, argv);
    } else if (arg.rfind("-", 0) == 0) {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    } else {
      parseCommand(arg, args);
    }
  }

  validate(args);
  return args;
}

bool ArgumentParser::matches(const string &arg, const string &option) const {
  return arg == option || arg.rfind(option + "=", 0) == 0;
}

string ArgumentParser::readValue(const string &arg, const string &option,
                                 int &i, int argc, char **argv) const {
  string value;
  if (arg.size() > option.size()) {
    value = arg.substr(option.size() + 1);
  } else if (i + 1 < argc) {
    value = argv[++i];
  } else {
    throw invalid_argument("ArgumentParser: " + option + " requires a value");
  }

  if (value.empty()) {
    throw invalid_argument("ArgumentParser: " + option +
                           " requires a non-empty value");
  }
  return value;
}

void ArgumentParser::parseLogType(const string &value, ParsedArgs &args) const {
  size_t start = 0;
  while (start <= value.size()) {
    size_t comma = value.find(',', start);
    string type = value.substr(start, comma == string::npos
                                          ? string::npos
                                          : comma - start);
    if (find(validLogTypes.begin(), validLogTypes.end(), type) ==
        validLogTypes.end()) {
      throw invalid_argument("ArgumentParser: Invalid logger type: " + type);
    }
    if (find(args.logger_types.begin(), args.logger_types.end(), type) ==
        args.logger_types.end()) {
      args.logger_types.push_back(type);
    }
    if (comma == string::npos) break;
    start = comma + 1;
  }
}

void ArgumentParser::parseCommand(const string &arg, ParsedArgs &args) const {
  Command command;
  if (arg == "daemon") {
    command = Command::Daemon;
  } else if (arg == "worker") {
    command = Command::Worker;
  } else if (arg == "stop") {
    command = Command::Stop;
  } else if (arg == "status") {
    command = Command::Status;
  } else {
    throw invalid_argument("ArgumentParser: Unknown command: " + arg);
  }

  if (args.command != Command::None) {
    throw invalid_argument(string("ArgumentParser: Only one command allowed, "
                                  "got ") +
                           commandName(args.command) + " and " + arg);
  }
  args.command = command;
}

void ArgumentParser::validate(const ParsedArgs &args) const {
  if (args.help_message || args.version_message) return;

  if (args.command == Command::None) {
    throw invalid_argument("ArgumentParser: No command given");
  }
  if (args.detach && args.command != Command::Daemon) {
    throw invalid_argument(
        "ArgumentParser: --detach is only valid for the daemon command");
  }
}

const char *ArgumentParser::commandName(Command command) {
  switch (command) {
    case Command::Daemon:
      return "daemon";
    case Command::Worker:
      return "worker";
    case Command::Stop:
      return "stop";
    case Command::Status:
      return "status";
    case Command::None:
      break;
  }
  return "none";
}

void ArgumentParser::printHelp(ostream &out) {
  out << "espanso daemon\n\n"
      << "Usage:\n"
      << " espanso <command> [options]\n\n"
      << "Commands:\n"
      << " daemon              Start the daemon and its worker\n"
      << " worker              Run the worker (started by the daemon)\n"
      << " stop                Stop the daemon and its worker\n"
      << " status              Report whether the daemon is running\n\n"
      << "Options:\n"
      << " --help, -h          Show this help message\n"
      << " --version, -v       Show version info\n"
      << " --config-file=FILE  Configuration file path\n"
      << " --runtime-dir=DIR   Runtime directory (locks, sockets, logs)\n"
      << " --config-dir=DIR    Configuration directory\n"
      << " --package-dir=DIR   Package directory\n"
      << " --log-type=TYPES    Logger types (comma-separated) "
         "[console|sync_file|async_file]\n"
      << " --log-level=LEVEL   Logging level "
         "[debug|info|warning|error|critical]\n"
      << " --detach            Run the daemon in the background\n";
}
