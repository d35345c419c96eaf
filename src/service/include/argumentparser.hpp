/**
 * @file argumentparser.hpp
 * @brief Разбор командной строки espanso
 *
 * @details Формат: `espanso <command> [options]`, опции допускаются до и
 * после команды. Значения передаются как `--opt=value` или `--opt value`.
 */

#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

/// Подкоманды
enum class Command { None, Daemon, Worker, Stop, Status };

struct ParsedArgs {
  Command command = Command::None;
  std::optional<std::string> config_path;
  std::vector<std::string> logger_types;
  std::optional<std::string> log_level;
  std::optional<std::string> runtime_dir;
  std::optional<std::string> config_dir;
  std::optional<std::string> package_dir;
  bool detach = false;
  bool use_cli_logging = false;
  bool help_message = false;
  bool version_message = false;
};

class ArgumentParser {
 public:
  /**
   * @brief Разобрать argv
   * @throw std::invalid_argument При неизвестной опции или команде,
   *        отсутствующем значении, недопустимом уровне или типе логгера
   */
  ParsedArgs parse(int argc, char **argv);

  static void printHelp(std::ostream &out);

  static const char *commandName(Command command);

 private:
  static const std::vector<std::string> validLogLevels;
  static const std::vector<std::string> validLogTypes;

  /// Значение опции из `--opt=value` или следующего аргумента.
  std::string readValue(const std::string &arg, const std::string &option,
                        int &i, int argc, char **argv) const;
  bool matches(const std::string &arg, const std::string &option) const;
  void parseLogType(const std::string &value, ParsedArgs &args) const;
  void parseCommand(const std::string &arg, ParsedArgs &args) const;
  void validate(const ParsedArgs &args) const;
};
