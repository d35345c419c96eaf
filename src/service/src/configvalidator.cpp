#include "../include/configvalidator.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "espanso/ilogger.hpp"

using namespace std;

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
  if (!config.is_object()) {
    throw runtime_error("ConfigValidator: Configuration root must be an object");
  }

  if (config.contains("logging")) {
    validateLogging(config["logging"]);
  }

  for (const char *key : {"log_file", "runtime_dir", "config_dir",
                          "package_dir"}) {
    validatePathField(config, key);
  }

  return validateTimings(config);
}

void ConfigValidator::validatePathField(const nlohmann::json &config,
                                        const char *key) const {
  if (!config.contains(key)) return;
  const auto &value = config[key];
  if (!value.is_string() || value.get<string>().empty()) {
    throw runtime_error(string("ConfigValidator: ") + key +
                        " must be a non-empty string");
  }
}

bool ConfigValidator::validateLogging(const nlohmann::json &logging) const {
  if (!logging.is_array()) {
    throw runtime_error("ConfigValidator: Logging config must be an array");
  }

  const vector<string> valid_types = {"console", "sync_file", "async_file"};

  for (const auto &logger : logging) {
    if (!logger.is_object()) {
      throw runtime_error("ConfigValidator: Logger entry must be an object");
    }

    if (!logger.contains("type") || !logger["type"].is_string()) {
      throw runtime_error("ConfigValidator: Logger missing type field");
    }

    const string type = logger["type"].get<string>();
    if (find(valid_types.begin(), valid_types.end(), type) ==
        valid_types.end()) {
      throw runtime_error("ConfigValidator: Invalid logger type: " + type);
    }

    if (logger.contains("level")) {
      if (!logger["level"].is_string()) {
        throw runtime_error("ConfigValidator: Invalid log level type");
      }
      try {
        espanso::stringToLogLevel(logger["level"].get<string>());
      } catch (const invalid_argument &e) {
        throw runtime_error(string("ConfigValidator: ") + e.what());
      }
    }

    if (logger.contains("file") && !logger["file"].is_string()) {
      throw runtime_error("ConfigValidator: Logger file must be a string");
    }
  }
  return true;
}

bool ConfigValidator::validateTimings(const nlohmann::json &config) const {
  auto readPositive = [&config](const char *key) -> int64_t {
    if (!config.contains(key)) return 0;
    const auto &value = config[key];
    if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
      throw runtime_error(string("ConfigValidator: ") + key +
                          " must be a positive integer");
    }
    return value.get<int64_t>();
  };

  int64_t timeout = readPositive("retire_timeout_ms");
  int64_t interval = readPositive("retire_poll_interval_ms");

  if (timeout > 0 && interval > timeout) {
    throw runtime_error(
        "ConfigValidator: retire_poll_interval_ms exceeds retire_timeout_ms");
  }
  return true;
}
