#include "../include/environmentprocessor.hpp"

#include <cstdlib>
#include <optional>

namespace {

const std::string kPrefix = "$ENV{";
const std::string kDefaultSeparator = ":-";

}  // namespace

void EnvironmentProcessor::process(nlohmann::json &config) const {
  if (config.is_object() || config.is_array()) {
    for (auto &child : config) {
      process(child);
    }
  } else if (config.is_string()) {
    config = expand(config.get<std::string>());
  }
}

std::string EnvironmentProcessor::expand(const std::string &value) const {
  std::string result;
  size_t pos = 0;

  while (pos < value.size()) {
    size_t start = value.find(kPrefix, pos);
    if (start == std::string::npos) break;

    size_t end = value.find('}', start + kPrefix.size());
    if (end == std::string::npos) break;

    result.append(value, pos, start - pos);

    std::string body =
        value.substr(start + kPrefix.size(), end - start - kPrefix.size());
    std::string name = body;
    std::optional<std::string> fallback;
    if (size_t sep = body.find(kDefaultSeparator); sep != std::string::npos) {
      name = body.substr(0, sep);
      fallback = body.substr(sep + kDefaultSeparator.size());
    }

    const char *envValue = std::getenv(name.c_str());
    if (envValue != nullptr && *envValue != '\0') {
      result += envValue;
    } else if (fallback) {
      result += *fallback;
    } else {
      result.append(value, start, end - start + 1);
    }
    pos = end + 1;
  }

  result.append(value, pos, std::string::npos);
  return result;
}
