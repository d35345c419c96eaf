#include "../include/configloader.hpp"

#include <fstream>
#include <sstream>

nlohmann::json ConfigLoader::loadFromFile(const std::string &filename) const {
  if (filename.empty()) {
    throw std::runtime_error("ConfigLoader: empty configuration file name");
  }

  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("ConfigLoader: Failed to open file " + filename);
  }

  try {
    nlohmann::json config;
    file >> config;
    return config;
  } catch (const nlohmann::json::parse_error &e) {
    std::stringstream ss;
    ss << "ConfigLoader: JSON parse error in " << filename << ": " << e.what()
       << " at byte " << e.byte;
    throw std::runtime_error(ss.str());
  }
}
