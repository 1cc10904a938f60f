#pragma once

#include "common/detection_config.h"
#include <string>
#include <yaml-cpp/yaml.h>

namespace tripsense {
class Config {
public:
  static Config &instance();

  void load(const std::string &path);
  void load_string(const std::string &yaml);

  YAML::Node root() const { return root_; }

  std::string system_name() const;
  std::string log_level() const;
  std::string log_dir() const;
  std::string data_dir() const;

  DetectionConfig detection() const;

private:
  Config() = default;
  std::string system_value(const std::string &key,
                           const std::string &fallback) const;

  YAML::Node root_;
};

} // namespace tripsense
