#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace cms::config {

/*
  Reads the cms-admin YAML file into RuntimeConfig.

  The YAML tree is turned into JSON and parsed with the protobuf JSON
  parser, so unknown keys are rejected. The result is validated once and
  treated as immutable afterwards.
*/
class ConfigLoader {
 public:
  static constexpr uint32_t         kDefaultCallTimeoutMs = 10'000;
  static constexpr std::string_view kDefaultBindAddress   = "0.0.0.0:8890";

  static cms::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error on an unusable service table or database section.
  static void ApplyDefaultsAndValidate(cms::runtime::config::RuntimeConfig& config);
};

} // namespace cms::config
