#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace cms::config {

using cms::runtime::config::RuntimeConfig;

namespace {

// Plain decimal literal: optional sign, digits, at most one dot. Anything
// else (hosts, "inf", hex) stays a string.
bool LooksNumeric(const std::string& text) {
  size_t i = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
  if (i == text.size()) return false;

  bool seen_dot = false;
  for (; i < text.size(); ++i) {
    if (text[i] == '.') {
      if (seen_dot) return false;
      seen_dot = true;
    } else if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  // Quoted scalars carry the non-specific tag "!" and are always strings.
  if (node.Tag() != "!") {
    if (text == "true" || text == "false") {
      value->set_bool_value(text == "true");
      return;
    }
    if (LooksNumeric(text)) {
      value->set_number_value(std::strtod(text.c_str(), nullptr));
      return;
    }
  }
  value->set_string_value(text);
}

void NodeToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        NodeToValue(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        NodeToValue(entry.second, &fields[entry.first.Scalar()]);
      }
      return;
    }
  }
  throw std::runtime_error("Unsupported YAML node");
}

void ValidateServices(const RuntimeConfig& config) {
  for (const auto& [name, service] : config.services()) {
    if (name.empty()) {
      throw std::runtime_error("Invalid configuration: empty service name");
    }
    if (service.shards().empty()) {
      throw std::runtime_error("Invalid configuration: service " + name + " has no shards");
    }
    for (int shard = 0; shard < service.shards_size(); ++shard) {
      const auto& endpoint = service.shards(shard);
      if (endpoint.host().empty() || endpoint.port() == 0 || endpoint.port() > 65535) {
        std::ostringstream msg;
        msg << "Invalid configuration: bad endpoint for " << name << "/" << shard;
        throw std::runtime_error(msg.str());
      }
    }
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }

  google::protobuf::Value tree;
  NodeToValue(root, &tree);

  // An empty file is an all-defaults config.
  std::string json = "{}";
  if (tree.has_struct_value()) {
    json.clear();
    const auto status = google::protobuf::util::MessageToJsonString(tree, &json);
    if (!status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
    }
  } else if (!tree.has_null_value()) {
    throw std::runtime_error("Invalid configuration: top level of " + path + " must be a mapping");
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaultsAndValidate(config);
  return config;
}

void ConfigLoader::ApplyDefaultsAndValidate(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(std::string(kDefaultBindAddress));
  }
  if (config.rpc().call_timeout_ms() == 0) {
    config.mutable_rpc()->set_call_timeout_ms(kDefaultCallTimeoutMs);
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }

  ValidateServices(config);
}

} // namespace cms::config
