#include "escrow/config/node_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace escrow {

namespace {

std::string readString(const nlohmann::json& root, const char* key,
                       const std::string& fallback) {
  if (!root.contains(key)) {
    return fallback;
  }
  const auto& value = root.at(key);
  if (!value.is_string()) {
    throw std::runtime_error(std::string("config key '") + key +
                             "' must be a string");
  }
  return value.get<std::string>();
}

NodeConfig fromJson(const nlohmann::json& root) {
  if (!root.is_object()) {
    throw std::runtime_error("config root must be a JSON object");
  }

  NodeConfig config;

  config.settings.arbiter = readString(root, "arbiter", "");
  if (config.settings.arbiter.empty()) {
    throw std::runtime_error("config key 'arbiter' is required");
  }

  config.settings.custody_identity = readString(
      root, "custody_identity", config.settings.custody_identity);
  if (config.settings.custody_identity.empty()) {
    throw std::runtime_error("config key 'custody_identity' must not be empty");
  }
  if (config.settings.custody_identity == config.settings.arbiter) {
    throw std::runtime_error(
        "config keys 'custody_identity' and 'arbiter' must differ");
  }

  config.cmd_endpoint = readString(root, "cmd_endpoint", config.cmd_endpoint);
  config.pub_endpoint = readString(root, "pub_endpoint", config.pub_endpoint);

  if (root.contains("genesis_balances")) {
    const auto& balances = root.at("genesis_balances");
    if (!balances.is_object()) {
      throw std::runtime_error("config key 'genesis_balances' must be an object");
    }
    for (const auto& [identity, amount] : balances.items()) {
      if (!amount.is_number_unsigned()) {
        throw std::runtime_error("genesis balance for '" + identity +
                                 "' must be a non-negative integer");
      }
      config.genesis_balances[identity] = amount.get<domain::Amount>();
    }
  }

  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// LoadFromString
// -----------------------------------------------------------------------------
NodeConfig ConfigLoader::LoadFromString(const std::string& json_text) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Failed to parse JSON config: " +
                             std::string(e.what()));
  }
  return fromJson(root);
}

// -----------------------------------------------------------------------------
// LoadFromFile
// -----------------------------------------------------------------------------
NodeConfig ConfigLoader::LoadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open config file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return LoadFromString(buffer.str());
}

}  // namespace escrow
