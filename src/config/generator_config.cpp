#include "flake/config/generator_config.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace flake::config {

namespace {

// read_unsigned returns j[key] as T, or fallback when key is absent. Negative, fractional and
// non-numeric values, and values above T's range, throw std::invalid_argument.
template <typename T>
T read_unsigned(const nlohmann::json& j, const char* key, const T fallback) {
  const auto it = j.find(key);
  if (it == j.end()) {
    return fallback;
  }
  if (!it->is_number_unsigned()) {
    throw std::invalid_argument(std::string("Generator config '") + key +
                                "' must be a non-negative integer");
  }
  const auto value = it->get<std::uint64_t>();
  if (value > std::numeric_limits<T>::max()) {
    throw std::invalid_argument(std::string("Generator config '") + key + "' is out of range");
  }
  return static_cast<T>(value);
}

std::int64_t read_signed(const nlohmann::json& j, const char* key, const std::int64_t fallback) {
  const auto it = j.find(key);
  if (it == j.end()) {
    return fallback;
  }
  if (!it->is_number_integer()) {
    throw std::invalid_argument(std::string("Generator config '") + key +
                                "' must be an integer");
  }
  if (it->is_number_unsigned() &&
      it->get<std::uint64_t>() >
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw std::invalid_argument(std::string("Generator config '") + key + "' is out of range");
  }
  return it->get<std::int64_t>();
}

}  // namespace

std::string to_json(const GeneratorConfig& config) {
  using json = nlohmann::json;

  // nlohmann::json default container is std::map, so keys sort alphabetically.
  json j;
  j["counter_bits"] = config.layout.counter_bits;
  j["epoch_unix_ms"] = config.epoch_unix_ms;
  j["node_bits"] = config.layout.node_bits;
  j["node_id"] = config.node_id;
  j["time_bits"] = config.layout.time_bits;

  return j.dump();
}

GeneratorConfig from_json(const std::string& json_str) {
  using json = nlohmann::json;

  const json j = json::parse(json_str);
  if (!j.is_object()) {
    throw std::invalid_argument("Generator config must be a JSON object");
  }

  GeneratorConfig config;
  config.node_id = read_unsigned(j, "node_id", config.node_id);
  config.epoch_unix_ms = read_signed(j, "epoch_unix_ms", config.epoch_unix_ms);
  config.layout.time_bits = read_unsigned(j, "time_bits", config.layout.time_bits);
  config.layout.node_bits = read_unsigned(j, "node_bits", config.layout.node_bits);
  config.layout.counter_bits = read_unsigned(j, "counter_bits", config.layout.counter_bits);

  return config;
}

core::Result<GeneratorConfig, std::string> load_generator_config(const std::string& path) {
  using Result = core::Result<GeneratorConfig, std::string>;

  std::ifstream file(path);
  if (!file) {
    return Result::err("Cannot open config file: " + path);
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();

  try {
    return Result::ok(from_json(buffer.str()));
  } catch (const nlohmann::json::exception& e) {
    return Result::err("Invalid config file " + path + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    return Result::err("Invalid config file " + path + ": " + e.what());
  }
}

std::string generator_config_to_log_string(const GeneratorConfig& config) {
  return "node=" + std::to_string(config.node_id) +
         " epoch_ms=" + std::to_string(config.epoch_unix_ms) +
         " layout=" + std::to_string(config.layout.time_bits) + "/" +
         std::to_string(config.layout.node_bits) + "/" +
         std::to_string(config.layout.counter_bits);
}

}  // namespace flake::config
