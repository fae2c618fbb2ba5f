#include "flake/config/generator_config.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace flake;

namespace {

// Helper: write content to a fresh file under the temp directory and return its path.
std::string write_temp_file(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path, std::ios::trunc);
  out << content;
  return path.string();
}

}  // namespace

// ── Serialization ──────────────────────────────────────────────────────────

TEST_CASE("to_json: defaults with sorted keys", "[config][serialization]") {
  const config::GeneratorConfig cfg;
  CHECK(config::to_json(cfg) ==
        R"({"counter_bits":12,"epoch_unix_ms":1288834974657,"node_bits":10,"node_id":0,)"
        R"("time_bits":41})");
}

TEST_CASE("to_json/from_json: roundtrip preserves all fields", "[config][serialization]") {
  config::GeneratorConfig cfg;
  cfg.node_id = 513;
  cfg.epoch_unix_ms = 1700000000000;
  cfg.layout = id::Layout{39, 12, 12};

  const auto restored = config::from_json(config::to_json(cfg));
  CHECK(restored.node_id == 513);
  CHECK(restored.epoch_unix_ms == 1700000000000);
  CHECK(restored.layout == id::Layout{39, 12, 12});
}

TEST_CASE("from_json: absent keys keep defaults", "[config][serialization]") {
  const auto cfg = config::from_json(R"({"node_id": 5, "counter_bits": 8})");
  CHECK(cfg.node_id == 5);
  CHECK(cfg.layout.counter_bits == 8);
  CHECK(cfg.layout.time_bits == 41);
  CHECK(cfg.layout.node_bits == 10);
  CHECK(cfg.epoch_unix_ms == config::kDefaultEpochUnixMs);
}

TEST_CASE("from_json: malformed input throws", "[config][serialization]") {
  CHECK_THROWS_AS(config::from_json("{not json"), nlohmann::json::parse_error);
  CHECK_THROWS_AS(config::from_json(R"({"node_id": "five"})"), std::invalid_argument);
  CHECK_THROWS_AS(config::from_json("[1, 2]"), std::invalid_argument);
}

TEST_CASE("from_json: integer fields are read strictly", "[config][serialization]") {
  SECTION("negative node ID does not wrap") {
    CHECK_THROWS_AS(config::from_json(R"({"node_id": -1, "node_bits": 32, "time_bits": 31,)"
                                      R"( "counter_bits": 0})"),
                    std::invalid_argument);
  }

  SECTION("negative bit widths") {
    CHECK_THROWS_AS(config::from_json(R"({"time_bits": -41})"), std::invalid_argument);
    CHECK_THROWS_AS(config::from_json(R"({"node_bits": -1})"), std::invalid_argument);
    CHECK_THROWS_AS(config::from_json(R"({"counter_bits": -12})"), std::invalid_argument);
  }

  SECTION("fractional values") {
    CHECK_THROWS_AS(config::from_json(R"({"node_id": 1.5})"), std::invalid_argument);
    CHECK_THROWS_AS(config::from_json(R"({"epoch_unix_ms": 1288834974657.5})"),
                    std::invalid_argument);
  }

  SECTION("values beyond the field's range") {
    CHECK_THROWS_AS(config::from_json(R"({"node_id": 4294967296})"), std::invalid_argument);
    CHECK_THROWS_AS(config::from_json(R"({"epoch_unix_ms": 9223372036854775808})"),
                    std::invalid_argument);
  }

  SECTION("negative epoch is a valid integer") {
    CHECK(config::from_json(R"({"epoch_unix_ms": -8000000000000})").epoch_unix_ms ==
          -8'000'000'000'000);
  }
}

// ── File loading ───────────────────────────────────────────────────────────

TEST_CASE("load_generator_config: reads a JSON file", "[config][file]") {
  const auto path = write_temp_file("flake_test_config.json",
                                    R"({"node_id": 12, "epoch_unix_ms": 1600000000000})");
  const auto result = config::load_generator_config(path);
  REQUIRE(result.has_value());
  CHECK(result.value().node_id == 12);
  CHECK(result.value().epoch_unix_ms == 1600000000000);
  std::filesystem::remove(path);
}

TEST_CASE("load_generator_config: missing file is an error", "[config][file]") {
  const auto result = config::load_generator_config("/nonexistent/flake/config.json");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("Cannot open config file") != std::string::npos);
}

TEST_CASE("load_generator_config: malformed file is an error", "[config][file]") {
  const auto path = write_temp_file("flake_test_bad_config.json", "{\"node_id\": ");
  const auto result = config::load_generator_config(path);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("Invalid config file") != std::string::npos);
  std::filesystem::remove(path);
}

TEST_CASE("load_generator_config: negative node ID is an error", "[config][file]") {
  const auto path = write_temp_file("flake_test_negative_node.json", R"({"node_id": -1})");
  const auto result = config::load_generator_config(path);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("node_id") != std::string::npos);
  std::filesystem::remove(path);
}

// ── Diagnostics ────────────────────────────────────────────────────────────

TEST_CASE("generator_config_to_log_string", "[config]") {
  config::GeneratorConfig cfg;
  cfg.node_id = 4;
  CHECK(config::generator_config_to_log_string(cfg) ==
        "node=4 epoch_ms=1288834974657 layout=41/10/12");
}

TEST_CASE("ConfigError messages", "[config][errors]") {
  CHECK(core::to_string(core::ConfigError::kSnowflakeOverflow) ==
        "total bits allocated is greater than 63");
  CHECK(core::to_string(core::ConfigError::kNodeOverflow) ==
        "node ID overflowed its bit allowance");
  CHECK(core::to_string(core::ConfigError::kEpochInFuture) ==
        "epoch is later than the current time");
  CHECK(core::to_string(core::ConfigError::kEpochOutOfRange) ==
        "epoch is out of range of the monotonic clock");
}
