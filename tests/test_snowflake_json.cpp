#include "flake/id/snowflake.h"
#include "flake/id/snowflake_json.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <vector>

using namespace flake;
using json = nlohmann::json;

TEST_CASE("Snowflake serializes as a quoted decimal string", "[json]") {
  const json j = id::Snowflake{1234567890123456789};
  REQUIRE(j.is_string());
  CHECK(j.get<std::string>() == "1234567890123456789");
  CHECK(j.dump() == "\"1234567890123456789\"");
}

TEST_CASE("JSON dump matches to_text", "[json]") {
  const id::Snowflake value{987654321};
  CHECK(json(value).dump() == id::to_text(value));
}

TEST_CASE("Snowflake embeds in JSON documents", "[json]") {
  json doc;
  doc["id"] = id::Snowflake{42};
  doc["children"] = std::vector<id::Snowflake>{id::Snowflake{1}, id::Snowflake{2}};
  CHECK(doc.dump() == R"({"children":["1","2"],"id":"42"})");

  const json parsed = json::parse(doc.dump());
  CHECK(parsed.at("id").get<id::Snowflake>() == id::Snowflake{42});
  const auto children = parsed.at("children").get<std::vector<id::Snowflake>>();
  REQUIRE(children.size() == 2);
  CHECK(children[1] == id::Snowflake{2});
}

TEST_CASE("from_json rejects non-string values", "[json]") {
  const json number = 42;
  CHECK_THROWS_AS(number.get<id::Snowflake>(), json::type_error);

  const json null_value = nullptr;
  CHECK_THROWS_AS(null_value.get<id::Snowflake>(), json::type_error);
}

TEST_CASE("from_json rejects strings that are not decimal identifiers", "[json]") {
  const json not_a_number = "abc";
  CHECK_THROWS_AS(not_a_number.get<id::Snowflake>(), std::invalid_argument);

  const json empty = "";
  CHECK_THROWS_AS(empty.get<id::Snowflake>(), std::invalid_argument);
}
