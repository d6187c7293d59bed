#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch.hpp>

#include <string>

namespace json = cosmicam::core::json;

TEST_CASE("JSON parser reads nested documents", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"night": {"shutter_speed": 6000000, "gain": 2.0},
                          "enabled": true, "note": "caf\u00e9", "tags": [1, 2]})",
                      root, error));
  REQUIRE(root.IsObject());

  const json::Value* night = root.Find("night");
  REQUIRE(night != nullptr);
  REQUIRE(night->Find("shutter_speed")->number_value == 6000000.0);
  REQUIRE(night->Find("gain")->number_value == 2.0);
  REQUIRE(root.Find("enabled")->bool_value);
  REQUIRE(root.Find("note")->string_value == "caf\xC3\xA9");
  REQUIRE(root.Find("tags")->array_value.size() == 2U);
  REQUIRE(root.Find("missing") == nullptr);
}

TEST_CASE("JSON parser reports the location of syntax errors", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE_FALSE(json::Parse("{\n  \"latitude\": 32.7,\n  \"longitude\" -97.3\n}", root, error));
  REQUIRE(error.find("line 3") != std::string::npos);
  REQUIRE(error.find("expected ':'") != std::string::npos);

  REQUIRE_FALSE(json::Parse("{} trailing", root, error));
  REQUIRE_FALSE(json::Parse("", root, error));
  REQUIRE_FALSE(json::Parse(R"({"a": 1,})", root, error));
}

TEST_CASE("JSON parser rejects runaway nesting", "[core][json]") {
  std::string deep(100U, '[');
  deep += std::string(100U, ']');
  json::Value root;
  std::string error;
  REQUIRE_FALSE(json::Parse(deep, root, error));
  REQUIRE(error.find("too deep") != std::string::npos);
}

TEST_CASE("JSON serializer sorts keys and formats numbers compactly", "[core][json]") {
  json::Value root = json::Value::MakeObject();
  root.object_value["zeta"] = json::Value::MakeNumber(0.2);
  root.object_value["alpha"] = json::Value::MakeNumber(60.0);
  root.object_value["name"] = json::Value::MakeString("a\"b");

  REQUIRE(json::Serialize(root) == R"({"alpha":60,"name":"a\"b","zeta":0.2})");
  REQUIRE(json::Serialize(root, 2) == "{\n  \"alpha\": 60,\n  \"name\": \"a\\\"b\",\n  \"zeta\": 0.2\n}");
}

TEST_CASE("MergeTopLevel replaces only the keys present in the patch", "[core][json]") {
  json::Value target;
  json::Value patch;
  std::string error;
  REQUIRE(json::Parse(R"({"latitude": 1, "longitude": 2, "nested": {"a": 1, "b": 2}})", target,
                      error));
  REQUIRE(json::Parse(R"({"longitude": 5, "nested": {"a": 9}})", patch, error));

  json::MergeTopLevel(target, patch);
  REQUIRE(target.Find("latitude")->number_value == 1.0);
  REQUIRE(target.Find("longitude")->number_value == 5.0);
  REQUIRE(target.Find("nested")->Find("b") == nullptr);
  REQUIRE(target.Find("nested")->Find("a")->number_value == 9.0);
}

TEST_CASE("FormatJsonNumber keeps integers integral and round-trips fractions", "[core][json]") {
  using cosmicam::core::FormatJsonNumber;
  REQUIRE(FormatJsonNumber(6000000.0) == "6000000");
  REQUIRE(FormatJsonNumber(-97.3) == "-97.3");
  REQUIRE(FormatJsonNumber(1.1) == "1.1");
  REQUIRE(FormatJsonNumber(0.0) == "0");
}
