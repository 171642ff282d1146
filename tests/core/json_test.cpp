#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using trendloop::core::json::FindField;
using trendloop::core::json::Parse;
using trendloop::core::json::Value;

TEST_CASE("JSON parser reads nested pipeline documents", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"({"pipeline_id":"daily","safety":{"max_consecutive_failures":3},
                    "stages":[{"name":"writing","enabled":true},null]})",
                root, error));
  REQUIRE(error.empty());
  REQUIRE(root.IsObject());

  const Value* id = FindField(root, "pipeline_id");
  REQUIRE(id != nullptr);
  REQUIRE(id->string_value == "daily");

  const Value* safety = FindField(root, "safety");
  REQUIRE(safety != nullptr);
  std::uint64_t limit = 0;
  REQUIRE(trendloop::core::json::TryGetNonNegativeInteger(
      *FindField(*safety, "max_consecutive_failures"), limit));
  REQUIRE(limit == 3U);

  const Value* stages = FindField(root, "stages");
  REQUIRE(stages != nullptr);
  REQUIRE(stages->IsArray());
  REQUIRE(stages->array_value.size() == 2U);
  REQUIRE(FindField(stages->array_value[0], "enabled")->bool_value);
  REQUIRE(stages->array_value[1].type == Value::Type::kNull);
  REQUIRE(FindField(root, "missing") == nullptr);
}

TEST_CASE("JSON parser reports line and column of errors", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(Parse("{\n  \"a\": 1,\n  \"b\": tru\n}", root, error));
  REQUIRE(error.find("line 3") != std::string::npos);
  REQUIRE(error.find("invalid literal") != std::string::npos);

  REQUIRE_FALSE(Parse("{} trailing", root, error));
  REQUIRE(error.find("trailing content") != std::string::npos);
}

TEST_CASE("JSON parser decodes string escapes", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"("tab\there \u00e9")", root, error));
  REQUIRE(root.string_value == "tab\there \xC3\xA9");
}

TEST_CASE("Integer helpers reject fractional and negative values", "[core][json]") {
  Value number;
  number.type = Value::Type::kNumber;

  std::uint64_t unsigned_out = 0;
  std::int64_t signed_out = 0;

  number.number_value = 2.5;
  REQUIRE_FALSE(trendloop::core::json::TryGetNonNegativeInteger(number, unsigned_out));
  REQUIRE_FALSE(trendloop::core::json::TryGetInteger(number, signed_out));

  number.number_value = -4.0;
  REQUIRE_FALSE(trendloop::core::json::TryGetNonNegativeInteger(number, unsigned_out));
  REQUIRE(trendloop::core::json::TryGetInteger(number, signed_out));
  REQUIRE(signed_out == -4);
}

TEST_CASE("JSON writers escape control characters", "[core][json]") {
  REQUIRE(trendloop::core::EscapeJson("a\"b\\c\n") == "a\\\"b\\\\c\\n");
  REQUIRE(trendloop::core::EscapeJson(std::string("\x01", 1)) == "\\u0001");
  REQUIRE(trendloop::core::JsonString("x") == "\"x\"");
  REQUIRE(trendloop::core::JsonStringMap({{"b", "2"}, {"a", "1"}}) == R"({"a":"1","b":"2"})");
  REQUIRE(trendloop::core::JsonStringMap({}) == "{}");
}
