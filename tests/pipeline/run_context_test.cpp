#include "pipeline/run_context.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using trendloop::pipeline::RunContext;

TEST_CASE("RunContext stores values written by the active stage", "[pipeline][context]") {
  RunContext context("run-1");
  context.SetActiveWriter("trend_analysis");

  std::string error;
  REQUIRE(context.Put("keywords", "solar,ev", error));
  REQUIRE(context.Get("keywords").value_or("") == "solar,ev");
  REQUIRE(context.OwnerOf("keywords") == "trend_analysis");
  REQUIRE(context.Size() == 1U);
  REQUIRE_FALSE(context.Get("missing").has_value());
}

TEST_CASE("RunContext lets a stage rewrite its own keys", "[pipeline][context]") {
  RunContext context("run-1");
  context.SetActiveWriter("writer");

  std::string error;
  REQUIRE(context.Put("draft", "v1", error));
  REQUIRE(context.Put("draft", "v2", error));
  REQUIRE(context.Get("draft").value_or("") == "v2");
}

TEST_CASE("RunContext rejects overwriting a key owned by an earlier stage",
          "[pipeline][context]") {
  RunContext context("run-1");
  std::string error;

  context.SetActiveWriter("trend_analysis");
  REQUIRE(context.Put("keywords", "solar", error));

  context.SetActiveWriter("writer");
  REQUIRE_FALSE(context.Put("keywords", "clobbered", error));
  REQUIRE(error.find("trend_analysis") != std::string::npos);
  REQUIRE(context.Get("keywords").value_or("") == "solar");
  REQUIRE(context.OwnerOf("keywords") == "trend_analysis");
}

TEST_CASE("RunContext rejects malformed keys", "[pipeline][context]") {
  RunContext context;
  std::string error;
  REQUIRE_FALSE(context.Put("", "value", error));
  REQUIRE_FALSE(context.Put("a=b", "value", error));
  REQUIRE_FALSE(context.Put("line\nbreak", "value", error));
  REQUIRE(context.Size() == 0U);
}

TEST_CASE("Context key/value text escapes line breaks", "[pipeline][context]") {
  RunContext context("run-1");
  std::string error;
  REQUIRE(context.Put("title", "line one\nline two", error));
  REQUIRE(context.Put("path", "C:\\out", error));

  const std::string text = trendloop::pipeline::ToKeyValueText(context);
  REQUIRE(text == "path=C:\\\\out\ntitle=line one\\nline two\n");
}
