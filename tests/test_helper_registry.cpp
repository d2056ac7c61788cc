#include "errors.hpp"
#include "helper_registry.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace {
spf::HelperMethod constant_method(const std::string &name, int value) {
  return {name, [value](const spf::HelperArgs &) -> nlohmann::json {
            return value;
          }};
}
} // namespace

TEST_CASE("registry resolves case-insensitively", "[registry]") {
  spf::HelperRegistry registry;
  registry.register_provider({"acme::Numbers", {constant_method("answer", 42)}});
  REQUIRE(registry.size() == 1);
  auto entry = registry.resolve("ANSWER");
  REQUIRE(entry);
  REQUIRE(entry->provider == "acme::Numbers");
  REQUIRE(entry->method == "answer");
  REQUIRE(entry->function({}) == 42);
  REQUIRE_FALSE(registry.resolve("question"));
}

TEST_CASE("registry rejects duplicates from another provider", "[registry]") {
  spf::HelperRegistry registry;
  registry.register_method("first", constant_method("value", 1));
  try {
    registry.register_method("second", constant_method("VALUE", 2));
    FAIL("expected DuplicateHelperCollision");
  } catch (const spf::DuplicateHelperCollision &e) {
    REQUIRE(e.method() == "VALUE");
    REQUIRE(e.existing_provider() == "first");
    REQUIRE(e.duplicate_provider() == "second");
  }
  REQUIRE(registry.resolve("value")->function({}) == 1);
}

TEST_CASE("registry re-registration from same provider replaces entry",
          "[registry]") {
  spf::HelperRegistry registry;
  registry.register_method("first", constant_method("value", 1));
  registry.register_method("first", constant_method("Value", 2));
  REQUIRE(registry.size() == 1);
  auto entry = registry.resolve("value");
  REQUIRE(entry->method == "Value");
  REQUIRE(entry->function({}) == 2);
}

TEST_CASE("registry rejects reserved names", "[registry]") {
  spf::HelperRegistry registry({"dump", "is_debug"});
  REQUIRE(registry.is_reserved("DUMP"));
  REQUIRE_FALSE(registry.is_reserved("seconds"));
  REQUIRE_THROWS_AS(registry.register_method("p", constant_method("Dump", 0)),
                    spf::ReservedNameCollision);
  REQUIRE(registry.size() == 0);
}

TEST_CASE("registry provider registration stops at first failure",
          "[registry]") {
  spf::HelperRegistry registry({"dump"});
  spf::HelperProvider provider{
      "p", {constant_method("a", 1), constant_method("dump", 2),
            constant_method("b", 3)}};
  REQUIRE_THROWS_AS(registry.register_provider(provider),
                    spf::ReservedNameCollision);
  REQUIRE(registry.resolve("a"));
  REQUIRE_FALSE(registry.resolve("b"));
}

TEST_CASE("registry entries are ordered by key", "[registry]") {
  spf::HelperRegistry registry;
  registry.register_provider(
      {"p", {constant_method("zeta", 1), constant_method("Alpha", 2),
             constant_method("mid", 3)}});
  auto entries = registry.entries();
  REQUIRE(entries.size() == 3);
  REQUIRE(entries[0].method == "Alpha");
  REQUIRE(entries[1].method == "mid");
  REQUIRE(entries[2].method == "zeta");
}
