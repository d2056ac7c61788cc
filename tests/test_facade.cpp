#include "errors.hpp"
#include "exception_handler.hpp"
#include "facade.hpp"
#include "helpers/datetime_helper.hpp"
#include <catch2/catch_test_macros.hpp>
#include <exception>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

TEST_CASE("facade init registers datetime helpers", "[facade]") {
  spf::Facade facade;
  REQUIRE(facade.registry().size() == 0);
  facade.init();
  facade.init();
  REQUIRE(facade.registry().size() == 2);
  auto entry = facade.registry().resolve("maketimestamp");
  REQUIRE(entry);
  REQUIRE(entry->provider == spf::helpers::kDateTimeHelper);
  REQUIRE(facade.call("makeTimestamp", {"@42"}) == 42);
  REQUIRE(facade.call("MAKETIMESTAMP", {12.9}) == 12);
  REQUIRE(facade.call("Seconds", {"5min"}) == 300);
}

TEST_CASE("facade native methods", "[facade]") {
  spf::Facade facade;
  REQUIRE_FALSE(facade.is_debug());
  REQUIRE(facade.call("is_debug") == false);
  facade.call("SET_DEBUG", {true});
  REQUIRE(facade.is_debug());
  REQUIRE(facade.call("is_debug") == true);
  facade.call("set_debug");
  REQUIRE_FALSE(facade.is_debug());
  REQUIRE(facade.call("is_cli").is_boolean());
  REQUIRE_THROWS_AS(facade.call("dump"), std::invalid_argument);
}

TEST_CASE("facade dump prints only in debug mode", "[facade]") {
  spf::Facade facade;
  std::ostringstream quiet;
  facade.dump(nlohmann::json{{"a", 1}}, quiet);
  REQUIRE(quiet.str().empty());

  facade.set_debug(true);
  std::ostringstream loud;
  facade.dump(nlohmann::json{{"a", 1}}, loud);
  REQUIRE(loud.str() == "{\n  \"a\": 1\n}\n");
}

TEST_CASE("facade rejects unknown and reserved methods", "[facade]") {
  spf::Facade facade;
  REQUIRE_THROWS_AS(facade.call("frobnicate"), spf::UnknownHelperMethod);
  spf::HelperMethod dump{"Dump", [](const spf::HelperArgs &) {
                           return nlohmann::json(nullptr);
                         }};
  REQUIRE_THROWS_AS(facade.add_helper_method("acme::Debug", dump),
                    spf::ReservedNameCollision);
  spf::HelperMethod run{"run", [](const spf::HelperArgs &) {
                          return nlohmann::json(nullptr);
                        }};
  REQUIRE_THROWS_AS(facade.register_helpers({{"acme::Runner", {run}}}),
                    spf::ReservedNameCollision);
}

TEST_CASE("facade helper collisions between providers", "[facade]") {
  spf::Facade facade;
  facade.init();
  spf::HelperMethod seconds{"SECONDS", [](const spf::HelperArgs &) {
                              return nlohmann::json(0);
                            }};
  REQUIRE_THROWS_AS(facade.add_helper_method("acme::Clock", seconds),
                    spf::DuplicateHelperCollision);
  REQUIRE_NOTHROW(facade.register_helpers({spf::helpers::datetime_helper()}));
}

TEST_CASE("facade run dispatches through the exception handler",
          "[facade]") {
  spf::Facade facade;
  facade.init();
  REQUIRE(facade.run([&facade] {
            return facade.call("seconds", {"1:00"});
          }) == 60);

  auto marker = facade.run([&facade] {
    return facade.call("makeTimestamp", {"whenever"});
  });
  REQUIRE(spf::is_error_marker(marker));
  REQUIRE(marker["error"]["type"] == "InvalidTimeRepresentation");

  int calls = 0;
  facade.set_exception_handler([&calls](std::exception_ptr) {
    ++calls;
    return nlohmann::json("custom");
  });
  REQUIRE(facade.run([&facade] { return facade.call("missing"); }) ==
          "custom");
  REQUIRE(calls == 1);
}

TEST_CASE("facade instance is shared", "[facade]") {
  REQUIRE(&spf::Facade::instance() == &spf::Facade::instance());
}
