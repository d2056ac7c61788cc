#include "app.hpp"
#include "exception_handler.hpp"
#include "facade.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

TEST_CASE("app dispatches seconds end to end", "[app]") {
  std::ostringstream out;
  spf::App app(out);
  char prog[] = "spf";
  char method[] = "seconds";
  char arg[] = "5min";
  char *argv[] = {prog, method, arg};
  REQUIRE(app.run(3, argv) == 0);
  REQUIRE(app.result() == 300);
  REQUIRE(out.str() == "300\n");
}

TEST_CASE("app decodes json arguments", "[app]") {
  auto args = spf::decode_cli_arguments({"42", "\"quoted\"", "2021-01-01",
                                         "true", "{\"a\":1}"});
  REQUIRE(args.size() == 5);
  REQUIRE(args[0] == 42);
  REQUIRE(args[1] == "quoted");
  REQUIRE(args[2] == "2021-01-01");
  REQUIRE(args[3] == true);
  REQUIRE(args[4]["a"] == 1);
}

TEST_CASE("app reports failures with exit code 1", "[app]") {
  std::ostringstream out;
  spf::App app(out);
  char prog[] = "spf";
  char method[] = "makeTimestamp";
  char arg[] = "the day after";
  char *argv[] = {prog, method, arg};
  REQUIRE(app.run(3, argv) == 1);
  REQUIRE(spf::is_error_marker(app.result()));
  REQUIRE(app.result()["error"]["type"] == "InvalidTimeRepresentation");

  char unknown[] = "noSuchHelper";
  char *argv2[] = {prog, unknown};
  REQUIRE(app.run(2, argv2) == 1);
  REQUIRE(app.result()["error"]["type"] == "UnknownHelperMethod");

  char *argv3[] = {prog};
  REQUIRE(app.run(1, argv3) == 1);
  REQUIRE(app.result().is_null());
}

TEST_CASE("app lists helpers", "[app]") {
  std::ostringstream out;
  spf::App app(out);
  char prog[] = "spf";
  char list[] = "--list";
  char *argv[] = {prog, list};
  REQUIRE(app.run(2, argv) == 0);
  const std::string text = out.str();
  REQUIRE(text.find("makeTimestamp spf::helpers::DateTimeHelper::makeTimestamp\n") !=
          std::string::npos);
  REQUIRE(text.find("seconds spf::helpers::DateTimeHelper::seconds\n") !=
          std::string::npos);
}

TEST_CASE("app applies configuration and debug dump", "[app]") {
  {
    std::ofstream f("spf_app_cfg.json");
    f << R"({"core": {"debug": true}, "logging": {"log_level": "warn"}})";
  }
  std::ostringstream out;
  spf::App app(out);
  char prog[] = "spf";
  char config[] = "-C";
  char path[] = "spf_app_cfg.json";
  char method[] = "seconds";
  char arg[] = "1:00";
  char *argv[] = {prog, config, path, method, arg};
  REQUIRE(app.run(5, argv) == 0);
  REQUIRE(app.config().debug());
  REQUIRE(app.config().log_level() == "warn");
  REQUIRE(spf::Facade::instance().is_debug());
  REQUIRE(out.str() == "60\n60\n");
  spf::Facade::instance().set_debug(false);
  std::remove("spf_app_cfg.json");

  char missing[] = "spf_missing_cfg.yaml";
  char *argv2[] = {prog, config, missing, method, arg};
  REQUIRE(app.run(5, argv2) == 1);
}
