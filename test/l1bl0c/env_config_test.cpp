#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "l1bl0c/util/env_config.hpp"
#include "test_helpers.hpp"

namespace {

using l1bl0c::test::scoped_env_var;
using l1bl0c::util::env_config;

} // namespace

TEST_CASE("env_config prefixes variable names") {
  env_config config("L1BL0C_CFG");
  CHECK(config.build_env_name("VALUE") == "L1BL0C_CFG_VALUE");
  CHECK(env_config("L1BL0C_CFG_").build_env_name("VALUE") == "L1BL0C_CFG_VALUE");
}

TEST_CASE("env_config reads typed values with defaults") {
  scoped_env_var text("L1BL0C_CFG_TEXT", "  hello ");
  scoped_env_var number("L1BL0C_CFG_NUMBER", "64");
  scoped_env_var flag("L1BL0C_CFG_FLAG", "On");
  env_config config("L1BL0C_CFG");

  CHECK(config.get<std::string>("TEXT", "default") == "hello");
  CHECK(config.get<std::string>("MISSING", "default") == "default");
  CHECK(config.get<int>("NUMBER", 0) == 64);
  CHECK(config.get<int>("MISSING", 7) == 7);
  CHECK(config.get<bool>("FLAG", false));
  CHECK(config.has("TEXT"));
  CHECK_FALSE(config.has("MISSING"));
}

TEST_CASE("env_config falls back on malformed numbers") {
  scoped_env_var bad("L1BL0C_CFG_BAD", "64bit");
  scoped_env_var worse("L1BL0C_CFG_WORSE", "sixty-four");
  env_config config("L1BL0C_CFG");

  CHECK(config.get<int>("BAD", 32) == 32);
  CHECK(config.get<int>("WORSE", 32) == 32);
}

TEST_CASE("env_config splits lists") {
  scoped_env_var list("L1BL0C_CFG_LIST", "a, b,,c ");
  env_config config("L1BL0C_CFG");

  CHECK(config.get_list("LIST") == std::vector<std::string>{"a", "b", "c"});
  CHECK(config.get_list("MISSING").empty());
}
