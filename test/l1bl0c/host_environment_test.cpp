#include <doctest/doctest.h>

#include "l1bl0c/platform/host_environment.hpp"
#include "l1bl0c/platform/platform.hpp"
#include "l1bl0c/util/env_config.hpp"
#include "test_helpers.hpp"

namespace {

using l1bl0c::platform::apply_overrides;
using l1bl0c::platform::host_environment;
using l1bl0c::test::scoped_env_var;

host_environment sample_environment() {
  host_environment env;
  env.os_name = "Linux";
  env.arch = "x86_64";
  env.data_model = 64;
  env.runtime_version = "6.1.0";
  return env;
}

} // namespace

TEST_CASE("detect_host_environment reports a usable host") {
  auto env = l1bl0c::platform::detect_host_environment();
  CHECK_FALSE(env.os_name.empty());
  REQUIRE(env.data_model.has_value());
  CHECK((*env.data_model == 32 || *env.data_model == 64));
  CHECK(l1bl0c::platform::resolve_platform(env).ok());
}

TEST_CASE("apply_overrides replaces host facts") {
  scoped_env_var os_name("L1BL0C_HOST_OS_NAME", "SunOS 5.11");
  scoped_env_var arch("L1BL0C_HOST_OS_ARCH", "sparcv9");
  scoped_env_var model("L1BL0C_HOST_DATA_MODEL", "32");
  scoped_env_var version("L1BL0C_HOST_RUNTIME_VERSION", "1.8.0_392");

  auto env = apply_overrides(sample_environment(), l1bl0c::util::env_config("L1BL0C_HOST"));
  CHECK(env.os_name == "SunOS 5.11");
  CHECK(env.arch == "sparcv9");
  CHECK(env.data_model == 32);
  CHECK(env.runtime_version == "1.8.0_392");

  auto resolved = l1bl0c::platform::resolve_platform(env);
  REQUIRE(resolved.ok());
  CHECK(resolved.value->os() == l1bl0c::platform::operating_system::solaris);
  CHECK(resolved.value->address_bits() == 32);
  CHECK(resolved.value->runtime_major_version() == 8);
}

TEST_CASE("a zero data model override clears the hint") {
  scoped_env_var arch("L1BL0C_HOST_OS_ARCH", "mystery");
  scoped_env_var model("L1BL0C_HOST_DATA_MODEL", "0");

  auto env = apply_overrides(sample_environment(), l1bl0c::util::env_config("L1BL0C_HOST"));
  CHECK_FALSE(env.data_model.has_value());

  auto resolved = l1bl0c::platform::resolve_platform(env);
  CHECK_FALSE(resolved.ok());
  CHECK(resolved.status_info.code == l1bl0c::core::error_code::unknown_address_width);
}

TEST_CASE("apply_overrides leaves unset facts alone") {
  auto env = apply_overrides(sample_environment(), l1bl0c::util::env_config("L1BL0C_HOST_UNSET"));
  CHECK(env.os_name == "Linux");
  CHECK(env.arch == "x86_64");
  CHECK(env.data_model == 64);
  CHECK(env.runtime_version == "6.1.0");
}
