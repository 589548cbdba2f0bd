#include <doctest/doctest.h>

#include <string>
#include <thread>
#include <vector>

#include "l1bl0c/platform/platform.hpp"
#include "test_helpers.hpp"

namespace {

using l1bl0c::platform::cpu_architecture;
using l1bl0c::platform::host_environment;
using l1bl0c::platform::operating_system;
using l1bl0c::platform::parse_runtime_major_version;
using l1bl0c::platform::resolve_platform;
using l1bl0c::test::make_identity;

} // namespace

TEST_CASE("resolve_platform derives width and mask from the cpu") {
  auto amd64 = make_identity("Linux", "amd64");
  CHECK(amd64->os() == operating_system::gnu_linux);
  CHECK(amd64->cpu() == cpu_architecture::x86_64);
  CHECK(amd64->address_bits() == 64);
  CHECK(amd64->address_mask() == 0xFFFFFFFFFFFFFFFFULL);

  auto x86 = make_identity("Windows 10", "x86");
  CHECK(x86->address_bits() == 32);
  CHECK(x86->address_mask() == 0xFFFFFFFFULL);

  auto sparc = make_identity("SunOS", "sparcv9");
  CHECK(sparc->cpu() == cpu_architecture::sparc64);
  CHECK(sparc->address_bits() == 64);
}

TEST_CASE("resolve_platform prefers a valid data model hint") {
  auto hinted = make_identity("Linux", "amd64", 32);
  CHECK(hinted->cpu() == cpu_architecture::x86_64);
  CHECK(hinted->address_bits() == 32);
  CHECK(hinted->address_mask() == 0xFFFFFFFFULL);

  auto unknown_cpu = make_identity("Linux", "aarch64", 64);
  CHECK(unknown_cpu->cpu() == cpu_architecture::unknown);
  CHECK(unknown_cpu->address_bits() == 64);
}

TEST_CASE("resolve_platform ignores data model hints other than 32 or 64") {
  auto ignored = make_identity("Linux", "i386", 16);
  CHECK(ignored->address_bits() == 32);
}

TEST_CASE("resolve_platform fails when the address width is unknown") {
  host_environment env;
  env.os_name = "Linux";
  env.arch = "i686";

  auto resolved = resolve_platform(env);
  CHECK_FALSE(resolved.ok());
  CHECK(resolved.status_info.code == l1bl0c::core::error_code::unknown_address_width);
  CHECK(resolved.value == nullptr);

  env.data_model = 48;
  CHECK_FALSE(resolve_platform(env).ok());
}

TEST_CASE("platform_error carries the failed resolution status") {
  host_environment env;
  env.os_name = "Linux";
  env.arch = "i686";
  auto resolved = resolve_platform(env);
  REQUIRE_FALSE(resolved.ok());

  l1bl0c::platform::platform_error error(resolved.status_info);
  CHECK(error.code() == l1bl0c::core::error_code::unknown_address_width);
  CHECK(error.failure().message == resolved.status_info.message);
  std::string what = error.what();
  CHECK(what.rfind("unknown_address_width: ", 0) == 0);
  CHECK(what.find("i686") != std::string::npos);
}

TEST_CASE("status describes its code and message") {
  using l1bl0c::core::error_code;
  using l1bl0c::core::status;

  CHECK(status{}.ok());
  CHECK(status{}.describe() == "ok");
  CHECK(status{error_code::unknown_address_width, ""}.describe() == "unknown_address_width");
  CHECK(status{error_code::unknown_address_width, "arch 'x'"}.describe() == "unknown_address_width: arch 'x'");
}

TEST_CASE("unknown operating systems still resolve") {
  auto identity = make_identity("Plan9", "x86_64");
  CHECK(identity->os() == operating_system::unknown);
  CHECK(identity->is_unix());
  CHECK_FALSE(identity->is_bsd());
  CHECK(identity->strategy().name == "default");
}

TEST_CASE("platform identity reports family and names") {
  auto linux_identity = make_identity("Linux", "x86_64");
  CHECK(linux_identity->name() == "x86_64-linux");
  CHECK(linux_identity->is_unix());
  CHECK_FALSE(linux_identity->is_bsd());
  CHECK(linux_identity->long_bits() == 64);

  auto darwin = make_identity("Mac OS X", "x86_64");
  CHECK(darwin->name() == "Darwin");
  CHECK(darwin->is_bsd());

  auto windows = make_identity("Windows 10", "amd64");
  CHECK(windows->name() == "x86_64-windows");
  CHECK_FALSE(windows->is_unix());
  CHECK(windows->long_bits() == 32);
  CHECK(windows->address_bits() == 64);
}

TEST_CASE("library pattern depends on the operating system") {
  auto windows = make_identity("Windows", "amd64");
  CHECK(windows->matches_library_pattern("ssl.dll"));
  CHECK_FALSE(windows->matches_library_pattern("libssl.so"));

  auto darwin = make_identity("Darwin", "x86_64");
  CHECK(darwin->matches_library_pattern("libssl.dylib"));
  CHECK(darwin->matches_library_pattern("libjava.jnilib"));
  CHECK_FALSE(darwin->matches_library_pattern("ssl.dylib"));

  auto freebsd = make_identity("FreeBSD", "amd64");
  CHECK(freebsd->matches_library_pattern("libssl.so"));
  CHECK(freebsd->matches_library_pattern("libssl.so.3"));
  CHECK_FALSE(freebsd->matches_library_pattern("ssl"));
}

TEST_CASE("runtime major version parsing") {
  CHECK(parse_runtime_major_version("6.18.44-fc-v139") == 6);
  CHECK(parse_runtime_major_version("11.0.2") == 11);
  CHECK(parse_runtime_major_version("1.6.0_20") == 6);
  CHECK(parse_runtime_major_version("1") == 1);
  CHECK_FALSE(parse_runtime_major_version("").has_value());
  CHECK_FALSE(parse_runtime_major_version("beta").has_value());

  host_environment env;
  env.os_name = "Linux";
  env.arch = "x86_64";
  env.runtime_version = "not-a-version";
  auto resolved = resolve_platform(env);
  REQUIRE(resolved.ok());
  CHECK(resolved.value->runtime_major_version() == 0);

  env.runtime_version = "5.15.0-91-generic";
  resolved = resolve_platform(env);
  REQUIRE(resolved.ok());
  CHECK(resolved.value->runtime_major_version() == 5);
}

TEST_CASE("get_platform returns one instance to concurrent callers") {
  std::vector<const l1bl0c::platform::platform_identity*> seen(8, nullptr);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < seen.size(); ++i) {
    threads.emplace_back([&seen, i] { seen[i] = &l1bl0c::platform::get_platform(); });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (const auto* identity : seen) {
    CHECK(identity == seen.front());
  }
  const auto& platform = l1bl0c::platform::get_platform();
  CHECK(&platform == seen.front());
  CHECK((platform.address_bits() == 32 || platform.address_bits() == 64));
}
