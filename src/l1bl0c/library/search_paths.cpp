#include "l1bl0c/library/search_paths.hpp"

#include <algorithm>
#include <string_view>

#include <redlog.hpp>

#include "l1bl0c/platform/platform.hpp"
#include "l1bl0c/util/env_config.hpp"

namespace l1bl0c::library {

namespace {

std::string_view multiarch_triplet(platform::cpu_architecture cpu) {
  switch (cpu) {
  case platform::cpu_architecture::x86_64:
    return "x86_64-linux-gnu";
  case platform::cpu_architecture::x86_32:
    return "i386-linux-gnu";
  case platform::cpu_architecture::ppc64:
    return "powerpc64-linux-gnu";
  case platform::cpu_architecture::ppc32:
    return "powerpc-linux-gnu";
  case platform::cpu_architecture::sparc64:
    return "sparc64-linux-gnu";
  case platform::cpu_architecture::systemz:
    return "s390x-linux-gnu";
  default:
    break;
  }
  return {};
}

void append_unique(std::vector<std::string>& paths, const std::string& path) {
  if (path.empty()) {
    return;
  }
  if (std::find(paths.begin(), paths.end(), path) == paths.end()) {
    paths.push_back(path);
  }
}

} // namespace

std::vector<std::string> system_library_directories(const platform::platform_identity& identity) {
  using platform::operating_system;

  switch (identity.os()) {
  case operating_system::windows:
    return {"C:\\Windows\\System32"};
  case operating_system::darwin:
    return {"/usr/local/lib", "/opt/local/lib", "/usr/lib"};
  case operating_system::gnu_linux:
  case operating_system::zlinux: {
    std::vector<std::string> paths;
    std::string_view triplet = multiarch_triplet(identity.cpu());
    if (!triplet.empty()) {
      paths.push_back("/lib/" + std::string(triplet));
      paths.push_back("/usr/lib/" + std::string(triplet));
    }
    if (identity.address_bits() == 64) {
      paths.push_back("/lib64");
      paths.push_back("/usr/lib64");
    }
    paths.push_back("/lib");
    paths.push_back("/usr/lib");
    paths.push_back("/usr/local/lib");
    return paths;
  }
  case operating_system::solaris:
    if (identity.address_bits() == 64) {
      return {"/lib/64", "/usr/lib/64", "/lib", "/usr/lib"};
    }
    return {"/lib", "/usr/lib"};
  default:
    break;
  }
  return {"/usr/local/lib", "/usr/lib", "/lib"};
}

char path_list_separator(const platform::platform_identity& identity) {
  return identity.os() == platform::operating_system::windows ? ';' : ':';
}

std::vector<std::string> library_search_paths(
    const platform::platform_identity& identity, const util::env_config& config
) {
  auto log = redlog::get_logger("l1bl0c.search_paths");
  std::vector<std::string> paths;

  for (const auto& dir : config.get_list("LIBRARY_PATH", path_list_separator(identity))) {
    append_unique(paths, dir);
  }
  size_t user_count = paths.size();

  if (!config.get<bool>("NO_SYSTEM_PATHS", false)) {
    for (const auto& dir : system_library_directories(identity)) {
      append_unique(paths, dir);
    }
  }

  log.dbg(
      "composed library search paths", redlog::field("user", user_count),
      redlog::field("total", paths.size())
  );
  return paths;
}

} // namespace l1bl0c::library
