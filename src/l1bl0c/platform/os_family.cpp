#include "l1bl0c/platform/os_family.hpp"

#include <array>
#include <string>
#include <utility>

#include "l1bl0c/util/string_utils.hpp"

namespace l1bl0c::platform {

namespace {

constexpr std::array<std::pair<std::string_view, operating_system>, 9> k_os_prefixes = {{
    {"mac", operating_system::darwin},
    {"darwin", operating_system::darwin},
    {"linux", operating_system::gnu_linux},
    {"sunos", operating_system::solaris},
    {"solaris", operating_system::solaris},
    {"aix", operating_system::aix},
    {"openbsd", operating_system::openbsd},
    {"freebsd", operating_system::freebsd},
    {"windows", operating_system::windows},
}};

} // namespace

operating_system classify_os(std::string_view raw) {
  std::string token = util::to_lower(util::first_token(raw));
  if (token.empty()) {
    return operating_system::unknown;
  }

  for (const auto& [prefix, os] : k_os_prefixes) {
    if (std::string_view(token).substr(0, prefix.size()) == prefix) {
      return os;
    }
  }
  return operating_system::unknown;
}

std::string_view to_string(operating_system os) {
  switch (os) {
  case operating_system::darwin:
    return "darwin";
  case operating_system::freebsd:
    return "freebsd";
  case operating_system::netbsd:
    return "netbsd";
  case operating_system::openbsd:
    return "openbsd";
  case operating_system::gnu_linux:
    return "linux";
  case operating_system::solaris:
    return "solaris";
  case operating_system::windows:
    return "windows";
  case operating_system::aix:
    return "aix";
  case operating_system::zlinux:
    return "zlinux";
  case operating_system::unknown:
    break;
  }
  return "unknown";
}

} // namespace l1bl0c::platform
