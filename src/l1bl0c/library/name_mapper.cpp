#include "l1bl0c/library/name_mapper.hpp"

#include "l1bl0c/platform/platform.hpp"

namespace l1bl0c::library {

namespace {

constexpr std::string_view k_linux_libc = "libc.so.6";

std::string decorate(std::string_view prefix, std::string_view name, std::string_view suffix) {
  std::string out;
  out.reserve(prefix.size() + name.size() + suffix.size());
  out.append(prefix).append(name).append(suffix);
  return out;
}

} // namespace

std::string map_windows_name(const platform::platform_identity& identity, std::string_view generic_name) {
  if (identity.matches_library_pattern(generic_name)) {
    return std::string(generic_name);
  }
  return decorate("", generic_name, ".dll");
}

std::string map_darwin_name(const platform::platform_identity& identity, std::string_view generic_name) {
  if (identity.matches_library_pattern(generic_name)) {
    return std::string(generic_name);
  }
  return decorate("lib", generic_name, ".dylib");
}

std::string map_unix_name(const platform::platform_identity& identity, std::string_view generic_name) {
  if (identity.matches_library_pattern(generic_name)) {
    return std::string(generic_name);
  }
  return decorate("lib", generic_name, ".so");
}

std::string map_linux_name(const platform::platform_identity& identity, std::string_view generic_name) {
  if (generic_name == "c") {
    return std::string(k_linux_libc);
  }
  std::string mapped = map_unix_name(identity, generic_name);
  if (mapped == "libc.so") {
    return std::string(k_linux_libc);
  }
  return mapped;
}

} // namespace l1bl0c::library
