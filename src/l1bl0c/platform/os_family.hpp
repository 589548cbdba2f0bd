#pragma once

#include <cstdint>
#include <string_view>

namespace l1bl0c::platform {

// to_string() names are used to build platform names, do not rename.
// linux is spelled gnu_linux because `linux` is a predefined macro under gnu extensions.
enum class operating_system : uint8_t { darwin, freebsd, netbsd, openbsd, gnu_linux, solaris, windows, aix, zlinux, unknown };

/**
 * @brief classify a free-form operating system name
 * @param raw os name as reported by the host (e.g. "Mac OS X", "Linux", "Windows 10")
 * @return the matching family, or operating_system::unknown
 *
 * only the first whitespace-delimited token is considered, matched case-insensitively by prefix.
 */
operating_system classify_os(std::string_view raw);

std::string_view to_string(operating_system os);

inline constexpr bool is_bsd_family(operating_system os) noexcept {
  return os == operating_system::freebsd || os == operating_system::openbsd || os == operating_system::netbsd ||
         os == operating_system::darwin;
}

inline constexpr bool is_unix_like(operating_system os) noexcept { return os != operating_system::windows; }

} // namespace l1bl0c::platform
