#pragma once

#include <string>
#include <string_view>

namespace l1bl0c::platform {
class platform_identity;
}

namespace l1bl0c::library {

// each mapper returns generic_name unchanged when it already matches the identity's library pattern

// "<name>.dll"
std::string map_windows_name(const platform::platform_identity& identity, std::string_view generic_name);

// "lib<name>.dylib"
std::string map_darwin_name(const platform::platform_identity& identity, std::string_view generic_name);

// "lib<name>.so"
std::string map_unix_name(const platform::platform_identity& identity, std::string_view generic_name);

// unix naming, except that libc maps to "libc.so.6"; the unversioned libc.so is usually a linker script
std::string map_linux_name(const platform::platform_identity& identity, std::string_view generic_name);

} // namespace l1bl0c::library
