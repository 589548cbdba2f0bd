#pragma once

#include <string>
#include <vector>

namespace l1bl0c::platform {
class platform_identity;
}

namespace l1bl0c::util {
class env_config;
}

namespace l1bl0c::library {

/**
 * @brief conventional system library directories for a platform
 *
 * linux includes the multiarch directory for the cpu and the lib64 variants on 64-bit hosts.
 */
std::vector<std::string> system_library_directories(const platform::platform_identity& identity);

/**
 * @brief directories from LIBRARY_PATH followed by the system directories
 *
 * LIBRARY_PATH is split on the platform path separator (':' or ';'). duplicates are dropped,
 * keeping the first occurrence. setting NO_SYSTEM_PATHS leaves out the system directories.
 */
std::vector<std::string> library_search_paths(
    const platform::platform_identity& identity, const util::env_config& config
);

// platform path list separator
char path_list_separator(const platform::platform_identity& identity);

} // namespace l1bl0c::library
