#pragma once

#include <optional>
#include <string>

namespace l1bl0c::util {
class env_config;
}

namespace l1bl0c::platform {

// raw, untrusted facts about the host; classification happens in resolve_platform()
struct host_environment {
  std::string os_name;
  std::string arch;
  std::optional<int> data_model; // declared address width, only 32 or 64 are honored
  std::string runtime_version;
};

/**
 * @brief collect host facts from the running system
 *
 * uses uname() on posix hosts and compile-time facts elsewhere. the data model hint is the
 * width of a pointer in this build. L1BL0C_* environment overrides are applied on top.
 */
host_environment detect_host_environment();

/**
 * @brief apply OS_NAME, OS_ARCH, DATA_MODEL and RUNTIME_VERSION overrides
 *
 * a DATA_MODEL of 0 clears the hint.
 */
host_environment apply_overrides(host_environment env, const util::env_config& config);

} // namespace l1bl0c::platform
