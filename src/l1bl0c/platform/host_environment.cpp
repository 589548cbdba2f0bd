#include "l1bl0c/platform/host_environment.hpp"

#include <redlog.hpp>

#include <utility>

#ifndef _WIN32
#include <sys/utsname.h>
#include <cerrno>
#include <cstring>
#endif

#include "l1bl0c/util/env_config.hpp"

namespace l1bl0c::platform {

namespace {

#ifdef _WIN32
std::string compiled_arch_name() {
#if defined(_M_X64) || defined(__x86_64__)
  return "amd64";
#elif defined(_M_IX86) || defined(__i386__)
  return "x86";
#elif defined(_M_ARM64)
  return "aarch64";
#else
  return "unknown";
#endif
}
#endif

} // namespace

host_environment detect_host_environment() {
  auto log = redlog::get_logger("l1bl0c.environment");
  host_environment env;
  env.data_model = static_cast<int>(sizeof(void*) * 8);

#ifdef _WIN32
  env.os_name = "Windows";
  env.arch = compiled_arch_name();
#else
  struct utsname uts{};
  if (uname(&uts) == 0) {
    env.os_name = uts.sysname;
    env.arch = uts.machine;
    env.runtime_version = uts.release;
  } else {
    log.wrn("uname failed, host facts unavailable", redlog::field("error", std::strerror(errno)));
  }
#endif

  log.dbg(
      "detected host environment", redlog::field("os_name", env.os_name), redlog::field("arch", env.arch),
      redlog::field("data_model", env.data_model.value_or(0)), redlog::field("runtime_version", env.runtime_version)
  );

  return apply_overrides(std::move(env), util::env_config("L1BL0C"));
}

host_environment apply_overrides(host_environment env, const util::env_config& config) {
  auto log = redlog::get_logger("l1bl0c.environment");

  if (config.has("OS_NAME")) {
    env.os_name = config.get<std::string>("OS_NAME", env.os_name);
    log.vrb("os name overridden", redlog::field("os_name", env.os_name));
  }
  if (config.has("OS_ARCH")) {
    env.arch = config.get<std::string>("OS_ARCH", env.arch);
    log.vrb("arch overridden", redlog::field("arch", env.arch));
  }
  if (config.has("DATA_MODEL")) {
    int model = config.get<int>("DATA_MODEL", env.data_model.value_or(0));
    if (model == 0) {
      env.data_model.reset();
    } else {
      env.data_model = model;
    }
    log.vrb("data model overridden", redlog::field("data_model", model));
  }
  if (config.has("RUNTIME_VERSION")) {
    env.runtime_version = config.get<std::string>("RUNTIME_VERSION", env.runtime_version);
    log.vrb("runtime version overridden", redlog::field("runtime_version", env.runtime_version));
  }

  return env;
}

} // namespace l1bl0c::platform
