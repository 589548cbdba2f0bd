#pragma once

#include <algorithm>

#include <redlog.hpp>

#include <l1bl0c/util/env_config.hpp>

namespace l1bl0ctool::cli {

// -v count plus L1BL0C_VERBOSE; negative settings never lower below the default
inline int effective_verbosity(int flag_count, const l1bl0c::util::env_config& config) {
  return std::max(0, flag_count + config.get<int>("VERBOSE", 0));
}

inline redlog::level level_for(int verbosity) {
  switch (verbosity) {
  case 0:
    return redlog::level::info;
  case 1:
    return redlog::level::verbose;
  case 2:
    return redlog::level::trace;
  case 3:
    return redlog::level::debug;
  default:
    break;
  }
  return verbosity > 3 ? redlog::level::pedantic : redlog::level::info;
}

inline void apply_verbosity(int flag_count, const l1bl0c::util::env_config& config) {
  redlog::set_level(level_for(effective_verbosity(flag_count, config)));
}

} // namespace l1bl0ctool::cli
