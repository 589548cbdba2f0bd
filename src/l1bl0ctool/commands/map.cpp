#include "map.hpp"

#include <iostream>

#include <redlog.hpp>

#include <l1bl0c/l1bl0c.hpp>

namespace l1bl0ctool::commands {

int map(args::PositionalList<std::string>& names_list) {
  auto log = redlog::get_logger("l1bl0c.tool.map");

  if (!names_list) {
    log.err("at least one library name is required");
    return 1;
  }

  try {
    const auto& platform = l1bl0c::platform::get_platform();
    for (const auto& name : args::get(names_list)) {
      std::cout << name << " -> " << platform.map_library_name(name) << "\n";
    }
  } catch (const l1bl0c::platform::platform_error& e) {
    log.err(
        "failed to resolve platform", redlog::field("code", std::string(l1bl0c::core::to_string(e.code()))),
        redlog::field("error", e.what())
    );
    return 1;
  }

  return 0;
}

} // namespace l1bl0ctool::commands
