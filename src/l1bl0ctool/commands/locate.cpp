#include "locate.hpp"

#include <filesystem>
#include <iostream>
#include <vector>

#include <redlog.hpp>

#include <l1bl0c/l1bl0c.hpp>

namespace l1bl0ctool::commands {

int locate(
    args::PositionalList<std::string>& names_list, args::ValueFlagList<std::string>& dirs_flag,
    args::Flag& system_flag, args::Flag& strict_flag
) {
  auto log = redlog::get_logger("l1bl0c.tool.locate");

  if (!names_list) {
    log.err("at least one library name is required");
    return 1;
  }

  try {
    const auto& platform = l1bl0c::platform::get_platform();

    std::vector<std::string> search_paths;
    if (dirs_flag) {
      search_paths = args::get(dirs_flag);
    }
    if (system_flag) {
      for (const auto& dir : l1bl0c::library::library_search_paths(platform, l1bl0c::util::env_config("L1BL0C"))) {
        search_paths.push_back(dir);
      }
    }
    log.vrb("searching for libraries", redlog::field("directories", search_paths.size()));

    int exit_code = 0;
    for (const auto& name : args::get(names_list)) {
      std::string resolved = platform.locate_library(name, search_paths);
      bool found = std::filesystem::path(resolved).is_absolute();
      std::cout << name << " -> " << resolved << (found ? "" : " (unresolved)") << "\n";
      if (!found && strict_flag) {
        log.err("library not found", redlog::field("name", name));
        exit_code = 1;
      }
    }
    return exit_code;
  } catch (const l1bl0c::platform::platform_error& e) {
    log.err(
        "failed to resolve platform", redlog::field("code", std::string(l1bl0c::core::to_string(e.code()))),
        redlog::field("error", e.what())
    );
    return 1;
  }
}

} // namespace l1bl0ctool::commands
