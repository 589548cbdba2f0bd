#include "info.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include <redlog.hpp>

#include <l1bl0c/l1bl0c.hpp>

namespace l1bl0ctool::commands {

namespace {

std::string format_mask(uint64_t mask, uint32_t bits) {
  std::ostringstream ss;
  ss << "0x" << std::hex << std::setfill('0') << std::setw(static_cast<int>(bits / 4)) << mask;
  return ss.str();
}

} // namespace

int info(args::Flag& search_paths_flag) {
  auto log = redlog::get_logger("l1bl0c.tool.info");

  try {
    const auto& platform = l1bl0c::platform::get_platform();

    std::cout << "platform:        " << platform.name() << "\n";
    std::cout << "os:              " << l1bl0c::platform::to_string(platform.os()) << "\n";
    std::cout << "cpu:             " << l1bl0c::platform::to_string(platform.cpu()) << "\n";
    std::cout << "address bits:    " << platform.address_bits() << "\n";
    std::cout << "address mask:    " << format_mask(platform.address_mask(), platform.address_bits()) << "\n";
    std::cout << "long bits:       " << platform.long_bits() << "\n";
    std::cout << "runtime major:   " << platform.runtime_major_version() << "\n";
    std::cout << "unix:            " << (platform.is_unix() ? "yes" : "no") << "\n";
    std::cout << "bsd:             " << (platform.is_bsd() ? "yes" : "no") << "\n";
    std::cout << "strategy:        " << platform.strategy().name << "\n";
    std::cout << "library pattern: " << l1bl0c::platform::library_pattern_source(platform.os()) << "\n";

    if (search_paths_flag) {
      std::cout << "search paths:\n";
      for (const auto& dir : l1bl0c::library::library_search_paths(platform, l1bl0c::util::env_config("L1BL0C"))) {
        std::cout << "  " << dir << "\n";
      }
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
