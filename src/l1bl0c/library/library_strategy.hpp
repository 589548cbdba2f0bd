#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "l1bl0c/platform/os_family.hpp"

namespace l1bl0c::platform {
class platform_identity;
}

namespace l1bl0c::library {

using map_fn = std::string (*)(const platform::platform_identity& identity, std::string_view generic_name);
using locate_fn = std::string (*)(
    const platform::platform_identity& identity, std::string_view generic_name,
    const std::vector<std::string>& search_paths
);

// naming and lookup behavior for one operating system family
struct library_strategy {
  std::string_view name;
  map_fn map_name;
  locate_fn locate;
};

// strategy table entry for os; families without their own entry use the unix defaults
const library_strategy& strategy_for(platform::operating_system os);

} // namespace l1bl0c::library
