#include "l1bl0c/library/library_strategy.hpp"

#include "l1bl0c/library/library_locator.hpp"
#include "l1bl0c/library/name_mapper.hpp"

namespace l1bl0c::library {

namespace {

constexpr library_strategy k_windows_strategy{"windows", &map_windows_name, &locate_in_directories};
constexpr library_strategy k_darwin_strategy{"darwin", &map_darwin_name, &locate_in_directories};
constexpr library_strategy k_linux_strategy{"linux", &map_linux_name, &locate_versioned_shared_object};
constexpr library_strategy k_default_strategy{"default", &map_unix_name, &locate_in_directories};

} // namespace

const library_strategy& strategy_for(platform::operating_system os) {
  switch (os) {
  case platform::operating_system::windows:
    return k_windows_strategy;
  case platform::operating_system::darwin:
    return k_darwin_strategy;
  case platform::operating_system::gnu_linux:
    return k_linux_strategy;
  default:
    break;
  }
  return k_default_strategy;
}

} // namespace l1bl0c::library
