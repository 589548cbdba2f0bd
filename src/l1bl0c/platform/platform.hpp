#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "l1bl0c/core/result.hpp"
#include "l1bl0c/library/library_strategy.hpp"
#include "l1bl0c/platform/cpu_arch.hpp"
#include "l1bl0c/platform/host_environment.hpp"
#include "l1bl0c/platform/os_family.hpp"

namespace l1bl0c::platform {

// raised by get_platform() when the host cannot be resolved; native library work cannot proceed
class platform_error : public std::runtime_error {
public:
  explicit platform_error(core::status failure) : std::runtime_error(failure.describe()), failure_(std::move(failure)) {}

  core::error_code code() const noexcept { return failure_.code; }
  const core::status& failure() const noexcept { return failure_; }

private:
  core::status failure_;
};

/**
 * @brief immutable description of the platform the process runs on
 *
 * created by resolve_platform(). the address width is always 32 or 64 and the mask always
 * matches it. library naming and lookup dispatch through the per-os strategy chosen at
 * resolution time.
 */
class platform_identity {
  // restricts construction to resolve_platform() while keeping make_shared usable
  struct construction_key {
    explicit construction_key() = default;
  };

public:
  platform_identity(
      construction_key, operating_system os, cpu_architecture cpu, uint32_t address_bits, int runtime_major_version,
      const library::library_strategy& strategy
  );

  operating_system os() const noexcept { return os_; }
  cpu_architecture cpu() const noexcept { return cpu_; }
  uint32_t address_bits() const noexcept { return address_bits_; }
  uint64_t address_mask() const noexcept { return address_mask_; }

  // width of a c 'long'; windows keeps it at 32 bits on 64-bit hosts
  uint32_t long_bits() const noexcept { return os_ == operating_system::windows ? 32 : address_bits_; }

  // 0 when the runtime version was not reported or could not be parsed
  int runtime_major_version() const noexcept { return runtime_major_version_; }

  bool is_unix() const noexcept { return is_unix_like(os_); }
  bool is_bsd() const noexcept { return is_bsd_family(os_); }

  // "<cpu>-<os>", or "Darwin" on darwin
  std::string name() const;

  // true if file_name is already a platform library file name (e.g. libfoo.so.3, foo.dll)
  bool matches_library_pattern(std::string_view file_name) const;

  /**
   * @brief map a generic library name to the platform file name
   * @param generic_name short name such as "c" or "ssl"; names that already match the platform
   *        pattern are returned unchanged
   */
  std::string map_library_name(std::string_view generic_name) const;

  /**
   * @brief search directories for a native library
   * @param generic_name short name such as "c"
   * @param search_paths directories, in priority order
   * @return absolute path of the library, or the mapped file name when nothing was found so that
   *         a system loader can run its own search
   */
  std::string locate_library(std::string_view generic_name, const std::vector<std::string>& search_paths) const;

  const library::library_strategy& strategy() const noexcept { return *strategy_; }

private:
  friend core::result<std::shared_ptr<const platform_identity>> resolve_platform(const host_environment& env);

  operating_system os_;
  cpu_architecture cpu_;
  uint32_t address_bits_;
  uint64_t address_mask_;
  int runtime_major_version_;
  std::regex library_pattern_;
  const library::library_strategy* strategy_;
};

/**
 * @brief classify host facts into a platform identity
 * @return the identity, or error_code::unknown_address_width when neither the data model hint
 *         nor the cpu gives a 32 or 64 bit width
 */
core::result<std::shared_ptr<const platform_identity>> resolve_platform(const host_environment& env);

/**
 * @brief process-wide platform identity
 *
 * resolved from detect_host_environment() on first call and cached for the life of the process.
 * concurrent first calls initialize it exactly once.
 * @throws platform_error if the address width cannot be determined
 */
const platform_identity& get_platform();

// regular expression source matched against already-qualified library file names
std::string_view library_pattern_source(operating_system os);

// major version from strings like "6.8.0-generic", "11.0.2" or legacy "1.6.0_20"
std::optional<int> parse_runtime_major_version(std::string_view version);

} // namespace l1bl0c::platform
