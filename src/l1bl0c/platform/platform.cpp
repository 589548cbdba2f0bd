#include "l1bl0c/platform/platform.hpp"

#include <charconv>
#include <memory>
#include <utility>

#include <redlog.hpp>

namespace l1bl0c::platform {

namespace {

std::optional<int> leading_number(std::string_view text) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr == text.data()) {
    return std::nullopt;
  }
  return value;
}

uint64_t mask_for_bits(uint32_t bits) { return bits == 32 ? 0xffffffffULL : 0xffffffffffffffffULL; }

} // namespace

platform_identity::platform_identity(
    construction_key, operating_system os, cpu_architecture cpu, uint32_t address_bits, int runtime_major_version,
    const library::library_strategy& strategy
)
    : os_(os), cpu_(cpu), address_bits_(address_bits), address_mask_(mask_for_bits(address_bits)),
      runtime_major_version_(runtime_major_version),
      library_pattern_(std::string(library_pattern_source(os)), std::regex::ECMAScript | std::regex::optimize),
      strategy_(&strategy) {}

std::string platform_identity::name() const {
  if (os_ == operating_system::darwin) {
    return "Darwin";
  }
  return std::string(to_string(cpu_)) + "-" + std::string(to_string(os_));
}

bool platform_identity::matches_library_pattern(std::string_view file_name) const {
  return std::regex_search(file_name.begin(), file_name.end(), library_pattern_);
}

std::string platform_identity::map_library_name(std::string_view generic_name) const {
  return strategy_->map_name(*this, generic_name);
}

std::string platform_identity::locate_library(
    std::string_view generic_name, const std::vector<std::string>& search_paths
) const {
  return strategy_->locate(*this, generic_name, search_paths);
}

std::string_view library_pattern_source(operating_system os) {
  switch (os) {
  case operating_system::windows:
    return ".*\\.dll$";
  case operating_system::darwin:
    return "lib.*\\.(dylib|jnilib)$";
  default:
    break;
  }
  return "lib.*\\.so.*$";
}

std::optional<int> parse_runtime_major_version(std::string_view version) {
  size_t dot = version.find('.');
  auto major = leading_number(version.substr(0, dot));
  if (!major) {
    return std::nullopt;
  }

  // legacy "1.N" scheme reports N as the major version
  if (*major == 1 && dot != std::string_view::npos) {
    std::string_view rest = version.substr(dot + 1);
    if (auto minor = leading_number(rest.substr(0, rest.find('.')))) {
      return minor;
    }
  }
  return major;
}

core::result<std::shared_ptr<const platform_identity>> resolve_platform(const host_environment& env) {
  using result_type = std::shared_ptr<const platform_identity>;
  auto log = redlog::get_logger("l1bl0c.platform");

  operating_system os = classify_os(env.os_name);
  if (os == operating_system::unknown) {
    log.wrn("unknown operating system, using default unix conventions", redlog::field("os_name", env.os_name));
  }

  cpu_architecture cpu = classify_cpu(env.arch);
  if (cpu == cpu_architecture::unknown) {
    log.wrn("unknown cpu architecture", redlog::field("arch", env.arch));
  }

  uint32_t bits = 0;
  if (env.data_model && (*env.data_model == 32 || *env.data_model == 64)) {
    bits = static_cast<uint32_t>(*env.data_model);
  } else {
    if (env.data_model) {
      log.wrn("ignoring invalid data model hint", redlog::field("data_model", *env.data_model));
    }
    bits = default_address_bits(cpu);
  }

  if (bits != 32 && bits != 64) {
    log.err(
        "cannot determine cpu address size", redlog::field("arch", env.arch),
        redlog::field("cpu", std::string(to_string(cpu)))
    );
    return core::error_result<result_type>(
        core::error_code::unknown_address_width, "cannot determine cpu address size for arch '" + env.arch + "'"
    );
  }

  int runtime_major = 0;
  if (!env.runtime_version.empty()) {
    if (auto parsed = parse_runtime_major_version(env.runtime_version)) {
      runtime_major = *parsed;
    } else {
      log.wrn("could not parse runtime version", redlog::field("runtime_version", env.runtime_version));
    }
  }

  const library::library_strategy& strategy = library::strategy_for(os);
  auto identity =
      std::make_shared<const platform_identity>(platform_identity::construction_key{}, os, cpu, bits, runtime_major, strategy);

  log.dbg(
      "resolved platform", redlog::field("os", std::string(to_string(os))),
      redlog::field("cpu", std::string(to_string(cpu))), redlog::field("address_bits", bits),
      redlog::field("strategy", std::string(strategy.name)), redlog::field("runtime_major", runtime_major)
  );
  return core::ok_result(std::move(identity));
}

const platform_identity& get_platform() {
  static const std::shared_ptr<const platform_identity> instance = [] {
    auto resolved = resolve_platform(detect_host_environment());
    if (!resolved.ok()) {
      throw platform_error(resolved.status_info);
    }
    return resolved.value;
  }();
  return *instance;
}

} // namespace l1bl0c::platform
