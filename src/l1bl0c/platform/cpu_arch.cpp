#include "l1bl0c/platform/cpu_arch.hpp"

#include <array>
#include <string>

#include "l1bl0c/util/string_utils.hpp"

namespace l1bl0c::platform {

namespace {

constexpr std::array<cpu_architecture, 7> k_known_cpus = {
    cpu_architecture::x86_32,  cpu_architecture::x86_64,  cpu_architecture::ppc32,   cpu_architecture::ppc64,
    cpu_architecture::sparc32, cpu_architecture::sparc64, cpu_architecture::systemz,
};

} // namespace

cpu_architecture classify_cpu(std::string_view raw) {
  std::string value = util::to_lower(util::trim_view(raw));

  if (value == "x86" || value == "i386" || value == "i86pc") {
    return cpu_architecture::x86_32;
  }
  if (value == "x86_64" || value == "amd64") {
    return cpu_architecture::x86_64;
  }
  if (value == "ppc" || value == "powerpc") {
    return cpu_architecture::ppc32;
  }

  // fall back to the canonical names
  for (cpu_architecture cpu : k_known_cpus) {
    if (value == to_string(cpu)) {
      return cpu;
    }
  }
  return cpu_architecture::unknown;
}

uint32_t default_address_bits(cpu_architecture cpu) {
  switch (cpu) {
  case cpu_architecture::x86_32:
  case cpu_architecture::ppc32:
  case cpu_architecture::sparc32:
    return 32;
  case cpu_architecture::x86_64:
  case cpu_architecture::ppc64:
  case cpu_architecture::sparc64:
  case cpu_architecture::systemz:
    return 64;
  case cpu_architecture::unknown:
    break;
  }
  return 0;
}

std::string_view to_string(cpu_architecture cpu) {
  switch (cpu) {
  case cpu_architecture::x86_32:
    return "i386";
  case cpu_architecture::x86_64:
    return "x86_64";
  case cpu_architecture::ppc32:
    return "ppc";
  case cpu_architecture::ppc64:
    return "ppc64";
  case cpu_architecture::sparc32:
    return "sparc";
  case cpu_architecture::sparc64:
    return "sparcv9";
  case cpu_architecture::systemz:
    return "s390x";
  case cpu_architecture::unknown:
    break;
  }
  return "unknown";
}

} // namespace l1bl0c::platform
