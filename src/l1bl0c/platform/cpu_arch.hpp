#pragma once

#include <cstdint>
#include <string_view>

namespace l1bl0c::platform {

// to_string() yields the canonical names (i386, x86_64, ppc, ppc64, sparc, sparcv9, s390x)
enum class cpu_architecture : uint8_t { x86_32, x86_64, ppc32, ppc64, sparc32, sparc64, systemz, unknown };

/**
 * @brief classify a free-form cpu architecture name
 * @param raw architecture as reported by the host (e.g. "amd64", "x86", "sparcv9")
 * @return the matching architecture, or cpu_architecture::unknown
 */
cpu_architecture classify_cpu(std::string_view raw);

/**
 * @brief native address width implied by an architecture
 * @return 32 or 64, or 0 when the architecture is unknown
 */
uint32_t default_address_bits(cpu_architecture cpu);

std::string_view to_string(cpu_architecture cpu);

} // namespace l1bl0c::platform
