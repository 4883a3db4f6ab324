#ifndef RCRT_ARCH_H
#define RCRT_ARCH_H

/*
 * Per-architecture facts used by the relocation engine.  The entry sequence
 * for each architecture lives with the startup macro, in rcrt/startup.h.
 */

#include <elf.h>
#include <cstdint>

namespace rcrt {
namespace arch {

#if defined(__x86_64__)
  static constexpr uint32_t relative_relocation_type = R_X86_64_RELATIVE;
#elif defined(__aarch64__)
  static constexpr uint32_t relative_relocation_type = R_AARCH64_RELATIVE;
#elif defined(__riscv) && __riscv_xlen == 64
  static constexpr uint32_t relative_relocation_type = R_RISCV_RELATIVE;
#else
  #error "rcrt does not know the relative relocation type for this target"
#endif

}  // namespace arch
}  // namespace rcrt

#endif  // RCRT_ARCH_H
