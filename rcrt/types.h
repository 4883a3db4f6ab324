#ifndef RCRT_TYPES_H
#define RCRT_TYPES_H

#include <cstdint>

namespace rcrt {

using Address  = std::uintptr_t;  // an address in the target image
using LoadBias = std::intptr_t;   // runtime base minus link-time base
using Word     = std::uint64_t;   // the unit every relocation writes

static_assert(sizeof(Address) == sizeof(Word),
    "only 64-bit targets are supported");

/*
 * Applies a load bias to a link-time address.  Wraps modulo 2^64, like the
 * hardware.
 */
constexpr Address rebase(Address link_address, LoadBias bias) {
  return link_address + Address(bias);
}

}  // namespace rcrt

#endif  // RCRT_TYPES_H
