#include "rcrt/address_space.h"

namespace rcrt {

Maybe<Window> map_window(Address address, std::size_t size) {
  // Refuse ranges that wrap past the top of the address space.
  if (address + size < address) return nothing;

  return Window{address, size, reinterpret_cast<uint8_t *>(address)};
}

}  // namespace rcrt
