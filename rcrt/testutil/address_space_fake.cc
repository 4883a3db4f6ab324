#include "rcrt/testutil/address_space_fake.h"

#include <vector>

#include "rcrt/address_space.h"

namespace rcrt {

static std::vector<Window> regions;

void add_fake_region(Address address, uint8_t * bytes, std::size_t size) {
  regions.push_back(Window{address, size, bytes});
}

void reset_fake_address_space_for_test() {
  regions.clear();
}

Maybe<Window> map_window(Address address, std::size_t size) {
  if (address + size < address) return nothing;

  for (auto const & region : regions) {
    if (region.contains(address, size)) return region.sub(address, size);
  }
  return nothing;
}

}  // namespace rcrt
