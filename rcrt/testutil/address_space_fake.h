#ifndef RCRT_TESTUTIL_ADDRESS_SPACE_FAKE_H
#define RCRT_TESTUTIL_ADDRESS_SPACE_FAKE_H

/*
 * A fake process address space for tests.  Instead of treating every target
 * address as a host pointer, map_window serves only the regions registered
 * here, each backed by a test-owned buffer.  This lets a test "load" an image
 * at, say, 0x7f0000000000, and catches any access outside what the test set
 * up.
 */

#include <cstddef>
#include <cstdint>

#include "rcrt/types.h"

namespace rcrt {

/*
 * Makes target addresses [address, address + size) refer to the 'size' bytes
 * at 'bytes'.
 */
void add_fake_region(Address address, uint8_t * bytes, std::size_t size);

/*
 * Forgets all regions.
 */
void reset_fake_address_space_for_test();

}  // namespace rcrt

#endif  // RCRT_TESTUTIL_ADDRESS_SPACE_FAKE_H
