#ifndef RCRT_ADDRESS_SPACE_H
#define RCRT_ADDRESS_SPACE_H

/*
 * A Window is a checked view of a range of the process's address space.
 *
 * Everything the startup code reads from or writes to the image -- program
 * headers, the dynamic section, relocation tables, relocation targets -- is
 * located by fields of the image itself, which we cannot trust.  Every such
 * access goes through a Window, which refuses accesses that fall outside its
 * range, wrap around the address space, or are misaligned for their type.
 *
 * A Window distinguishes the *target* address of a byte (what the image's
 * metadata calls it) from the *host* location where that byte can be found.
 * In a running process they are the same.  Under test, a fake address space
 * places images at arbitrary target addresses backed by ordinary buffers.
 */

#include <cstddef>
#include <cstdint>

#include "rcrt/maybe.h"
#include "rcrt/range_ptr.h"
#include "rcrt/types.h"

namespace rcrt {

class Window {
public:
  Window() : _address{0}, _size{0}, _bytes{nullptr} {}

  Window(Address address, std::size_t size, uint8_t * bytes)
    : _address{address}, _size{size}, _bytes{bytes} {}

  Address address() const { return _address; }
  std::size_t size() const { return _size; }

  /*
   * Checks whether 'count' bytes starting at 'address' fall inside this
   * Window.  Phrased to avoid overflow for hostile inputs.
   */
  bool contains(Address address, std::size_t count) const {
    return address >= _address
        && count <= _size
        && address - _address <= _size - count;
  }

  /*
   * Derives a Window onto a sub-range of this one.
   */
  Maybe<Window> sub(Address address, std::size_t count) const {
    if (!contains(address, count)) return nothing;
    return Window{address, count, host(address)};
  }

  /*
   * Reads a T at 'address', if it is in range and naturally aligned.
   */
  template <typename T>
  Maybe<T> load(Address address) const {
    if (!can_access<T>(address, sizeof(T))) return nothing;
    return *reinterpret_cast<T const *>(host(address));
  }

  /*
   * Writes a T at 'address', if it is in range and naturally aligned.
   * Returns true on success.
   */
  template <typename T>
  __attribute__((warn_unused_result))
  bool store(Address address, T value) const {
    if (!can_access<T>(address, sizeof(T))) return false;
    *reinterpret_cast<T *>(host(address)) = value;
    return true;
  }

  /*
   * Views 'count' consecutive Ts starting at 'address' as a RangePtr, if the
   * whole array is in range and the first element is aligned.
   */
  template <typename T>
  Maybe<RangePtr<T const>> array(Address address, std::size_t count) const {
    if (count > _size / sizeof(T)) return nothing;
    if (!can_access<T>(address, count * sizeof(T))) return nothing;
    return RangePtr<T const>{reinterpret_cast<T const *>(host(address)),
                             count};
  }

private:
  Address _address;
  std::size_t _size;
  uint8_t * _bytes;

  uint8_t * host(Address address) const {
    return _bytes + (address - _address);
  }

  template <typename T>
  bool can_access(Address address, std::size_t count) const {
    if (!contains(address, count)) return false;
    if (address & (alignof(T) - 1)) return false;
    return (reinterpret_cast<uintptr_t>(host(address)) & (alignof(T) - 1))
        == 0;
  }
};

/*
 * Produces a Window onto 'size' bytes of the process address space starting
 * at 'address', or nothing if no such range can be addressed.
 *
 * This is the one place where target addresses become host pointers.  Tests
 * replace it; see rcrt/testutil/address_space_fake.h.
 */
Maybe<Window> map_window(Address address, std::size_t size);

}  // namespace rcrt

#endif  // RCRT_ADDRESS_SPACE_H
