#ifndef RCRT_TESTUTIL_IMAGE_BUILDER_H
#define RCRT_TESTUTIL_IMAGE_BUILDER_H

/*
 * Helpers for assembling synthetic static-PIE images and initial stacks in
 * test memory.
 */

#include <elf.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

#include "rcrt/address_space.h"
#include "rcrt/range_ptr.h"
#include "rcrt/types.h"

namespace rcrt {

/*
 * An image linked at address zero, held in an 8-byte-aligned buffer.
 * Offsets are link-time addresses.
 */
class ImageBuilder {
public:
  explicit ImageBuilder(std::size_t size);

  std::size_t size() const { return _size; }
  uint8_t * bytes();
  std::vector<uint8_t> snapshot() const;

  void put_word(Address offset, uint64_t value);
  uint64_t word(Address offset) const;

  void put_program_headers(Address offset, std::initializer_list<Elf64_Phdr>);
  void put_dynamic(Address offset, std::initializer_list<Elf64_Dyn>);
  void put_rela(Address offset, std::initializer_list<Elf64_Rela>);
  void put_rel(Address offset, std::initializer_list<Elf64_Rel>);

  /*
   * A Window onto the image as though loaded at 'runtime_base'.
   */
  Window loaded_at(Address runtime_base);

  /*
   * Registers the image with the fake address space at 'runtime_base'.
   */
  void load_at(Address runtime_base);

private:
  std::size_t _size;
  std::vector<uint64_t> _storage;

  void put_bytes(Address offset, void const *, std::size_t);
};

Elf64_Phdr program_header(uint32_t type, Address vaddr, uint64_t memsz);
Elf64_Dyn dynamic_entry(int64_t tag, uint64_t value);
Elf64_Rela rela_entry(Address offset, uint32_t type, int64_t addend);
Elf64_Rel rel_entry(Address offset, uint32_t type);

/*
 * Builds an initial stack image: argc, argv, envp and auxv in the layout the
 * OS uses.  The strings are not copied; they must outlive the stack.
 */
class StackBuilder {
public:
  StackBuilder & arg(char const *);
  StackBuilder & env(char const *);
  StackBuilder & aux(uintptr_t tag, uintptr_t value);

  /*
   * Lays out the words.  With 'terminate_auxv' false the AT_NULL entry is
   * left off, for testing truncated images.
   */
  std::vector<uintptr_t> build(bool terminate_auxv = true) const;

private:
  std::vector<char const *> _args;
  std::vector<char const *> _envs;
  std::vector<uintptr_t> _aux;
};

inline RangePtr<uintptr_t> range_of(std::vector<uintptr_t> & words) {
  return RangePtr<uintptr_t>{words.data(), words.size()};
}

}  // namespace rcrt

#endif  // RCRT_TESTUTIL_IMAGE_BUILDER_H
