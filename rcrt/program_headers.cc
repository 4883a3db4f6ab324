#include "rcrt/program_headers.h"

#include <elf.h>

namespace rcrt {

Maybe<ImageLayout> scan_program_headers(Window const & table,
                                        std::size_t entry_size,
                                        std::size_t count) {
  PANIC_UNLESS(entry_size >= sizeof(Elf64_Phdr), bad_range_access,
               "program header entry too small");

  bool have_dynamic = false;
  bool have_load = false;
  ImageLayout layout{0, 0, nothing, 0, 0};

  for (std::size_t i = 0; i < count; ++i) {
    auto maybe_ph = table.load<Elf64_Phdr>(table.address() + i * entry_size);
    if (!maybe_ph) return nothing;
    auto const & ph = maybe_ph.const_ref();

    switch (ph.p_type) {
      case PT_DYNAMIC:
        // Only the first one counts.
        if (!have_dynamic) {
          layout.dynamic_vaddr = ph.p_vaddr;
          layout.dynamic_size = ph.p_memsz;
          have_dynamic = true;
        }
        break;

      case PT_PHDR:
        layout.phdr_vaddr = Address(ph.p_vaddr);
        break;

      case PT_LOAD:
        {
          Address end = ph.p_vaddr + ph.p_memsz;
          if (end < ph.p_vaddr) return nothing;  // wraps

          if (!have_load || ph.p_vaddr < layout.load_begin) {
            layout.load_begin = ph.p_vaddr;
          }
          if (!have_load || end > layout.load_end) {
            layout.load_end = end;
          }
          have_load = true;
        }
        break;

      default:
        break;
    }
  }

  if (!have_dynamic || !have_load) return nothing;

  // The dynamic section must be part of the loaded image.
  if (layout.dynamic_vaddr < layout.load_begin) return nothing;
  if (layout.dynamic_vaddr > layout.load_end) return nothing;
  if (layout.dynamic_size > layout.load_end - layout.dynamic_vaddr) {
    return nothing;
  }

  return layout;
}

}  // namespace rcrt
