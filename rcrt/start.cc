#include "rcrt/start.h"

#include "rcrt/config.h"
#include "rcrt/dynamic.h"
#include "rcrt/panic.h"

namespace rcrt {

/*
 * Set once the image has been relocated.  A bool holds no address, so it is
 * safe to read before relocation.
 */
static bool relocated = false;

/*
 * What the startup relocation pass did, for inspection after the fact.
 */
static RelocationCount startup_count{0, 0};

void reset_relocation_guard_for_test() {
  relocated = false;
  startup_count = RelocationCount{0, 0};
}

RelocationCount startup_relocation_count() {
  return startup_count;
}

Maybe<LoadBias> compute_load_bias(ImageLayout const & layout,
                                  Address runtime_phdr,
                                  Address runtime_dynamic) {
  if (layout.phdr_vaddr) {
    return LoadBias(runtime_phdr - layout.phdr_vaddr.const_ref());
  }
  if (runtime_dynamic) {
    return LoadBias(runtime_dynamic - layout.dynamic_vaddr);
  }
  return nothing;
}

RelocationCount relocate(Window const & image,
                         Address dynamic,
                         std::size_t dynamic_size,
                         LoadBias bias) {
  auto maybe_dynamic = image.sub(dynamic, dynamic_size);
  ALWAYS_PANIC_UNLESS(maybe_dynamic, missing_dynamic_segment,
                      "dynamic section outside image");

  auto table = interpret_dynamic_section(maybe_dynamic.const_ref(), bias);
  ALWAYS_PANIC_UNLESS(table, malformed_dynamic_section,
                      "bad relocation tags");

  auto count = apply_relocations(image, table.const_ref(), bias);
  ALWAYS_PANIC_UNLESS(count, relocation_out_of_bounds,
                      "relocation outside image");

  return count.const_ref();
}

/*
 * Finds the image through the aux vector, and relocates it.
 */
static void relocate_self(RangePtr<uintptr_t> auxv, Address dynamic) {
  ALWAYS_PANIC_IF(relocated, already_relocated, "relocating twice");

  auto where = find_program_headers(auxv);
  ALWAYS_PANIC_UNLESS(where, stack_layout_violation,
                      "no program headers in aux vector");
  auto const & ph = where.const_ref();

  // The header count comes from the OS, but don't let it overflow.
  ALWAYS_PANIC_IF(ph.count > SIZE_MAX / ph.entry_size,
                  stack_layout_violation, "absurd program header count");
  auto table = map_window(ph.address, ph.entry_size * ph.count);
  ALWAYS_PANIC_UNLESS(table, stack_layout_violation,
                      "program headers unaddressable");

  auto layout = scan_program_headers(table.const_ref(), ph.entry_size,
                                     ph.count);
  ALWAYS_PANIC_UNLESS(layout, missing_dynamic_segment, "no PT_DYNAMIC");
  auto const & l = layout.const_ref();

  auto maybe_bias = compute_load_bias(l, ph.address, dynamic);
  ALWAYS_PANIC_UNLESS(maybe_bias, unknown_load_bias,
                      "no PT_PHDR and no _DYNAMIC");
  auto bias = maybe_bias.const_ref();

  auto image = map_window(rebase(l.load_begin, bias),
                          l.load_end - l.load_begin);
  ALWAYS_PANIC_UNLESS(image, relocation_out_of_bounds,
                      "image unaddressable");

  relocated = true;
  startup_count = relocate(image.const_ref(), rebase(l.dynamic_vaddr, bias),
                           l.dynamic_size, bias);
}

void start(RangePtr<uintptr_t> stack, Address dynamic, EntryFunction entry) {
  auto maybe_stack = decode_initial_stack(stack);
  ALWAYS_PANIC_UNLESS(maybe_stack, stack_layout_violation,
                      "bad initial stack");
  auto const & s = maybe_stack.const_ref();

  relocate_self(s.auxv, dynamic);

  // Globals are now safe to use.
  entry(s.argc, s.argv, s.envp);

  PANIC(entry_returned, "entry function returned");
}

void start(uintptr_t * sp, Address dynamic, EntryFunction entry) {
  // The stack image has no recorded end.  Decoding stops at its terminators;
  // this bound only keeps the view from wrapping the address space.
  auto room = (UINTPTR_MAX - reinterpret_cast<uintptr_t>(sp))
            / sizeof(uintptr_t);
  auto words = room < config::max_stack_words ? room
                                              : config::max_stack_words;
  start(RangePtr<uintptr_t>{sp, words}, dynamic, entry);
}

}  // namespace rcrt
