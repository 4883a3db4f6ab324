#include "rcrt/initial_stack.h"

#include <elf.h>
#include <climits>

#include "rcrt/config.h"

namespace rcrt {

/*
 * Finds the index of the first zero word at or after 'start', without
 * leaving 'words'.
 */
static Maybe<std::size_t> find_null(RangePtr<uintptr_t> words,
                                    std::size_t start) {
  for (std::size_t i = start; i < words.count(); ++i) {
    if (words[i] == 0) return i;
  }
  return nothing;
}

Maybe<InitialStack> decode_initial_stack(RangePtr<uintptr_t> words) {
  // argc, then argc pointers and a null, must fit.
  auto n = words.count();
  if (n < 2) return nothing;

  auto argc = words[0];
  if (argc > n - 2 || argc > INT_MAX) return nothing;

  auto argv_index = std::size_t(1);
  auto argv_end = argv_index + argc;
  if (words[argv_end] != 0) return nothing;

  auto envp_index = argv_end + 1;
  auto maybe_envp_end = find_null(words, envp_index);
  if (!maybe_envp_end) return nothing;

  // Aux vector pairs, up to AT_NULL.
  auto auxv_index = maybe_envp_end.const_ref() + 1;
  auto auxv_end = auxv_index;
  for (std::size_t pairs = 0; ; ++pairs) {
    if (pairs == config::max_auxv_entries) return nothing;
    if (auxv_end >= n) return nothing;
    if (words[auxv_end] == AT_NULL) break;
    if (n - auxv_end < 2) return nothing;
    auxv_end += 2;
  }

  return InitialStack{
    int(argc),
    reinterpret_cast<char **>(&words[argv_index]),
    reinterpret_cast<char **>(&words[envp_index]),
    words.slice(auxv_index, auxv_end),
  };
}

Maybe<uintptr_t> find_aux(RangePtr<uintptr_t> auxv, uintptr_t tag) {
  for (std::size_t i = 0; i + 1 < auxv.count(); i += 2) {
    if (auxv[i] == tag) return auxv[i + 1];
  }
  return nothing;
}

Maybe<ProgramHeaderLocation> find_program_headers(RangePtr<uintptr_t> auxv) {
  auto phdr = find_aux(auxv, AT_PHDR);
  auto phnum = find_aux(auxv, AT_PHNUM);
  if (!phdr || !phnum) return nothing;

  auto phent = find_aux(auxv, AT_PHENT);
  std::size_t entry_size = phent ? phent.const_ref() : sizeof(Elf64_Phdr);
  if (entry_size < sizeof(Elf64_Phdr)) return nothing;
  if (entry_size % alignof(Elf64_Phdr)) return nothing;

  return ProgramHeaderLocation{
    phdr.const_ref(),
    entry_size,
    phnum.const_ref(),
  };
}

}  // namespace rcrt
