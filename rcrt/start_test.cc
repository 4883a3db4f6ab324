#include <gtest/gtest.h>

#include <elf.h>

#include <string>
#include <vector>

#include "rcrt/arch.h"
#include "rcrt/start.h"

#include "rcrt/testutil/address_space_fake.h"
#include "rcrt/testutil/image_builder.h"
#include "rcrt/testutil/panic_fake.h"

namespace rcrt {

static constexpr uint32_t relative = arch::relative_relocation_type;

#if defined(__x86_64__)
static constexpr uint32_t symbolic = R_X86_64_64;
#elif defined(__aarch64__)
static constexpr uint32_t symbolic = R_AARCH64_ABS64;
#else
static constexpr uint32_t symbolic = R_RISCV_64;
#endif

/*
 * What the entry function saw.
 */
static int entry_calls;
static int entry_argc;
static std::vector<std::string> entry_args;
static std::vector<std::string> entry_env;

static void record_entry(int argc, char ** argv, char ** envp) {
  ++entry_calls;
  entry_argc = argc;
  for (int i = 0; i < argc; ++i) entry_args.push_back(argv[i]);
  for (char ** e = envp; *e; ++e) entry_env.push_back(*e);
}

class StartTest : public ::testing::Test {
protected:
  static constexpr Address runtime_base = 0x7f0000000000;

  // Link-time layout of the synthetic image.
  static constexpr Address phdr_offset = 0x40;
  static constexpr Address dynamic_offset = 0x200;
  static constexpr Address table_offset = 0x300;
  static constexpr Address target_offset = 0x1000;
  static constexpr std::size_t image_size = 0x2000;

  ImageBuilder _image{image_size};

  void SetUp() override {
    reset_relocation_guard_for_test();
    reset_fake_address_space_for_test();
    entry_calls = 0;
    entry_argc = -1;
    entry_args.clear();
    entry_env.clear();
  }

  void TearDown() override {
    reset_fake_address_space_for_test();
    reset_relocation_guard_for_test();
  }

  /*
   * A well-formed image: PT_PHDR, one PT_LOAD covering everything, and a
   * PT_DYNAMIC naming a one-entry RELA table.
   */
  void build_image() {
    _image.put_program_headers(phdr_offset, {
      program_header(PT_PHDR, phdr_offset, 3 * sizeof(Elf64_Phdr)),
      program_header(PT_LOAD, 0, image_size),
      program_header(PT_DYNAMIC, dynamic_offset, 4 * sizeof(Elf64_Dyn)),
    });
    _image.put_dynamic(dynamic_offset, {
      dynamic_entry(DT_RELA, table_offset),
      dynamic_entry(DT_RELASZ, sizeof(Elf64_Rela)),
      dynamic_entry(DT_RELAENT, sizeof(Elf64_Rela)),
      dynamic_entry(DT_NULL, 0),
    });
    _image.put_rela(table_offset, {
      rela_entry(target_offset, relative, 0x400000),
    });
  }

  StackBuilder stack_for_image(std::size_t phnum = 3) {
    StackBuilder builder;
    builder.arg("prog")
      .aux(AT_PAGESZ, 4096)
      .aux(AT_PHDR, runtime_base + phdr_offset)
      .aux(AT_PHENT, sizeof(Elf64_Phdr))
      .aux(AT_PHNUM, phnum);
    return builder;
  }

  void start_with(std::vector<uintptr_t> & words, Address dynamic = 0) {
    start(range_of(words), dynamic, record_entry);
  }
};

constexpr Address StartTest::runtime_base;
constexpr Address StartTest::phdr_offset;
constexpr Address StartTest::dynamic_offset;
constexpr Address StartTest::table_offset;
constexpr Address StartTest::target_offset;
constexpr std::size_t StartTest::image_size;

TEST_F(StartTest, relocates_then_enters) {
  build_image();
  _image.load_at(runtime_base);
  auto words = stack_for_image().build();

  EXPECT_PANIC(start_with(words), entry_returned);

  ASSERT_EQ(0x7f0000400000u, _image.word(target_offset));

  ASSERT_EQ(1, entry_calls);
  ASSERT_EQ(1, entry_argc);
  ASSERT_EQ(std::vector<std::string>{"prog"}, entry_args);
  ASSERT_TRUE(entry_env.empty());
}

TEST_F(StartTest, records_relocation_count) {
  build_image();
  _image.put_dynamic(dynamic_offset, {
    dynamic_entry(DT_RELA, table_offset),
    dynamic_entry(DT_RELASZ, 2 * sizeof(Elf64_Rela)),
  });
  _image.put_rela(table_offset, {
    rela_entry(target_offset, relative, 0x400000),
    rela_entry(target_offset + 8, symbolic, 0x20),
  });
  _image.load_at(runtime_base);
  auto words = stack_for_image().build();

  ASSERT_EQ(0u, startup_relocation_count().applied);

  EXPECT_PANIC(start_with(words), entry_returned);

  auto count = startup_relocation_count();
  ASSERT_EQ(1u, count.applied);
  ASSERT_EQ(1u, count.skipped);
  ASSERT_EQ(0u, _image.word(target_offset + 8));
}

TEST_F(StartTest, starts_from_raw_stack_pointer) {
  build_image();
  _image.load_at(runtime_base);
  auto words = stack_for_image().build();

  // Only the terminators bound the view here, up to config::max_stack_words.
  EXPECT_PANIC(start(words.data(), 0, record_entry), entry_returned);
  ASSERT_EQ(0x7f0000400000u, _image.word(target_offset));
  ASSERT_EQ(1, entry_argc);
}

TEST_F(StartTest, passes_environment) {
  build_image();
  _image.load_at(runtime_base);
  auto words = stack_for_image().env("PATH=/bin").env("TERM=dumb").build();

  EXPECT_PANIC(start_with(words), entry_returned);

  std::vector<std::string> expected{"PATH=/bin", "TERM=dumb"};
  ASSERT_EQ(expected, entry_env);
}

TEST_F(StartTest, entry_returning_panics) {
  build_image();
  _image.load_at(runtime_base);
  auto words = stack_for_image().build();

  EXPECT_PANIC(start_with(words), entry_returned);
}

TEST_F(StartTest, bad_stack) {
  build_image();
  _image.load_at(runtime_base);
  auto words = stack_for_image().build(false);
  auto before = _image.snapshot();

  EXPECT_PANIC(start_with(words), stack_layout_violation);
  ASSERT_EQ(0, entry_calls);
  ASSERT_EQ(before, _image.snapshot());
}

TEST_F(StartTest, missing_phdr_aux) {
  build_image();
  _image.load_at(runtime_base);
  auto words = StackBuilder{}.arg("prog").aux(AT_PHNUM, 3).build();

  EXPECT_PANIC(start_with(words), stack_layout_violation);
  ASSERT_EQ(0, entry_calls);
}

TEST_F(StartTest, unmapped_program_headers) {
  build_image();
  // Image never registered: the header table can't be reached.
  auto words = stack_for_image().build();

  EXPECT_PANIC(start_with(words), stack_layout_violation);
  ASSERT_EQ(0, entry_calls);
}

TEST_F(StartTest, missing_dynamic_segment) {
  _image.put_program_headers(phdr_offset, {
    program_header(PT_PHDR, phdr_offset, 2 * sizeof(Elf64_Phdr)),
    program_header(PT_LOAD, 0, image_size),
  });
  _image.load_at(runtime_base);
  auto words = stack_for_image(2).build();
  auto before = _image.snapshot();

  EXPECT_PANIC(start_with(words), missing_dynamic_segment);
  ASSERT_EQ(0, entry_calls);
  ASSERT_EQ(before, _image.snapshot());
}

TEST_F(StartTest, both_rel_and_rela) {
  build_image();
  _image.put_dynamic(dynamic_offset, {
    dynamic_entry(DT_RELA, table_offset),
    dynamic_entry(DT_RELASZ, sizeof(Elf64_Rela)),
    dynamic_entry(DT_REL, table_offset),
    dynamic_entry(DT_RELSZ, sizeof(Elf64_Rel)),
    dynamic_entry(DT_NULL, 0),
  });
  // Widen PT_DYNAMIC to hold the extra entry.
  _image.put_program_headers(phdr_offset + 2 * sizeof(Elf64_Phdr), {
    program_header(PT_DYNAMIC, dynamic_offset, 5 * sizeof(Elf64_Dyn)),
  });
  _image.load_at(runtime_base);
  auto words = stack_for_image().build();
  auto before = _image.snapshot();

  EXPECT_PANIC(start_with(words), malformed_dynamic_section);
  ASSERT_EQ(before, _image.snapshot());
}

TEST_F(StartTest, table_size_not_multiple) {
  build_image();
  _image.put_dynamic(dynamic_offset, {
    dynamic_entry(DT_RELA, table_offset),
    dynamic_entry(DT_RELASZ, sizeof(Elf64_Rela) + 1),
  });
  _image.load_at(runtime_base);
  auto words = stack_for_image().build();
  auto before = _image.snapshot();

  EXPECT_PANIC(start_with(words), malformed_dynamic_section);
  ASSERT_EQ(before, _image.snapshot());
}

TEST_F(StartTest, target_outside_image) {
  build_image();
  _image.put_rela(table_offset, {
    rela_entry(image_size + 0x1000, relative, 0x10),
  });
  _image.load_at(runtime_base);
  auto words = stack_for_image().build();
  auto before = _image.snapshot();

  EXPECT_PANIC(start_with(words), relocation_out_of_bounds);
  ASSERT_EQ(before, _image.snapshot());
}

TEST_F(StartTest, target_inside_relocation_table) {
  build_image();
  _image.put_rela(table_offset, {
    rela_entry(table_offset, relative, 0x10),
  });
  _image.load_at(runtime_base);
  auto words = stack_for_image().build();
  auto before = _image.snapshot();

  EXPECT_PANIC(start_with(words), relocation_out_of_bounds);
  ASSERT_EQ(0, entry_calls);
  ASSERT_EQ(before, _image.snapshot());
}

TEST_F(StartTest, refuses_second_relocation) {
  build_image();
  _image.load_at(runtime_base);
  auto words = stack_for_image().build();

  EXPECT_PANIC(start_with(words), entry_returned);
  EXPECT_PANIC(start_with(words), already_relocated);

  ASSERT_EQ(0x7f0000400000u, _image.word(target_offset))
    << "bias must not be applied twice";
  ASSERT_EQ(1, entry_calls);
}

TEST_F(StartTest, bias_from_dynamic_without_phdr) {
  _image.put_program_headers(phdr_offset, {
    program_header(PT_LOAD, 0, image_size),
    program_header(PT_DYNAMIC, dynamic_offset, 4 * sizeof(Elf64_Dyn)),
  });
  _image.put_dynamic(dynamic_offset, {
    dynamic_entry(DT_RELA, table_offset),
    dynamic_entry(DT_RELASZ, sizeof(Elf64_Rela)),
    dynamic_entry(DT_NULL, 0),
  });
  _image.put_rela(table_offset, {
    rela_entry(target_offset, relative, 0x400000),
  });
  _image.load_at(runtime_base);
  auto words = stack_for_image(2).build();

  EXPECT_PANIC(start_with(words, runtime_base + dynamic_offset),
               entry_returned);
  ASSERT_EQ(0x7f0000400000u, _image.word(target_offset));
}

TEST_F(StartTest, no_way_to_find_bias) {
  _image.put_program_headers(phdr_offset, {
    program_header(PT_LOAD, 0, image_size),
    program_header(PT_DYNAMIC, dynamic_offset, 4 * sizeof(Elf64_Dyn)),
  });
  _image.load_at(runtime_base);
  auto words = stack_for_image(2).build();

  EXPECT_PANIC(start_with(words), unknown_load_bias);
  ASSERT_EQ(0, entry_calls);
}

TEST_F(StartTest, compute_load_bias_prefers_phdr) {
  ImageLayout layout{0x200, 0x40, Address(0x40), 0, 0x2000};

  auto bias = compute_load_bias(layout, 0x7f0000000040, 0x1234);
  ASSERT_TRUE(bias);
  ASSERT_EQ(LoadBias(0x7f0000000000), bias.const_ref());
}

TEST_F(StartTest, compute_load_bias_from_dynamic) {
  ImageLayout layout{0x200, 0x40, nothing, 0, 0x2000};

  auto bias = compute_load_bias(layout, 0x7f0000000040, 0x7f0000000200);
  ASSERT_TRUE(bias);
  ASSERT_EQ(LoadBias(0x7f0000000000), bias.const_ref());

  ASSERT_FALSE(compute_load_bias(layout, 0x7f0000000040, 0));
}

TEST_F(StartTest, compute_load_bias_zero) {
  ImageLayout layout{0x200, 0x40, Address(0x40), 0, 0x2000};

  auto bias = compute_load_bias(layout, 0x40, 0);
  ASSERT_TRUE(bias);
  ASSERT_EQ(0, bias.const_ref()) << "loaded where linked";
}

TEST_F(StartTest, relocate_standalone) {
  build_image();
  auto image = _image.loaded_at(runtime_base);

  auto count = relocate(image, runtime_base + dynamic_offset,
                        4 * sizeof(Elf64_Dyn), LoadBias(runtime_base));
  ASSERT_EQ(1u, count.applied);
  ASSERT_EQ(0u, count.skipped);
  ASSERT_EQ(0x7f0000400000u, _image.word(target_offset));
}

TEST_F(StartTest, relocate_standalone_faults) {
  build_image();
  auto image = _image.loaded_at(runtime_base);

  EXPECT_PANIC(relocate(image, runtime_base + image_size,
                        4 * sizeof(Elf64_Dyn), LoadBias(runtime_base)),
               missing_dynamic_segment);

  _image.put_dynamic(dynamic_offset, {dynamic_entry(DT_NULL, 0)});
  EXPECT_PANIC(relocate(image, runtime_base + dynamic_offset,
                        4 * sizeof(Elf64_Dyn), LoadBias(runtime_base)),
               malformed_dynamic_section);
}

}  // namespace rcrt

int main(int argc, char * argv[]) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
