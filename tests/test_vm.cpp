#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstring>
#include <string>
#include <vector>

#include "doctest.h"
#include "story_builder.hpp"
#include "zm/errors.hpp"
#include "zm/zm_api.h"

using zmtest::StoryBuilder;
using zmtest::TestHost;

/*
 * Hand-assembled V3 code. Encodings used below:
 *   long 2OP      0x00-0x7F  (bit 6/5: operand 1/2 is a variable)
 *   short 1OP     0x80-0xAF  (bits 4-5: 0 large, 1 small, 2 variable)
 *   short 0OP     0xB0-0xBF
 *   variable      0xC0-0xFF  followed by a types byte
 * Variable 0x00 is the stack, 0x10 the first global.
 */

static const uint8_t QUIT = 0xBA;

static zm_u16 global(zm::Interpreter &vm, int index)
{
  zm_u16 v = 0;
  REQUIRE(zm_var_read(vm.get(), (zm_u8)(16 + index), &v) == 0);
  return v;
}

TEST_CASE("Signed 16-bit arithmetic wraps")
{
  StoryBuilder b;
  b.code({0xD4, 0x1F, 0x7F, 0xFF, 0x01, 0x10});        // add #7FFF,#01 -> G00
  b.code({0xD5, 0x1F, 0x00, 0x00, 0x01, 0x11});        // sub #0000,#01 -> G01
  b.code({0xD6, 0x0F, 0x01, 0x2C, 0x01, 0x2C, 0x12});  // mul #012C,#012C -> G02
  b.code({0xD7, 0x0F, 0xFF, 0xF9, 0x00, 0x02, 0x13});  // div #FFF9,#0002 -> G03
  b.code({0xD8, 0x0F, 0xFF, 0xF9, 0x00, 0x02, 0x14});  // mod #FFF9,#0002 -> G04
  b.code({0xD7, 0x0F, 0x80, 0x00, 0xFF, 0xFF, 0x15});  // div #8000,#FFFF -> G05
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 0x8000);
  CHECK(global(vm, 1) == 0xFFFF);
  CHECK(global(vm, 2) == (zm_u16)(300 * 300));
  CHECK((zm_i16)global(vm, 3) == -3);
  CHECK((zm_i16)global(vm, 4) == -1);
  CHECK(global(vm, 5) == 0x8000);
}

TEST_CASE("Division by zero is fatal and latched")
{
  StoryBuilder b;
  b.code({0x17, 0x05, 0x00, 0x10});  // div #05,#00 -> G00
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_ERR(DivByZero));
  CHECK(zm_last_error(vm.get()) == ZM_ERR(DivByZero));
  CHECK(vm.step() == ZM_ERR(DivByZero));
  CHECK(zm_pc(vm.get()) == StoryBuilder::kCode + 4);
}

TEST_CASE("Bitwise operations and test")
{
  StoryBuilder b;
  b.code({0xC8, 0x0F, 0xF0, 0x0F, 0x00, 0xFF, 0x10});  // or #F00F,#00FF -> G00
  b.code({0xC9, 0x0F, 0xF0, 0x0F, 0x00, 0xFF, 0x11});  // and #F00F,#00FF -> G01
  b.code({0x8F, 0x00, 0x00, 0x12});                    // not #0000 -> G02
  b.code({0x07, 0x0F, 0x05, 0xC5});                    // test #0F,#05 ?+5
  b.code({0x0D, 0x13, 0x01});                          // store [G03],#01 (skipped)
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 0xF0FF);
  CHECK(global(vm, 1) == 0x000F);
  CHECK(global(vm, 2) == 0xFFFF);
  CHECK(global(vm, 3) == 0);
}

TEST_CASE("Calling packed address 0 yields false without a frame")
{
  StoryBuilder b;
  b.global(0, 5);
  b.code({0xE0, 0x3F, 0x00, 0x00, 0x10});  // call #0000 -> G00
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.step() == ZM_STEP_OK);
  CHECK(zm_frame_depth(vm.get()) == 1);
  CHECK(global(vm, 0) == 0);
  CHECK(vm.run() == ZM_STEP_QUIT);
}

TEST_CASE("Call with arguments and return through the stack")
{
  StoryBuilder b;
  b.code({0xE0, 0x17, 0x00, 0x00, 0x03, 0x04, 0x10});  // call R,#03,#04 -> G00
  b.code({QUIT});
  zm_u16 r = b.routine({0, 0});
  b.code({0x74, 0x01, 0x02, 0x00});  // add L00,L01 -> SP
  b.code({0xB8});                    // ret_popped
  b.set8(StoryBuilder::kCode + 2, (uint8_t)(r >> 8));
  b.set8(StoryBuilder::kCode + 3, (uint8_t)(r & 0xFF));
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.step() == ZM_STEP_OK);
  CHECK(zm_frame_depth(vm.get()) == 2);
  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 7);
  CHECK(zm_frame_depth(vm.get()) == 1);
  CHECK(zm_stack_depth(vm.get()) == 0);
}

TEST_CASE("Branch offsets 0 and 1 return from the routine")
{
  StoryBuilder b;
  b.code({0xE0, 0x1F, 0x00, 0x00, 0x05, 0x10});  // call R,#05 -> G00
  b.code({0xE0, 0x1F, 0x00, 0x00, 0x06, 0x11});  // call R,#06 -> G01
  b.code({QUIT});
  zm_u16 r = b.routine({0});
  b.code({0x41, 0x01, 0x05, 0xC1});  // je L00,#05 ?RTRUE
  b.code({0xB1});                    // rfalse
  for (zm_u32 at : {StoryBuilder::kCode + 2, StoryBuilder::kCode + 8})
  {
    b.set8(at, (uint8_t)(r >> 8));
    b.set8(at + 1, (uint8_t)(r & 0xFF));
  }
  b.global(1, 0xAAAA);
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 1);
  CHECK(global(vm, 1) == 0);
}

TEST_CASE("jump is relative to the next instruction")
{
  StoryBuilder b;
  b.code({0x8C, 0x00, 0x05});  // jump +5 -> skips the store
  b.code({0x0D, 0x10, 0x01});  // store [G00],#01
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.step() == ZM_STEP_OK);
  CHECK(zm_pc(vm.get()) == StoryBuilder::kCode + 6);
  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 0);
}

TEST_CASE("inc_chk and dec_chk compare signed")
{
  StoryBuilder b;
  b.global(0, 0xFFFF);  // -1
  b.code({0x05, 0x10, 0x00, 0xC5});  // inc_chk [G00],#00 ?+5 (0 > 0 is false)
  b.code({0x0D, 0x11, 0x01});        // store [G01],#01
  b.code({0x04, 0x10, 0x00, 0xC5});  // dec_chk [G00],#00 ?+5 (-1 < 0)
  b.code({0x0D, 0x12, 0x01});        // store [G02],#01 (skipped)
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 0xFFFF);
  CHECK(global(vm, 1) == 1);
  CHECK(global(vm, 2) == 0);
}

TEST_CASE("Indirect variable operations on the stack")
{
  StoryBuilder b;
  b.code({0xE8, 0x7F, 0x0A});        // push #0A
  b.code({0x95, 0x00});              // inc [SP]
  b.code({0x9E, 0x00, 0x10});        // load [SP] -> G00
  b.code({0x0D, 0x00, 0x63});        // store [SP],#63
  b.code({0xE9, 0x7F, 0x11});        // pull [G01]
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);
  Machine *m = vm.get();

  CHECK(vm.step() == 0);
  CHECK(zm_stack_depth(m) == 1);
  CHECK(vm.step() == 0);  // inc pops and pushes
  CHECK(zm_stack_depth(m) == 1);
  CHECK(vm.step() == 0);  // load peeks
  CHECK(zm_stack_depth(m) == 1);
  CHECK(global(vm, 0) == 11);
  CHECK(vm.step() == 0);  // store replaces in place
  CHECK(zm_stack_depth(m) == 1);
  CHECK(vm.step() == 0);
  CHECK(zm_stack_depth(m) == 0);
  CHECK(global(vm, 1) == 0x63);
}

TEST_CASE("Loads and stores through tables")
{
  StoryBuilder b;
  b.code({0xE1, 0x13, 0x04, 0xE0, 0x02, 0x12, 0x34});  // storew #04E0,#02,#1234
  b.code({0xE2, 0x17, 0x04, 0xE0, 0x01, 0x56});        // storeb #04E0,#01,#56
  b.code({0xCF, 0x1F, 0x04, 0xE0, 0x02, 0x10});        // loadw #04E0,#02 -> G00
  b.code({0xD0, 0x1F, 0x04, 0xE0, 0x01, 0x11});        // loadb #04E0,#01 -> G01
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 0x1234);
  CHECK(global(vm, 1) == 0x56);
  zm_u16 w = 0;
  CHECK(zm_mem_read16(vm.get(), StoryBuilder::kScratch + 4u, &w) == 0);
  CHECK(w == 0x1234);
}

TEST_CASE("Writing static memory from code is fatal")
{
  StoryBuilder b;
  b.code({0xE2, 0x17, 0x06, 0x00, 0x00, 0x01});  // storeb #0600,#00,#01
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_ERR(ReadOnly));
}

TEST_CASE("Too few operands is a decode error")
{
  StoryBuilder b;
  b.code({0xE1, 0x1F, 0x04, 0xE0, 0x02});  // storew with two operands
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_ERR(DecodeError));
}

TEST_CASE("insert_obj then get_child and get_parent")
{
  StoryBuilder b;
  b.add_object("one");
  b.add_object("two");
  b.link(1, 0, 0, 2);
  b.link(2, 1, 0, 0);
  b.code({0x0E, 0x01, 0x02});        // insert_obj #01,#02
  b.code({0x92, 0x02, 0x10, 0xC2});  // get_child #02 -> G00 ?+2
  b.code({0x93, 0x01, 0x11});        // get_parent #01 -> G01
  b.code({0x06, 0x01, 0x02, 0xC5});  // jin #01,#02 ?+5
  b.code({0x0D, 0x12, 0x01});        // store [G02],#01 (skipped)
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 1);
  CHECK(global(vm, 1) == 2);
  CHECK(global(vm, 2) == 0);
}

TEST_CASE("Text output opcodes")
{
  StoryBuilder b;
  b.add_object("brass lantern");
  b.code({0xB2});  // print
  b.text("Hello");
  b.code({0xBB});                    // new_line
  b.code({0xE6, 0x3F, 0xFF, 0xFB});  // print_num #FFFB
  b.code({0xE5, 0x7F, 0x41});        // print_char #41
  b.code({0xBB});                    // new_line
  b.code({0x9A, 0x01});              // print_obj #01
  b.code({0xB2});
  b.text("!");
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(host.out == "Hello\n-5A\nbrass lantern!");
}

TEST_CASE("print_paddr and print_ret")
{
  const zm_u16 packed = StoryBuilder::kStrings / 2;
  StoryBuilder b;
  b.put_string(StoryBuilder::kStrings, "packed");
  b.code({0xE0, 0x3F, 0x00, 0x00, 0x00});  // call R -> SP
  b.code({0x8D, (uint8_t)(packed >> 8), (uint8_t)(packed & 0xFF)});  // print_paddr
  b.code({QUIT});
  zm_u16 r = b.routine({});
  b.code({0xB3});  // print_ret
  b.text("done");
  b.set8(StoryBuilder::kCode + 2, (uint8_t)(r >> 8));
  b.set8(StoryBuilder::kCode + 3, (uint8_t)(r & 0xFF));
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(host.out == "done\npacked");
  zm_u16 v = 0;
  CHECK(zm_var_read(vm.get(), 0, &v) == 0);
  CHECK(v == 1);
}

TEST_CASE("Output stream 3 captures text into a table")
{
  StoryBuilder b;
  b.code({0xF3, 0x4F, 0x03, 0x04, 0xE0});  // output_stream #03,#04E0
  b.code({0xB2});
  b.text("abc");
  b.code({0xF3, 0x3F, 0xFF, 0xFD});  // output_stream #FFFD
  b.code({0xB2});
  b.text("x");
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(host.out == "x");

  zm_u16 count = 0;
  zm_u8 c = 0;
  CHECK(zm_mem_read16(vm.get(), StoryBuilder::kScratch, &count) == 0);
  CHECK(count == 3);
  CHECK(zm_mem_read8(vm.get(), StoryBuilder::kScratch + 2u, &c) == 0);
  CHECK(c == 'a');
  CHECK(zm_mem_read8(vm.get(), StoryBuilder::kScratch + 4u, &c) == 0);
  CHECK(c == 'c');
}

TEST_CASE("Nested stream 3 tables keep their own counts")
{
  StoryBuilder b;
  b.code({0xF3, 0x4F, 0x03, 0x04, 0xE0});  // output_stream #03,#04E0
  b.code({0xE5, 0x7F, 0x61});              // print_char 'a'
  b.code({0xF3, 0x4F, 0x03, 0x05, 0x00});  // output_stream #03,#0500
  b.code({0xE5, 0x7F, 0x62});              // print_char 'b'
  b.code({0xE5, 0x7F, 0x63});              // print_char 'c'
  b.code({0xF3, 0x3F, 0xFF, 0xFD});        // output_stream #FFFD
  b.code({0xF3, 0x3F, 0xFF, 0xFD});        // output_stream #FFFD
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  zm_u16 outer = 0, inner = 0;
  CHECK(zm_mem_read16(vm.get(), 0x4E0, &outer) == 0);
  CHECK(zm_mem_read16(vm.get(), 0x500, &inner) == 0);
  CHECK(outer == 1);
  CHECK(inner == 2);
  CHECK(host.out.empty());
}

TEST_CASE("Transcript and screen streams")
{
  StoryBuilder b;
  b.code({0xF3, 0x7F, 0x02});        // output_stream #02
  b.code({0xF3, 0x3F, 0xFF, 0xFF});  // output_stream #FFFF (screen off)
  b.code({0xE5, 0x7F, 0x41});        // print_char 'A'
  b.code({0xF3, 0x7F, 0x01});        // output_stream #01
  b.code({0xF3, 0x3F, 0xFF, 0xFE});  // output_stream #FFFE
  b.code({0xE5, 0x7F, 0x42});        // print_char 'B'
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(host.out == "B");
  CHECK(host.transcript == "A");
}

TEST_CASE("Random in the sequential mode")
{
  StoryBuilder b;
  b.code({0xE7, 0x3F, 0xFF, 0xFD, 0x10});  // random #FFFD -> G00
  b.code({0xE7, 0x7F, 0x0A, 0x11});        // random #0A -> G01
  b.code({0xE7, 0x7F, 0x0A, 0x12});        // random #0A -> G02
  b.code({0xE7, 0x7F, 0x0A, 0x13});        // random #0A -> G03
  b.code({0xE7, 0x7F, 0x0A, 0x14});        // random #0A -> G04
  b.code({QUIT});
  b.global(0, 0xAAAA);
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 0);
  CHECK(global(vm, 1) == 1);
  CHECK(global(vm, 2) == 2);
  CHECK(global(vm, 3) == 3);
  CHECK(global(vm, 4) == 1);
}

TEST_CASE("Same config seed, same random values")
{
  std::vector<zm_u16> seen[2];
  for (int run = 0; run < 2; run++)
  {
    StoryBuilder b;
    for (int i = 0; i < 4; i++)
      b.code({0xE7, 0x3F, 0x7F, 0xFF, (uint8_t)(0x10 + i)});  // random #7FFF -> Gi
    b.code({QUIT});
    TestHost host;
    zm::Interpreter vm;
    REQUIRE(zmtest::boot(b, host, &vm, 4242) == 0);
    CHECK(vm.run() == ZM_STEP_QUIT);
    for (int i = 0; i < 4; i++)
      seen[run].push_back(global(vm, i));
  }
  CHECK(seen[0] == seen[1]);
}

TEST_CASE("sread suspends until a line arrives")
{
  StoryBuilder b;
  b.add_object("West of House");
  b.dictionary(".", {"open", "mailbox"});
  b.global(0, 1);
  b.global(1, 3);
  b.global(2, 7);
  b.set8(StoryBuilder::kScratch, 40);
  b.set8(StoryBuilder::kScratch + 0x40, 4);
  b.code({0xE4, 0x0F, 0x04, 0xE0, 0x05, 0x20});  // sread #04E0,#0520
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_INPUT);
  CHECK(zm_pc(vm.get()) == StoryBuilder::kCode);
  CHECK(vm.run() == ZM_STEP_INPUT);
  CHECK(host.status_calls == 1);
  CHECK(host.status == "West of House|3|7|score");

  host.lines.push_back("Open Mailbox");
  CHECK(vm.run() == ZM_STEP_QUIT);

  zm_u8 c = 0;
  CHECK(zm_mem_read8(vm.get(), StoryBuilder::kScratch + 1u, &c) == 0);
  CHECK(c == 'o');
  CHECK(zm_mem_read8(vm.get(), StoryBuilder::kScratch + 0x41u, &c) == 0);
  CHECK(c == 2);
  zm_u16 entry = 0;
  CHECK(zm_mem_read16(vm.get(), StoryBuilder::kScratch + 0x46u, &entry) == 0);
  CHECK(entry == b.dict_entry("mailbox"));
}

TEST_CASE("sread turns tabs into spaces")
{
  StoryBuilder b;
  b.dictionary(".", {"open", "mailbox"});
  b.set8(StoryBuilder::kScratch, 40);
  b.set8(StoryBuilder::kScratch + 0x40, 4);
  b.code({0xE4, 0x0F, 0x04, 0xE0, 0x05, 0x20});  // sread #04E0,#0520
  b.code({QUIT});
  TestHost host;
  host.lines.push_back("open\tmailbox");
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  zm_u8 c = 0;
  CHECK(zm_mem_read8(vm.get(), StoryBuilder::kScratch + 5u, &c) == 0);
  CHECK(c == ' ');
  CHECK(zm_mem_read8(vm.get(), StoryBuilder::kScratch + 0x41u, &c) == 0);
  CHECK(c == 2);
  zm_u16 entry = 0;
  CHECK(zm_mem_read16(vm.get(), StoryBuilder::kScratch + 0x42u, &entry) == 0);
  CHECK(entry == b.dict_entry("open"));
}

TEST_CASE("Branch on false jumps only when the condition fails")
{
  StoryBuilder b;
  b.code({0x01, 0x01, 0x02, 0x45});  // je #01,#02 ?~+5 (taken)
  b.code({0x0D, 0x10, 0x01});        // store [G00],#01 (skipped)
  b.code({0x01, 0x01, 0x01, 0x45});  // je #01,#01 ?~+5 (falls through)
  b.code({0x0D, 0x11, 0x01});        // store [G01],#01
  zm_u32 calls = b.code_cursor();
  b.code({0xE0, 0x1F, 0x00, 0x00, 0x01, 0x12});  // call F,#01 -> G02
  b.code({0xE0, 0x1F, 0x00, 0x00, 0x02, 0x13});  // call F,#02 -> G03
  b.code({0xE0, 0x1F, 0x00, 0x00, 0x01, 0x14});  // call T,#01 -> G04
  b.code({0xE0, 0x1F, 0x00, 0x00, 0x02, 0x15});  // call T,#02 -> G05
  b.code({QUIT});
  zm_u16 f = b.routine({0});
  b.code({0x41, 0x01, 0x01, 0x40});  // je L00,#01 ?~RFALSE
  b.code({0x9B, 0x07});              // ret #07
  zm_u16 t = b.routine({0});
  b.code({0x41, 0x01, 0x01, 0x41});  // je L00,#01 ?~RTRUE
  b.code({0x9B, 0x07});              // ret #07
  zm_u16 targets[4] = {f, f, t, t};
  for (int i = 0; i < 4; i++)
  {
    b.set8(calls + 6u * i + 2, (uint8_t)(targets[i] >> 8));
    b.set8(calls + 6u * i + 3, (uint8_t)(targets[i] & 0xFF));
  }
  for (int i = 2; i < 6; i++)
    b.global(i, 0xAAAA);
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 0);
  CHECK(global(vm, 1) == 1);
  CHECK(global(vm, 2) == 7);
  CHECK(global(vm, 3) == 0);
  CHECK(global(vm, 4) == 7);
  CHECK(global(vm, 5) == 1);
}

TEST_CASE("End of input is fatal")
{
  StoryBuilder b;
  b.set8(StoryBuilder::kScratch, 40);
  b.set8(StoryBuilder::kScratch + 0x40, 4);
  b.code({0xE4, 0x0F, 0x04, 0xE0, 0x05, 0x20});
  TestHost host;
  host.eof_when_empty = true;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_ERR(InputClosed));
}

TEST_CASE("Session opcodes")
{
  StoryBuilder b;
  b.code({0xBD, 0xC5});        // verify ?+5
  b.code({0x0D, 0x10, 0x01});  // store [G00],#01 (skipped)
  b.code({0xB5, 0xC5});        // save ?+5 (never taken)
  b.code({0x0D, 0x11, 0x01});  // store [G01],#01
  b.code({0xB7});              // restart
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_ERR(Unsupported));
  CHECK(global(vm, 0) == 0);
  CHECK(global(vm, 1) == 1);
}

TEST_CASE("verify fails once the checksum disagrees")
{
  StoryBuilder b;
  b.code({0xBD, 0xC5});        // verify ?+5
  b.code({0x0D, 0x10, 0x01});  // store [G00],#01
  b.code({QUIT});
  b.finish();
  b.set16(0x1C, 0x0001);

  TestHost host;
  ZmConfig cfg;
  memset(&cfg, 0, sizeof(cfg));
  cfg.story = b.bytes().data();
  cfg.story_size = (zm_u32)b.bytes().size();
  cfg.host = host.host();
  cfg.random_seed = 1;
  zm::Interpreter vm;
  REQUIRE(vm.create(cfg) == 0);

  CHECK(vm.run() == ZM_STEP_QUIT);
  CHECK(global(vm, 0) == 1);
}

TEST_CASE("Stack underflow in the main routine")
{
  StoryBuilder b;
  b.code({0xB9});  // pop
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.run() == ZM_ERR(StackUnderflow));
}

TEST_CASE("Trace hook sees each instruction")
{
  StoryBuilder b;
  b.code({0xB4});  // nop
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  std::vector<std::string> lines;
  zm_set_trace(
      vm.get(),
      [](void *user, const char *line) { static_cast<std::vector<std::string> *>(user)->push_back(line); },
      &lines);
  CHECK(vm.run() == ZM_STEP_QUIT);
  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "[00000800] NOP");
  CHECK(lines[1] == "[00000801] QUIT");
}

TEST_CASE("Quit is sticky")
{
  StoryBuilder b;
  b.code({QUIT});
  TestHost host;
  zm::Interpreter vm;
  REQUIRE(zmtest::boot(b, host, &vm) == 0);

  CHECK(vm.step() == ZM_STEP_QUIT);
  CHECK(vm.step() == ZM_STEP_QUIT);
  CHECK(zm_last_error(vm.get()) == 0);
}
