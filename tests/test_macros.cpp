#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdio>
#include <string>
#include <vector>

#include "doctest.h"
#include "tablet/assembler.h"
#include "tablet/opcodes.h"
#include "tablet/vm_api.h"

/* ------------------------------------------------------------------------- */
/* Helpers                                                                   */
/* ------------------------------------------------------------------------- */
static tb_err collect(void *user, tb_u32 addr, tb_u32 word)
{
  (void)addr;
  static_cast<std::vector<tb_u32> *>(user)->push_back(word);
  return 0;
}

static std::vector<tb_u32> assemble(const std::string &src)
{
  std::vector<tb_u32> words;
  TbAsmDiag diag;
  INFO(src);
  REQUIRE(tb_asm_assemble(src.data(), src.size(), collect, &words, &diag) == 0);
  return words;
}

// Words of the statement at address k, after a leading nop when k == 4.
static std::vector<tb_u32> expand_at4(const std::string &line)
{
  std::vector<tb_u32> words = assemble("nop\n" + line);
  return std::vector<tb_u32>(words.begin() + 4, words.end());
}

struct Run
{
  tb_state_t state;
  tb_u32 pc;
};

static Run run(const std::string &src, Vm **keep = nullptr)
{
  VmConfig cfg = vm_default_config();
  Vm *vm = vm_create(&cfg);
  REQUIRE(vm);
  TbAsmDiag diag;
  INFO(src);
  REQUIRE(vm_load_source(vm, src.data(), src.size(), &diag) == 0);
  CHECK(vm_run(vm, 1000) == 0);
  Run r{vm_state(vm), vm_pc(vm)};
  if (keep)
    *keep = vm;
  else
    vm_destroy(vm);
  return r;
}

// Conditional jump to `yes`; halts at `no` (fall through) or `yes` (taken).
static bool taken(const std::string &macro, tb_u32 x, tb_u32 y)
{
  char src[256];
  snprintf(src, sizeof(src),
           "  %s yes x y\n"
           "no: brk\n"
           "yes: brk\n"
           "x: %x\n"
           "y: %x\n",
           macro.c_str(), x, y);
  Vm *vm = nullptr;
  Run r = run(src, &vm);
  CHECK(r.state == TB_STATE_HALTED);

  // Address of `yes` is the word after the first brk
  TbInstr first{};
  tb_u32 size = 0;
  for (tb_u32 a = 0;; a += 4)
  {
    REQUIRE(vm_fetch_instr(vm, a, &first) == 0);
    if (first.op == TB_OP_BRK && first.a == 0)
    {
      size = a;
      break;
    }
  }
  vm_destroy(vm);
  REQUIRE((r.pc == size || r.pc == size + 4));
  return r.pc == size + 4;
}

/* ------------------------------------------------------------------------- */
/* Expansion words                                                           */
/* ------------------------------------------------------------------------- */
TEST_CASE("jmp expansion")
{
  CHECK(expand_at4("jmp 40") == std::vector<tb_u32>{TB_OP_LPC, 0x7, 0, 0x40});
}

TEST_CASE("jez expansion")
{
  CHECK(expand_at4("jez 40 50") == std::vector<tb_u32>{TB_OP_BEQ, 0x7, 0x50, 0x40});
}

TEST_CASE("jeq expansion")
{
  CHECK(expand_at4("jeq 40 50 60") == std::vector<tb_u32>{
                                          TB_OP_SUB, 0xd, 0x50, 0x60,  //
                                          TB_OP_BEQ, 0xb, 0xd, 0x40,   //
                                          TB_OP_NOP, 0, 0, 0,          //
                                      });
}

TEST_CASE("jne expansion")
{
  CHECK(expand_at4("jne 40 50 60") == std::vector<tb_u32>{
                                          TB_OP_SUB, 0x11, 0x50, 0x60,  //
                                          TB_OP_BEQ, 0xb, 0x11, 0x14,   //
                                          TB_OP_LPC, 0xf, 0, 0x40,      //
                                          TB_OP_NOP, 0, 0, 0,           //
                                      });
}

TEST_CASE("jlt expansion")
{
  CHECK(expand_at4("jlt 40 50 60") == std::vector<tb_u32>{
                                          TB_OP_CMP, 0x11, 0x50, 0x60,  //
                                          TB_OP_BEQ, 0xb, 0x11, 0x14,   //
                                          TB_OP_LPC, 0xf, 0, 0x40,      //
                                          TB_OP_NOP, 0, 0, 0,           //
                                      });
}

TEST_CASE("jge expansion")
{
  CHECK(expand_at4("jge 40 50 60") == std::vector<tb_u32>{
                                          TB_OP_CMP, 0xd, 0x50, 0x60,  //
                                          TB_OP_BEQ, 0xb, 0xd, 0x40,   //
                                          TB_OP_NOP, 0, 0, 0,          //
                                      });
}

TEST_CASE("set expansion")
{
  CHECK(expand_at4("set 50 2a") == std::vector<tb_u32>{TB_OP_LEA, 0x50, 0x7, 0x2a});
}

TEST_CASE("cal expansion")
{
  CHECK(expand_at4("cal 40 50") == std::vector<tb_u32>{
                                       TB_OP_LEA, 0x50, 0x7, 0xc,  //
                                       TB_OP_LPC, 0xb, 0, 0x40,    //
                                   });
}

TEST_CASE("labels after a macro account for its full length")
{
  std::vector<tb_u32> words = assemble("jne end 0 0\nend: lpc end");
  REQUIRE(words.size() == 5 * 4);
  CHECK(words[16] == TB_OP_LPC);
  CHECK(words[17] == 0x10);
}

TEST_CASE("macro operands accept labels and relative references")
{
  CHECK(expand_at4("jmp /2") == std::vector<tb_u32>{TB_OP_LPC, 0x7, 0, 0xc});
  CHECK(assemble("set here 1\nhere: nop") ==
        std::vector<tb_u32>{TB_OP_LEA, 4, 3, 1, TB_OP_NOP, 0, 0, 0});
}

/* ------------------------------------------------------------------------- */
/* Runtime behaviour                                                         */
/* ------------------------------------------------------------------------- */
TEST_CASE("jmp skips to its target")
{
  Run r = run("jmp done\nff\ndone: brk");
  CHECK(r.state == TB_STATE_HALTED);
  CHECK(r.pc == 8);
}

TEST_CASE("jez branches only on zero")
{
  const char *fmt = "jez yes val\nno: brk\nyes: brk\nval: %x";
  char src[64];

  snprintf(src, sizeof(src), fmt, 0u);
  CHECK(run(src).pc == 8);

  snprintf(src, sizeof(src), fmt, 5u);
  CHECK(run(src).pc == 4);
}

TEST_CASE("jeq")
{
  CHECK(taken("jeq", 3, 3));
  CHECK_FALSE(taken("jeq", 3, 4));
  CHECK_FALSE(taken("jeq", 0, 0xFFFFFFFFu));
}

TEST_CASE("jne")
{
  CHECK_FALSE(taken("jne", 3, 3));
  CHECK(taken("jne", 3, 4));
  CHECK(taken("jne", 0xFFFFFFFFu, 0));
}

TEST_CASE("jlt is unsigned")
{
  CHECK(taken("jlt", 2, 3));
  CHECK_FALSE(taken("jlt", 3, 3));
  CHECK_FALSE(taken("jlt", 4, 3));
  CHECK(taken("jlt", 0x7FFFFFFFu, 0x80000000u));
}

TEST_CASE("jge is unsigned")
{
  CHECK_FALSE(taken("jge", 2, 3));
  CHECK(taken("jge", 3, 3));
  CHECK(taken("jge", 4, 3));
  CHECK(taken("jge", 0xFFFFFFFFu, 0));
}

TEST_CASE("set stores an immediate")
{
  Vm *vm = nullptr;
  Run r = run("set val 2a\nbrk\nval: 0", &vm);
  CHECK(r.state == TB_STATE_HALTED);
  tb_u32 v = 0;
  REQUIRE(vm_mem_read32(vm, 8, &v) == 0);
  CHECK(v == 0x2a);
  vm_destroy(vm);
}

TEST_CASE("cal and lpc return form a subroutine call")
{
  const char *src =
      "  cal fn ret\n"  // 0
      "  brk\n"         // 8
      "fn:\n"
      "  set val 2a\n"  // c
      "  lpc ret\n"     // 10
      "ret: 0\n"        // 14
      "val: 0\n";       // 18

  Vm *vm = nullptr;
  Run r = run(src, &vm);
  CHECK(r.state == TB_STATE_HALTED);
  CHECK(r.pc == 8);

  tb_u32 v = 0;
  REQUIRE(vm_mem_read32(vm, 0x14, &v) == 0);
  CHECK(v == 8);
  REQUIRE(vm_mem_read32(vm, 0x18, &v) == 0);
  CHECK(v == 0x2a);
  vm_destroy(vm);
}

TEST_CASE("countdown loop built from macros")
{
  const char *src =
      "  set n 5\n"
      "loop:\n"
      "  jez done n\n"
      "  sub n n one\n"
      "  add count count one\n"
      "  jmp loop\n"
      "done: brk\n"
      "n: 0\n"
      "one: 1\n"
      "count: 0\n";

  Vm *vm = nullptr;
  Run r = run(src, &vm);
  CHECK(r.state == TB_STATE_HALTED);

  tb_u32 v = 0;
  REQUIRE(vm_mem_read32(vm, 0x20, &v) == 0);
  CHECK(v == 5);
  vm_destroy(vm);
}
