#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdint>
#include <string>

#include "doctest.h"
#include "tablet/errors.h"
#include "tablet/errors.hpp"
#include "tablet/opcodes.h"
#include "tablet/panic.hpp"
#include "tablet/vm_api.h"

// Test helper: custom panic handler
static int g_panic_calls = 0;
static TbPanicInfo g_panic_info = {};
static void *g_panic_user_data = nullptr;

static void test_panic_handler(void *user_data, const TbPanicInfo *info)
{
  g_panic_calls++;
  g_panic_user_data = user_data;
  if (info)
  {
    g_panic_info = *info;
  }
}

static void reset_capture()
{
  g_panic_calls = 0;
  g_panic_info = TbPanicInfo{};
  g_panic_user_data = nullptr;
}

static Vm *make_vm(const tb_u32 *image, size_t count)
{
  VmConfig cfg = vm_default_config();
  Vm *vm = vm_create(&cfg);
  REQUIRE(vm);
  REQUIRE(vm_load_image(vm, image, count) == 0);
  return vm;
}

TEST_CASE("Panic handler: division by zero reports the instruction")
{
  reset_capture();
  const tb_u32 image[] = {TB_OP_NOP, 0, 0, 0, TB_OP_DIV, 0x10, 0x11, 0x12};
  Vm *vm = make_vm(image, 8);
  int tag = 0;
  tablet::set_panic_handler(vm, test_panic_handler, &tag);

  CHECK(vm_run(vm, 0) == static_cast<tb_err>(Err::DivByZero));

  CHECK(g_panic_calls == 1);
  CHECK(g_panic_user_data == &tag);
  CHECK(g_panic_info.error_code == static_cast<int32_t>(Err::DivByZero));
  CHECK(g_panic_info.pc == 4);
  CHECK(g_panic_info.opcode == TB_OP_DIV);
  CHECK(g_panic_info.a == 0x10);
  CHECK(g_panic_info.b == 0x11);
  CHECK(g_panic_info.c == 0x12);
  CHECK(g_panic_info.steps == 1);
  vm_destroy(vm);
}

TEST_CASE("Panic handler: unknown opcode")
{
  reset_capture();
  const tb_u32 image[] = {0x11, 1, 2, 3};
  Vm *vm = make_vm(image, 4);
  tablet::set_panic_handler(vm, test_panic_handler);

  CHECK(vm_step(vm) == TB_ERR_UnknownOp);
  CHECK(g_panic_calls == 1);
  CHECK(g_panic_user_data == nullptr);
  CHECK(g_panic_info.opcode == 0x11);
  CHECK(g_panic_info.pc == 0);

  // A faulted VM does not report again
  CHECK(vm_step(vm) == TB_ERR_UnknownOp);
  CHECK(g_panic_calls == 1);
  vm_destroy(vm);
}

TEST_CASE("Panic handler: direct call returns the code")
{
  reset_capture();
  const tb_u32 image[] = {TB_OP_ADD, 4, 5, 6};
  Vm *vm = make_vm(image, 4);
  tablet::set_panic_handler(vm, test_panic_handler);

  CHECK(vm_panic(vm, TB_ERR_IoError) == TB_ERR_IoError);
  CHECK(g_panic_info.error_code == TB_ERR_IoError);
  CHECK(g_panic_info.opcode == TB_OP_ADD);
  vm_destroy(vm);
}

TEST_CASE("Panic handler: cleared handler is not called")
{
  reset_capture();
  const tb_u32 image[] = {TB_OP_MOD, 0, 0, 9};
  Vm *vm = make_vm(image, 4);
  vm_set_panic_handler(vm, test_panic_handler, nullptr);
  vm_set_panic_handler(vm, nullptr, nullptr);

  CHECK(vm_run(vm, 0) == TB_ERR_DivByZero);
  CHECK(g_panic_calls == 0);
  vm_destroy(vm);
}

TEST_CASE("Panic handler: null VM")
{
  CHECK(vm_panic(nullptr, TB_ERR_InvalidArg) == TB_ERR_InvalidArg);
  vm_set_panic_handler(nullptr, test_panic_handler, nullptr);
}

TEST_CASE("Error messages")
{
  CHECK(std::string(err_str(Err::OK)) == "ok");
  CHECK(std::string(err_str(Err::DivByZero)).size() > 0);
  CHECK(std::string(err_str(static_cast<Err>(-999))) == "unknown error");
}
