#pragma once
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief VM panic diagnostic information
   *
   * Structure holding diagnostic information when the VM faults.
   * Collected by vm_panic() and used for diagnostic output.
   */
  typedef struct TbPanicInfo
  {
    int32_t error_code; /**< Error code (Err enumeration value) */
    uint32_t pc;        /**< Program Counter of the faulting instruction */
    uint32_t opcode;    /**< Opcode word at PC */
    uint32_t a;         /**< Operand A */
    uint32_t b;         /**< Operand B */
    uint32_t c;         /**< Operand C */
    uint64_t steps;     /**< Instructions executed before the fault */
  } TbPanicInfo;

  // Forward declaration
  struct Vm;

  /**
   * @brief Panic handler callback type
   *
   * Called when the VM encounters a fatal error.
   *
   * @param user_data  User data pointer passed to vm_set_panic_handler
   * @param info       Panic diagnostic information
   */
  typedef void (*TbPanicHandler)(void *user_data, const TbPanicInfo *info);

  /**
   * @brief Set custom panic handler
   *
   * Registers a callback to be invoked when vm_panic() is called.
   * This allows embedders to implement custom error handling/logging.
   *
   * @param vm         VM instance
   * @param handler    Panic handler callback (NULL to disable)
   * @param user_data  User data passed to handler
   */
  void vm_set_panic_handler(struct Vm *vm, TbPanicHandler handler, void *user_data);

  /**
   * @brief Report a fault at the current PC
   *
   * Prints the error, PC and instruction words to stdout, then calls the
   * registered handler.
   *
   * @param vm          VM instance
   * @param error_code  Error code to report
   * @return error_code, for use in return statements
   */
  int vm_panic(struct Vm *vm, int error_code);

#ifdef __cplusplus
}
#endif
