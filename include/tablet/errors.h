#pragma once

/**
 * @file errors.h
 * @brief Tablet error codes for C
 *
 * C-compatible error code definitions generated from errors.def
 */

#ifdef __cplusplus
extern "C"
{
#endif

  /* Generate error code constants from errors.def */
#define ERR(name, val, msg) static const int TB_ERR_##name = val;
#include "tablet/errors.def"
#undef ERR

#ifdef __cplusplus
}
#endif
