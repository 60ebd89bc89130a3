#pragma once

/**
 * @file errors.h
 * @brief zm error codes for C
 *
 * C-compatible error code definitions generated from errors.def
 */

#ifdef __cplusplus
extern "C"
{
#endif

  /* Generate error code constants from errors.def */
#define ERR(name, val, msg) static const int ZM_ERR_##name = val;
#include "zm/errors.def"
#undef ERR

#ifdef __cplusplus
}
#endif
