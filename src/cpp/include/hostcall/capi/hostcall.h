#pragma once

#include <stdint.h>

#if defined(_WIN32)
#  if defined(HOSTCALL_C_API_BUILD)
#    define HOSTCALL_C_API_EXPORT __declspec(dllexport)
#  else
#    define HOSTCALL_C_API_EXPORT __declspec(dllimport)
#  endif
#else
#  define HOSTCALL_C_API_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
  HOSTCALL_OK = 0,
  HOSTCALL_OVERFLOW = 1,        // exact sum outside the int32_t range
  HOSTCALL_INVALID_ARGUMENT = 2 // null out-pointer
} hostcall_status;

// On HOSTCALL_OK writes a + b to *out. On any other status *out is left untouched.
HOSTCALL_C_API_EXPORT hostcall_status hostcall_sum(int32_t a, int32_t b, int32_t *out);

// Static NUL-terminated greeting. Owned by the library, never freed by the caller.
HOSTCALL_C_API_EXPORT const char *hostcall_hello(void);

HOSTCALL_C_API_EXPORT const char *hostcall_status_message(hostcall_status status);

#ifdef __cplusplus
}
#endif
