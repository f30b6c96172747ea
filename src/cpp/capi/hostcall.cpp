#define HOSTCALL_C_API_BUILD 1

#include <hostcall/capi/hostcall.h>
#include <hostcall/core/hello.h>
#include <hostcall/core/sum.h>

namespace
{
    // GREETING is a view over a string literal, so data() is NUL-terminated.
    constexpr const char* greeting = hostcall::core::GREETING.data();
    constexpr const char* overflow_message = hostcall::core::Overflow::MESSAGE.data();
}

/// \brief Plain C entry points over hostcall::core. Nothing here throws.

extern "C"
hostcall_status hostcall_sum(const int32_t a, const int32_t b, int32_t *out) {
    if (out == nullptr) return HOSTCALL_INVALID_ARGUMENT;

    const auto result = hostcall::core::sum(a, b);
    if (const auto* sum = std::get_if<std::int32_t>(&result)) {
        *out = *sum;
        return HOSTCALL_OK;
    }
    return HOSTCALL_OVERFLOW;
}

extern "C"
const char *hostcall_hello(void) {
    return greeting;
}

extern "C"
const char *hostcall_status_message(const hostcall_status status) {
    switch (status) {
    case HOSTCALL_OK:
        return "OK";
    case HOSTCALL_OVERFLOW:
        return overflow_message;
    case HOSTCALL_INVALID_ARGUMENT:
        return "Invalid argument";
    }
    return "Unknown status";
}
