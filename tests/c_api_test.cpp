#include <hostcall/capi/hostcall.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <limits>
#include <string_view>

// NOLINTNEXTLINE
TEST(CApiTestSuite, SumWritesResult) {
    std::int32_t out = -42;
    ASSERT_EQ(hostcall_sum(2, 3, &out), HOSTCALL_OK);
    EXPECT_EQ(out, 5);

    ASSERT_EQ(hostcall_sum(-2147483647, -1, &out), HOSTCALL_OK);
    EXPECT_EQ(out, std::numeric_limits<std::int32_t>::min());
}

// NOLINTNEXTLINE
TEST(CApiTestSuite, OverflowLeavesOutUntouched) {
    std::int32_t out = -42;
    EXPECT_EQ(hostcall_sum(std::numeric_limits<std::int32_t>::max(), 1, &out), HOSTCALL_OVERFLOW);
    EXPECT_EQ(hostcall_sum(std::numeric_limits<std::int32_t>::min(), -1, &out), HOSTCALL_OVERFLOW);
    EXPECT_EQ(out, -42);
}

// NOLINTNEXTLINE
TEST(CApiTestSuite, NullOutIsInvalidArgument) {
    EXPECT_EQ(hostcall_sum(1, 2, nullptr), HOSTCALL_INVALID_ARGUMENT);
}

// NOLINTNEXTLINE
TEST(CApiTestSuite, HelloIsStaticAndTerminated) {
    const char* const greeting = hostcall_hello();
    ASSERT_NE(greeting, nullptr);
    EXPECT_EQ(std::strlen(greeting), 11U);
    EXPECT_STREQ(greeting, "Hello there");
    EXPECT_EQ(hostcall_hello(), greeting);
}

// NOLINTNEXTLINE
TEST(CApiTestSuite, StatusMessages) {
    EXPECT_EQ(std::string_view(hostcall_status_message(HOSTCALL_OVERFLOW)), "Integer overflow in sum operation");
    EXPECT_STREQ(hostcall_status_message(HOSTCALL_OK), "OK");
    EXPECT_STREQ(hostcall_status_message(HOSTCALL_INVALID_ARGUMENT), "Invalid argument");
}
