#pragma once

#include <string>
#include <string_view>

namespace hostcall::core
{
    constexpr std::string_view GREETING = "Hello there";

    // Fixed greeting. Never fails.
    [[nodiscard]] std::string hello();
}
