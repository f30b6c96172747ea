#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

namespace hostcall::core
{
    // ----------------------------------------------------------
    //  Overflow-checked addition
    // ----------------------------------------------------------

    struct Overflow
    {
        constexpr static std::string_view MESSAGE = "Integer overflow in sum operation";

        [[nodiscard]] std::string_view message() const { return MESSAGE; }
    };

    // Either the exact sum or the reason there is none.
    using SumResult = std::variant<std::int32_t, Overflow>;

    // Adds a and b over the mathematical integers. Returns Overflow when the
    // exact sum lies outside [INT32_MIN, INT32_MAX]; no wrapped value is ever produced.
    [[nodiscard]] SumResult sum(std::int32_t a, std::int32_t b);

    [[nodiscard]] bool is_overflow(const SumResult& result);
    // Throws std::bad_variant_access on an Overflow result.
    [[nodiscard]] std::int32_t value(const SumResult& result);
}
