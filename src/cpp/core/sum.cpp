#include <hostcall/core/sum.h>
#include <limits>

namespace hostcall::core
{
    SumResult sum(const std::int32_t a, const std::int32_t b)
    {
        // Both operands fit in 32 bits, so their exact sum always fits in 64.
        const std::int64_t exact = static_cast<std::int64_t>(a) + static_cast<std::int64_t>(b);
        if (exact > std::numeric_limits<std::int32_t>::max() || exact < std::numeric_limits<std::int32_t>::min())
            return Overflow{};
        return static_cast<std::int32_t>(exact);
    }

    bool is_overflow(const SumResult& result)
    {
        return std::holds_alternative<Overflow>(result);
    }

    std::int32_t value(const SumResult& result)
    {
        return std::get<std::int32_t>(result);
    }
}
