#include <hostcall/bindings/core.h>
#include <hostcall/core/hello.h>
#include <hostcall/core/sum.h>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace py = pybind11;

namespace hostcall::bindings
{
    namespace
    {
        // pybind11 translates std::overflow_error into Python's OverflowError.
        std::int32_t checked_sum(const std::int32_t a, const std::int32_t b)
        {
            const core::SumResult result = core::sum(a, b);
            if (const auto* overflow = std::get_if<core::Overflow>(&result))
                throw std::overflow_error(std::string(overflow->message()));
            return core::value(result);
        }
    }

    void bind_core(py::module_& m)
    {
        m.def(
            "sum",
            &checked_sum,
            "Add two 32-bit integers, raising OverflowError if the result does not fit.",
            py::arg("a"),
            py::arg("b")
        );
        m.def(
            "hello",
            &core::hello,
            "Return a greeting from the C++ core package!"
        );
    }
}
