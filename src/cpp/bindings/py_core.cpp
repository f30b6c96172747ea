#include <pybind11/pybind11.h>
#include <hostcall/bindings/core.h>

namespace py = pybind11;

PYBIND11_MODULE(_hostcall_core, m) {
    m.doc() = "Bindings for hostcall.core's C++ source.";
    m.attr("__version__") = HOSTCALL_VERSION_INFO;
    hostcall::bindings::bind_core(m);
}
