#pragma once

#include <pybind11/pybind11.h>

namespace hostcall::bindings
{
    // Registers hostcall.core's functions on m. Shared by the extension module
    // and anything embedding an interpreter.
    void bind_core(pybind11::module_& m);
}
