#pragma once
#include <pybind11/pybind11.h>
#include <agentdispatch/types.hpp>
namespace py = pybind11;

void bind_enums_and_structs(py::module_& m);
void bind_exceptions(py::module_& m);
void bind_core(py::module_& m);
void bind_monitors(py::module_& m);
void bind_routing(py::module_& m);

// JSON values cross the boundary as plain Python objects (dict, list, str, ...)
// through the stdlib json module. Callers must hold the GIL.
inline py::object json_to_py(const agentdispatch::json& value) {
    return py::module_::import("json").attr("loads")(value.dump());
}

inline agentdispatch::json json_from_py(const py::handle& obj) {
    std::string text = py::str(py::module_::import("json").attr("dumps")(obj));
    return agentdispatch::json::parse(text);
}
