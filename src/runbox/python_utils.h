#ifndef PYTHON_UTILS_H_
#define PYTHON_UTILS_H_

#include <string>

#include <pybind11/pybind11.h>
#include <nlohmann/json.hpp>
#include <runbox/environment.h>

namespace py = pybind11;

py::object JsonToPython(const nlohmann::json&);

// UTF-8 bytes of a str object; unencodable code points (lone surrogates) are replaced
std::string Utf8(py::handle str);

// str(exception) of the active error, falling back to the formatted error
std::string ExceptionMessage(const py::error_already_set&);
std::string ExceptionTypeName(const py::error_already_set&);

// EnvironmentMirror for the embedded interpreter: rebuilds os.environ
void MirrorPythonEnvironment(const EnvMap&);
// LockWaiter that releases the GIL while blocked; the caller must hold the GIL
void WaitWithoutGil(std::unique_lock<std::mutex>&);

#endif  // PYTHON_UTILS_H_
