#include <runbox/sanitizer.h>

#include <cmath>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <runbox/invocation.h>
#include "python_utils.h"

namespace {

// The scoped_interpreter keeps sys.modules alive; a type from a module the script never
//   imported cannot appear in its output, so there is no need to import it here.
bool IsInstanceOfLoaded(py::handle obj, const char* module, const char* type) {
  py::dict modules = py::module_::import("sys").attr("modules");
  if (!modules.contains(module)) return false;
  py::object mod = modules[module];
  if (!py::hasattr(mod, type)) return false;
  return py::isinstance(obj, mod.attr(type));
}

nlohmann::json IntToJson(py::handle obj) {
  int overflow = 0;
  long long val = PyLong_AsLongLongAndOverflow(obj.ptr(), &overflow);
  if (val == -1 && PyErr_Occurred()) throw py::error_already_set();
  if (!overflow) return (int64_t)val;
  if (overflow > 0) {
    unsigned long long uval = PyLong_AsUnsignedLongLong(obj.ptr());
    if (!(uval == (unsigned long long)-1 && PyErr_Occurred())) return (uint64_t)uval;
    PyErr_Clear();
  }
  // beyond 64 bits; keep every digit
  return Utf8(py::str(obj));
}

nlohmann::json FloatToJson(py::handle obj) {
  double val = PyFloat_AsDouble(obj.ptr());
  if (val == -1.0 && PyErr_Occurred()) throw py::error_already_set();
  if (!std::isfinite(val)) return nullptr;
  return val;
}

[[noreturn]] void ThrowSerialization(py::handle obj, const std::string& reason) {
  throw InvocationError(ErrorKind::SERIALIZATION,
      fmt::format("Object of type {} is not JSON serializable: {}", Py_TYPE(obj.ptr())->tp_name, reason));
}

std::string StringCoercion(py::handle obj) {
  try {
    return Utf8(py::str(obj));
  } catch (py::error_already_set& err) {
    ThrowSerialization(obj, ExceptionMessage(err));
  }
}

class PathGuard {
  std::vector<PyObject*>& path_;
 public:
  PathGuard(std::vector<PyObject*>& path, py::handle obj) : path_(path) {
    if (std::find(path_.begin(), path_.end(), obj.ptr()) != path_.end()) {
      ThrowSerialization(obj, "Circular reference detected");
    }
    if (path_.size() >= OutputSanitizer::kMaxDepth) {
      ThrowSerialization(obj, "maximum nesting depth exceeded");
    }
    path_.push_back(obj.ptr());
  }
  ~PathGuard() { path_.pop_back(); }
};

} // namespace

std::optional<py::object> SequenceConverter(py::handle obj) {
  if (PyAnySet_Check(obj.ptr())) {
    // sorted when comparable so that the output does not depend on hash order
    try {
      return py::module_::import("builtins").attr("sorted")(obj);
    } catch (py::error_already_set&) {
      return py::list(py::reinterpret_borrow<py::object>(obj));
    }
  }
  if (IsInstanceOfLoaded(obj, "numpy", "ndarray") || IsInstanceOfLoaded(obj, "pandas", "Series")) {
    return obj.attr("tolist")();
  }
  return std::nullopt;
}

OutputSanitizer::OutputSanitizer() {
  converters_.push_back(SequenceConverter);
}

void OutputSanitizer::AddConverter(Converter converter) {
  converters_.push_back(std::move(converter));
}

nlohmann::json OutputSanitizer::Normalize(py::handle value) const {
  std::vector<PyObject*> path;
  try {
    return Normalize_(value, path);
  } catch (py::error_already_set& err) {
    // raised while reading a native value, e.g. a broken int subclass
    ThrowSerialization(value, ExceptionMessage(err));
  }
}

std::string OutputSanitizer::KeyToString_(py::handle key) const {
  // same rules as json.dumps, except that other key types are coerced instead of rejected
  if (py::isinstance<py::str>(key)) return Utf8(key);
  if (key.is_none()) return "null";
  if (PyBool_Check(key.ptr())) return key.ptr() == Py_True ? "true" : "false";
  if (PyLong_Check(key.ptr())) return Utf8(py::str(key));
  if (PyFloat_Check(key.ptr())) {
    double val = PyFloat_AsDouble(key.ptr());
    if (std::isnan(val)) return "NaN";
    if (std::isinf(val)) return val > 0 ? "Infinity" : "-Infinity";
    return Utf8(py::repr(key));
  }
  return StringCoercion(key);
}

nlohmann::json OutputSanitizer::Normalize_(py::handle node, std::vector<PyObject*>& path) const {
  if (node.is_none()) return nullptr;
  if (PyBool_Check(node.ptr())) return node.ptr() == Py_True;
  if (PyLong_Check(node.ptr())) return IntToJson(node);
  if (PyFloat_Check(node.ptr())) return FloatToJson(node);
  if (PyUnicode_Check(node.ptr())) return Utf8(node);
  // Converters and str() run script code that may mutate the container being walked;
  //   iterate over owned snapshots of its items.
  if (PyDict_Check(node.ptr())) {
    PathGuard guard(path, node);
    PyObject* items = PyDict_Items(node.ptr());
    if (!items) throw py::error_already_set();
    py::list snapshot = py::reinterpret_steal<py::list>(items);
    nlohmann::json ret = nlohmann::json::object();
    for (auto item : snapshot) {
      py::tuple pair = py::reinterpret_borrow<py::tuple>(item);
      py::object key = pair[0], value = pair[1];
      std::string key_str = KeyToString_(key);
      ret[key_str] = Normalize_(value, path);
    }
    return ret;
  }
  if (PyList_Check(node.ptr()) || PyTuple_Check(node.ptr())) {
    PathGuard guard(path, node);
    PyObject* items = PySequence_Tuple(node.ptr());
    if (!items) throw py::error_already_set();
    py::tuple snapshot = py::reinterpret_steal<py::tuple>(items);
    nlohmann::json ret = nlohmann::json::array();
    for (auto item : snapshot) ret.push_back(Normalize_(item, path));
    return ret;
  }
  for (auto& converter : converters_) {
    std::optional<py::object> replacement;
    try {
      replacement = converter(node);
    } catch (py::error_already_set& err) {
      spdlog::debug("Converter failed, trying the next one: {}", err.what());
      continue;
    }
    if (replacement) {
      PathGuard guard(path, node);
      return Normalize_(*replacement, path);
    }
  }
  return StringCoercion(node);
}
