#include "python_utils.h"

#include <spdlog/spdlog.h>
#include <runbox/invocation.h>

namespace {

// environment entries are bytes; decode them the way os.environ does
py::str FsDecode(const std::string& str) {
  PyObject* obj = PyUnicode_DecodeFSDefaultAndSize(str.data(), (Py_ssize_t)str.size());
  if (!obj) throw py::error_already_set();
  return py::reinterpret_steal<py::str>(obj);
}

} // namespace

py::object JsonToPython(const nlohmann::json& value) {
  using nlohmann::json;
  switch (value.type()) {
    case json::value_t::null: [[fallthrough]];
    case json::value_t::discarded: return py::none();
    case json::value_t::boolean: return py::bool_(value.get<bool>());
    case json::value_t::number_integer: return py::int_(value.get<int64_t>());
    case json::value_t::number_unsigned: return py::int_(value.get<uint64_t>());
    case json::value_t::number_float: return py::float_(value.get<double>());
    case json::value_t::string: return py::str(value.get_ref<const std::string&>());
    case json::value_t::binary: {
      auto& bin = value.get_binary();
      return py::bytes(reinterpret_cast<const char*>(bin.data()), bin.size());
    }
    case json::value_t::array: {
      py::list ret;
      for (auto& i : value) ret.append(JsonToPython(i));
      return std::move(ret);
    }
    case json::value_t::object: {
      py::dict ret;
      for (auto& [key, item] : value.items()) ret[py::str(key)] = JsonToPython(item);
      return std::move(ret);
    }
  }
  __builtin_unreachable();
}

std::string Utf8(py::handle str) {
  PyObject* bytes = PyUnicode_AsEncodedString(str.ptr(), "utf-8", "replace");
  if (!bytes) throw py::error_already_set();
  auto owner = py::reinterpret_steal<py::bytes>(bytes);
  return std::string(PyBytes_AS_STRING(bytes), PyBytes_GET_SIZE(bytes));
}

std::string ExceptionMessage(const py::error_already_set& err) {
  try {
    return Utf8(py::str(err.value()));
  } catch (py::error_already_set& nested) {
    spdlog::debug("str() of exception failed: {}", nested.what());
    return err.what();
  }
}

std::string ExceptionTypeName(const py::error_already_set& err) {
  try {
    return Utf8(err.type().attr("__name__"));
  } catch (py::error_already_set&) {
    return "Exception";
  }
}

void MirrorPythonEnvironment(const EnvMap& env) {
  py::dict values;
  for (auto& [key, value] : env) values[FsDecode(key)] = FsDecode(value);
  py::object environ = py::module_::import("os").attr("environ");
  // os.environ calls unsetenv/putenv on every change, so the process table ends up
  //   equal to env as well
  environ.attr("clear")();
  environ.attr("update")(values);
}

void WaitWithoutGil(std::unique_lock<std::mutex>& lock) {
  // the holder needs the GIL to finish
  py::gil_scoped_release nogil;
  lock.lock();
}
