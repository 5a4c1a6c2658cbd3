#ifndef INCLUDE_RUNBOX_SANITIZER_H_
#define INCLUDE_RUNBOX_SANITIZER_H_

#include <vector>
#include <optional>
#include <functional>

#include <pybind11/pybind11.h>
#include <nlohmann/json.hpp>

// Converts any Python value into JSON. Nodes that are not JSON-native go through
//   the converters in order; the first one returning a value replaces the node,
//   which is then normalized again. If none applies, the node is coerced with str().
// Normalize throws InvocationError(SERIALIZATION) and nothing else.
class OutputSanitizer {
 public:
  using Converter = std::function<std::optional<pybind11::object>(pybind11::handle)>;

 private:
  std::vector<Converter> converters_;

  nlohmann::json Normalize_(pybind11::handle, std::vector<PyObject*>& path) const;
  std::string KeyToString_(pybind11::handle) const;

 public:
  static constexpr size_t kMaxDepth = 1000;

  OutputSanitizer(); // with the set/array converter installed
  void AddConverter(Converter);
  nlohmann::json Normalize(pybind11::handle) const;
};

// set, frozenset, numpy.ndarray, pandas.Series -> list
std::optional<pybind11::object> SequenceConverter(pybind11::handle);

#endif  // INCLUDE_RUNBOX_SANITIZER_H_
