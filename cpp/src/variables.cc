/// implements data access: var, missing, and missing_some

#include "tracelogic/details/variables.hpp"

// standard headers
#include <charconv>
#include <map>
#include <optional>
#include <string>
#include <string_view>

// 3rd party headers
#include <boost/json.hpp>

// tracelogic headers
#include "tracelogic/logic.hpp"
#include "tracelogic/details/coercion.hpp"
#include "tracelogic/details/cxx-compat.hpp"

namespace tracelogic {

namespace json = boost::json;

namespace {

constexpr char PATH_DELIMITER = '.';

std::optional<std::size_t> to_index(std::string_view segment) {
  std::size_t idx = 0;
  const char* lim = segment.data() + segment.size();
  auto [ptr, err] = std::from_chars(segment.data(), lim, idx);

  if (segment.empty() || (err != std::errc{}) || (ptr != lim)) return std::nullopt;

  return idx;
}

/// resolves a single path segment
const json::value* select(const json::value& container, std::string_view segment) {
  if (const json::object* obj = container.if_object()) {
    CXX_LIKELY;
    return obj->if_contains(segment);
  }

  if (const json::array* arr = container.if_array()) {
    std::optional<std::size_t> idx = to_index(segment);

    if (idx && (*idx < arr->size())) return &(*arr)[*idx];
  }

  return nullptr;
}

std::string path_of(const json::value& path) {
  if (path.is_null()) return {};

  return to_string(path);
}

const json::value* find_path(const json::value& data, const json::value& path) {
  return find_var(data, path_of(path));
}

CXX_NORETURN
void throw_malformed(std::string_view what) {
  throw malformed_rule_error{std::string(what)};
}

//
// context operators

json::value op_var(const json::value& data, const json::array& ops) {
  switch (ops.size()) {
    case 0:
      return data;

    case 1:
      return get_var(data, ops[0]);

    case 2:
      return get_var(data, ops[0], ops[1]);

    default:
      ;
  }

  throw_malformed("var takes a path and an optional default");
}

json::value op_missing(const json::value& data, const json::array& ops) {
  return missing(data, ops);
}

json::value op_missing_some(const json::value& data, const json::array& ops) {
  if (ops.size() != 2) {
    CXX_UNLIKELY;
    throw_malformed("missing_some takes a minimum count and an array of names");
  }

  if (!is_number(ops[0])) {
    CXX_UNLIKELY;
    throw_malformed("missing_some requires a numeric minimum count");
  }

  const json::array* names = ops[1].if_array();

  if (names == nullptr) {
    CXX_UNLIKELY;
    throw_malformed("missing_some requires an array of names");
  }

  return missing_some(data, to_real(ops[0]), *names);
}

using dispatch_table = std::map<std::string_view, context_function>;

}  // namespace

const json::value* find_var(const json::value& data, std::string_view path) {
  const json::value* res = &data;

  if (path.empty()) return res;

  std::size_t start = 0;

  while (res != nullptr) {
    const std::size_t pos = path.find(PATH_DELIMITER, start);

    if (pos == std::string_view::npos) return select(*res, path.substr(start));

    res = select(*res, path.substr(start, pos - start));
    start = pos + 1;
  }

  return res;
}

json::value get_var(const json::value& data, const json::value& path) {
  if (const json::value* res = find_path(data, path)) {
    CXX_LIKELY;
    return *res;
  }

  throw variable_resolution_error{"unknown variable: " + path_of(path)};
}

json::value get_var(const json::value& data, const json::value& path,
                    const json::value& fallback) {
  if (const json::value* res = find_path(data, path)) return *res;

  return fallback;
}

json::array missing(const json::value& data, const json::array& names) {
  const json::array* sel = &names;

  if (!names.empty() && names[0].is_array()) sel = &names[0].get_array();

  json::array res;

  for (const json::value& name : *sel)
    if (find_path(data, name) == nullptr) res.push_back(name);

  return res;
}

json::array missing_some(const json::value& data, double min_required,
                         const json::array& names) {
  json::array res;

  if (min_required < 1) return res;

  std::size_t found = 0;

  for (const json::value& name : names) {
    if (find_path(data, name) == nullptr) {
      res.push_back(name);
    } else if (++found >= min_required) {
      res.clear();
      break;
    }
  }

  return res;
}

context_function find_context_operator(std::string_view name) {
  static const dispatch_table dt = {
      {"var", &op_var},
      {"missing", &op_missing},
      {"missing_some", &op_missing_some},
  };

  dispatch_table::const_iterator pos = dt.find(name);

  if (pos == dt.end()) return nullptr;

  return pos->second;
}

}  // namespace tracelogic
