/// implements the value coercion rules of tracelogic

#include "tracelogic/details/coercion.hpp"

// standard headers
#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

// 3rd party headers
#include <boost/json.hpp>

// tracelogic headers
#include "tracelogic/logic.hpp"
#include "tracelogic/details/cxx-compat.hpp"

namespace tracelogic {

namespace json = boost::json;

namespace {

constexpr double RELATIVE_TOLERANCE = 1e-9;

CXX_NORETURN
void throw_type_error(std::string_view what) {
  throw type_error{std::string("not a number: ").append(what)};
}

std::string_view trim(std::string_view str) {
  const char* ws = " \t\n\r\f\v";
  const std::size_t first = str.find_first_not_of(ws);

  if (first == std::string_view::npos) return {};

  return str.substr(first, str.find_last_not_of(ws) - first + 1);
}

/// strips surrounding whitespace and a leading '+'
std::string_view numeric_text(std::string_view str) {
  str = trim(str);

  if (!str.empty() && str.front() == '+') str.remove_prefix(1);

  return str;
}

/// parses a full string with from_chars; returns nothing on failure
template <class T>
std::optional<T> from_string(std::string_view str) {
  T el{};

  str = numeric_text(str);

  const char* lim = str.data() + str.size();
  auto [ptr, err] = std::from_chars(str.data(), lim, el);

  if ((err != std::errc{}) || (ptr != lim) || str.empty()) {
    CXX_UNLIKELY;
    return std::nullopt;
  }

  return el;
}

/// true if \p str is an optionally signed sequence of digits
bool is_integer_text(std::string_view str) {
  str = numeric_text(str);

  if (!str.empty() && str.front() == '-') str.remove_prefix(1);

  return !str.empty() &&
         std::all_of(str.begin(), str.end(),
                     [](char c) -> bool { return c >= '0' && c <= '9'; });
}

std::string_view to_string_view(const json::string& str) {
  return std::string_view(str.data(), str.size());
}

/// double conversion as used by relational operators
///   returns nothing where the conversion fails.
std::optional<double> real_or_nothing(const json::value& v) {
  switch (v.kind()) {
    case json::kind::int64:
      return double(v.get_int64());

    case json::kind::uint64:
      return double(v.get_uint64());

    case json::kind::double_:
      return v.get_double();

    case json::kind::bool_:
      return v.get_bool() ? 1.0 : 0.0;

    case json::kind::string:
      return from_string<double>(to_string_view(v.get_string()));

    default:
      ;
  }

  return std::nullopt;
}

number to_number_nostrings(const json::value& v) {
  switch (v.kind()) {
    case json::kind::int64:
      return make_number(v.get_int64());

    case json::kind::uint64: {
      const std::uint64_t val = v.get_uint64();

      if (val > std::uint64_t(std::numeric_limits<std::int64_t>::max())) {
        CXX_UNLIKELY;
        return make_number(double(val));
      }

      return make_number(std::int64_t(val));
    }

    case json::kind::double_:
      return make_number(v.get_double());

    case json::kind::bool_:
      return make_number(std::int64_t(v.get_bool()));

    default:
      ;
  }

  throw_type_error(json::serialize(v));
}

bool native_equal(const json::value& lhs, const json::value& rhs);

bool native_equal(const json::array& lhs, const json::array& rhs) {
  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                    [](const json::value& l, const json::value& r) -> bool {
                      return native_equal(l, r);
                    });
}

bool native_equal(const json::object& lhs, const json::object& rhs) {
  if (lhs.size() != rhs.size()) return false;

  for (const json::key_value_pair& el : lhs) {
    const json::value* other = rhs.if_contains(el.key());

    if ((other == nullptr) || !native_equal(el.value(), *other)) return false;
  }

  return true;
}

bool numeric_equal(const number& lhs, const number& rhs) {
  if (lhs.integral && rhs.integral) return lhs.ival == rhs.ival;

  return lhs.real() == rhs.real();
}

/// equality without coercion, except between numeric kinds
bool native_equal(const json::value& lhs, const json::value& rhs) {
  if (is_number(lhs) && is_number(rhs))
    return numeric_equal(to_number_nostrings(lhs), to_number_nostrings(rhs));

  if (lhs.kind() != rhs.kind()) return false;

  switch (lhs.kind()) {
    case json::kind::null:
      return true;

    case json::kind::bool_:
      return lhs.get_bool() == rhs.get_bool();

    case json::kind::string:
      return lhs.get_string() == rhs.get_string();

    case json::kind::array:
      return native_equal(lhs.get_array(), rhs.get_array());

    case json::kind::object:
      return native_equal(lhs.get_object(), rhs.get_object());

    default:
      ;
  }

  return false;
}

bool almost_equal(double lhs, double rhs) {
  return std::fabs(lhs - rhs) <=
         RELATIVE_TOLERANCE * std::max(std::fabs(lhs), std::fabs(rhs));
}

std::string format_real(double val) {
  if (std::isnan(val)) return "NaN";

  if (std::isinf(val)) return val < 0 ? "-Infinity" : "Infinity";

  // integral values print like integers, e.g., 1.0 -> "1"
  if ((std::trunc(val) == val) && (std::fabs(val) < 1e15))
    return std::to_string(std::int64_t(val));

  char buf[64];
  auto [ptr, err] = std::to_chars(buf, buf + sizeof(buf), val);

  if (err != std::errc{}) {
    CXX_UNLIKELY;
    return json::serialize(json::value(val));
  }

  return std::string(buf, ptr);
}

/// chains a binary relation across all operands
template <class binary_predicate_t>
bool chained(const json::array& operands, binary_predicate_t pred) {
  if (operands.size() < 2) {
    CXX_UNLIKELY;
    throw malformed_rule_error{"relational operator requires at least 2 operands"};
  }

  for (std::size_t i = 1; i < operands.size(); ++i)
    if (!pred(operands[i - 1], operands[i])) return false;

  return true;
}

}  // namespace

json::value number::to_json() const {
  if (integral) return ival;

  return rval;
}

number make_number(std::int64_t v) { return {true, v, 0.0}; }
number make_number(double v) { return {false, 0, v}; }

bool is_number(const json::value& v) {
  return v.is_int64() || v.is_uint64() || v.is_double();
}

//
// truthy/falsy

bool truthy(const json::value& el) {
  switch (el.kind()) {
    case json::kind::null:
      return false;

    case json::kind::bool_:
      return el.get_bool();

    case json::kind::int64:
      return el.get_int64() != 0;

    case json::kind::uint64:
      return el.get_uint64() != 0;

    case json::kind::double_: {
      const double val = el.get_double();

      return (val != 0.0) && !std::isnan(val);
    }

    case json::kind::string:
      return !el.get_string().empty();

    case json::kind::array:
      return !el.get_array().empty();

    case json::kind::object:
      return true;
  }

  return true;
}

bool falsy(const json::value& el) { return !truthy(el); }

std::string to_string(const json::value& el) {
  switch (el.kind()) {
    case json::kind::null:
      return "null";

    case json::kind::bool_:
      return el.get_bool() ? "true" : "false";

    case json::kind::int64:
      return std::to_string(el.get_int64());

    case json::kind::uint64:
      return std::to_string(el.get_uint64());

    case json::kind::double_:
      return format_real(el.get_double());

    case json::kind::string:
      return std::string(to_string_view(el.get_string()));

    case json::kind::array: {
      std::string res;
      bool first = true;

      for (const json::value& sub : el.get_array()) {
        if (first)
          first = false;
        else
          res += ',';

        res += to_string(sub);
      }

      return res;
    }

    case json::kind::object:
      return json::serialize(el);
  }

  return {};
}

//
// comparisons

bool loose_equal(const json::value& lhs, const json::value& rhs) {
  if (lhs.is_string() || rhs.is_string()) return to_string(lhs) == to_string(rhs);

  if (lhs.is_bool() || rhs.is_bool()) return truthy(lhs) == truthy(rhs);

  return native_equal(lhs, rhs);
}

bool strict_equal(const json::value& lhs, const json::value& rhs) {
  if (is_number(lhs) && is_number(rhs)) {
    const number lv = to_number_nostrings(lhs);
    const number rv = to_number_nostrings(rhs);

    return numeric_equal(lv, rv) || almost_equal(lv.real(), rv.real());
  }

  return native_equal(lhs, rhs);
}

bool less(const json::value& lhs, const json::value& rhs) {
  if (is_number(lhs) || is_number(rhs)) {
    const std::optional<double> lv = real_or_nothing(lhs);
    const std::optional<double> rv = real_or_nothing(rhs);

    // not a number
    if (!lv || !rv) return false;

    return *lv < *rv;
  }

  if (lhs.kind() != rhs.kind()) return false;

  switch (lhs.kind()) {
    case json::kind::string:
      return to_string_view(lhs.get_string()) < to_string_view(rhs.get_string());

    case json::kind::bool_:
      return !lhs.get_bool() && rhs.get_bool();

    case json::kind::array: {
      const json::array& larr = lhs.get_array();
      const json::array& rarr = rhs.get_array();
      const std::size_t len = std::min(larr.size(), rarr.size());

      for (std::size_t i = 0; i < len; ++i) {
        if (!native_equal(larr[i], rarr[i])) return less(larr[i], rarr[i]);
      }

      return larr.size() < rarr.size();
    }

    default:
      ;
  }

  return false;
}

bool less_or_equal(const json::value& lhs, const json::value& rhs) {
  return less(lhs, rhs) || loose_equal(lhs, rhs);
}

bool less(const json::array& operands) {
  return chained(operands, [](const json::value& l, const json::value& r) -> bool {
    return less(l, r);
  });
}

bool less_or_equal(const json::array& operands) {
  return chained(operands, [](const json::value& l, const json::value& r) -> bool {
    return less_or_equal(l, r);
  });
}

//
// numeric conversions

json::value to_numeric(const json::value& v) {
  const json::string* str = v.if_string();

  if (str == nullptr) return v;

  const std::string_view txt = to_string_view(*str);

  if (txt.find('.') != std::string_view::npos) {
    if (std::optional<double> res = from_string<double>(txt)) return *res;
  } else {
    if (std::optional<std::int64_t> res = from_string<std::int64_t>(txt))
      return *res;

    // integers beyond the int64 range
    if (is_integer_text(txt))
      if (std::optional<double> res = from_string<double>(txt)) return *res;
  }

  throw_type_error(txt);
}

number to_number(const json::value& v) {
  return to_number_nostrings(to_numeric(v));
}

double to_real(const json::value& v) {
  if (std::optional<double> res = real_or_nothing(v)) {
    CXX_LIKELY;
    return *res;
  }

  throw_type_error(json::serialize(v));
}

json::array merge(const json::array& operands) {
  json::array res;

  for (const json::value& el : operands) {
    if (const json::array* arr = el.if_array())
      res.insert(res.end(), arr->begin(), arr->end());
    else
      res.push_back(el);
  }

  return res;
}

}  // namespace tracelogic
