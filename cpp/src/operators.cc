/// implements the operator table

#include "tracelogic/details/operators.hpp"

// standard headers
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
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

constexpr std::int64_t max_int = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t min_int = std::numeric_limits<std::int64_t>::min();

void require_operands(const json::array& operands, std::size_t lo,
                      std::size_t hi, std::string_view name) {
  const std::size_t num = operands.size();

  if ((num < lo) || (num > hi)) {
    CXX_UNLIKELY;
    std::string msg{"wrong number of operands for "};

    msg.append(name).append(": ").append(std::to_string(num));
    throw malformed_rule_error{msg};
  }
}

//
// integer arithmetic that falls back to floating point on overflow

number add_numbers(const number& lhs, const number& rhs) {
  if (lhs.integral && rhs.integral) {
    const bool overflow = (rhs.ival > 0) ? (lhs.ival > max_int - rhs.ival)
                                         : (lhs.ival < min_int - rhs.ival);

    if (!overflow) {
      CXX_LIKELY;
      return make_number(lhs.ival + rhs.ival);
    }
  }

  return make_number(lhs.real() + rhs.real());
}

number subtract_numbers(const number& lhs, const number& rhs) {
  if (lhs.integral && rhs.integral) {
    const bool overflow = (rhs.ival < 0) ? (lhs.ival > max_int + rhs.ival)
                                         : (lhs.ival < min_int + rhs.ival);

    if (!overflow) {
      CXX_LIKELY;
      return make_number(lhs.ival - rhs.ival);
    }
  }

  return make_number(lhs.real() - rhs.real());
}

number negate_number(const number& val) {
  if (val.integral && (val.ival != min_int)) return make_number(-val.ival);

  return make_number(-val.real());
}

bool number_less(const number& lhs, const number& rhs) {
  if (lhs.integral && rhs.integral) return lhs.ival < rhs.ival;

  return lhs.real() < rhs.real();
}

//
// the operator implementations

// comparisons

json::value op_equal(const json::array& ops) {
  require_operands(ops, 2, 2, "==");
  return loose_equal(ops[0], ops[1]);
}

json::value op_strict_equal(const json::array& ops) {
  require_operands(ops, 2, 2, "===");
  return strict_equal(ops[0], ops[1]);
}

json::value op_not_equal(const json::array& ops) {
  require_operands(ops, 2, 2, "!=");
  return !loose_equal(ops[0], ops[1]);
}

json::value op_strict_not_equal(const json::array& ops) {
  require_operands(ops, 2, 2, "!==");
  return !strict_equal(ops[0], ops[1]);
}

json::value op_less(const json::array& ops) { return less(ops); }

json::value op_less_or_equal(const json::array& ops) {
  return less_or_equal(ops);
}

json::value op_greater(const json::array& ops) {
  require_operands(ops, 2, 2, ">");
  return less(ops[1], ops[0]);
}

json::value op_greater_or_equal(const json::array& ops) {
  require_operands(ops, 2, 2, ">=");
  return less(ops[1], ops[0]) || loose_equal(ops[0], ops[1]);
}

// logical operators

json::value op_not(const json::array& ops) {
  require_operands(ops, 1, 1, "!");
  return falsy(ops[0]);
}

json::value op_not_not(const json::array& ops) {
  require_operands(ops, 1, 1, "!!");
  return truthy(ops[0]);
}

/// returns the first operand whose truthiness differs from \p start,
///   or the last operand otherwise.
json::value short_circuit(const json::array& ops, bool start) {
  json::value res = start;

  for (const json::value& el : ops) {
    if (truthy(res) != start) break;

    res = el;
  }

  return res;
}

json::value op_and(const json::array& ops) { return short_circuit(ops, true); }

json::value op_or(const json::array& ops) { return short_circuit(ops, false); }

json::value op_ternary(const json::array& ops) {
  require_operands(ops, 3, 3, "?:");
  return truthy(ops[0]) ? ops[1] : ops[2];
}

// arithmetic

json::value op_add(const json::array& ops) {
  number res = make_number(std::int64_t(0));

  for (const json::value& el : ops) res = add_numbers(res, to_number(el));

  return res.to_json();
}

json::value op_subtract(const json::array& ops) {
  require_operands(ops, 1, 2, "-");

  if (ops.size() == 1) return negate_number(to_number(ops[0])).to_json();

  return subtract_numbers(to_number(ops[0]), to_number(ops[1])).to_json();
}

json::value op_multiply(const json::array& ops) {
  double res = 1.0;

  for (const json::value& el : ops) res *= to_real(el);

  return res;
}

json::value op_divide(const json::array& ops) {
  require_operands(ops, 1, 2, "/");

  if (ops.size() == 1) return ops[0];

  const double lhs = to_real(ops[0]);
  const double rhs = to_real(ops[1]);

  if (rhs == 0.0) {
    CXX_UNLIKELY;
    return nullptr;
  }

  return lhs / rhs;
}

json::value op_modulo(const json::array& ops) {
  require_operands(ops, 2, 2, "%");

  const number lhs = to_number(ops[0]);
  const number rhs = to_number(ops[1]);

  if (lhs.integral && rhs.integral) {
    if (rhs.ival == 0) return nullptr;

    // INT_MIN % -1 is undefined
    if (rhs.ival == -1) return std::int64_t(0);

    return lhs.ival % rhs.ival;
  }

  if (rhs.real() == 0.0) return nullptr;

  return std::fmod(lhs.real(), rhs.real());
}

template <class binary_predicate_t>
json::value select_number(const json::array& ops, binary_predicate_t better) {
  if (ops.empty()) return nullptr;

  number res = to_number(ops[0]);

  for (std::size_t i = 1; i < ops.size(); ++i) {
    number cand = to_number(ops[i]);

    if (better(cand, res)) res = cand;
  }

  return res.to_json();
}

json::value op_min(const json::array& ops) {
  return select_number(ops, [](const number& cand, const number& best) -> bool {
    return number_less(cand, best);
  });
}

json::value op_max(const json::array& ops) {
  return select_number(ops, [](const number& cand, const number& best) -> bool {
    return number_less(best, cand);
  });
}

json::value op_count(const json::array& ops) {
  return std::int64_t(std::count_if(ops.begin(), ops.end(), &truthy));
}

// strings and arrays

json::value op_cat(const json::array& ops) {
  std::string res;

  for (const json::value& el : ops) res += to_string(el);

  return json::string(std::string_view(res));
}

json::value op_merge(const json::array& ops) { return merge(ops); }

/// implements "in" for strings (substring), arrays (element),
///   and objects (key).
json::value op_membership(const json::array& ops) {
  require_operands(ops, 2, 2, "in");

  const json::value& needle = ops[0];
  const json::value& haystack = ops[1];

  switch (haystack.kind()) {
    case json::kind::string: {
      const json::string* str = needle.if_string();

      return (str != nullptr) &&
             (haystack.get_string().find(*str) != json::string::npos);
    }

    case json::kind::array: {
      const json::array& arr = haystack.get_array();
      auto is_needle = [&needle](const json::value& el) -> bool {
        return strict_equal(needle, el);
      };

      return std::any_of(arr.begin(), arr.end(), is_needle);
    }

    case json::kind::object: {
      const json::string* key = needle.if_string();

      return (key != nullptr) && haystack.get_object().contains(*key);
    }

    default:
      ;
  }

  return false;
}

// side effects

json::value op_log(const json::array& ops, const log_sink& logger) {
  require_operands(ops, 1, 1, "log");

  if (logger) logger(ops[0]);

  return ops[0];
}

/// adapts operators that do not produce side effects to the table signature
template <json::value (*fn)(const json::array&)>
json::value pure(const json::array& ops, const log_sink&) {
  return fn(ops);
}

using dispatch_table = std::map<std::string_view, operator_function>;

}  // namespace

operator_function find_operator(std::string_view name) {
  static const dispatch_table dt = {
      {"==", &pure<op_equal>},
      {"===", &pure<op_strict_equal>},
      {"!=", &pure<op_not_equal>},
      {"!==", &pure<op_strict_not_equal>},
      {"<", &pure<op_less>},
      {"<=", &pure<op_less_or_equal>},
      {">", &pure<op_greater>},
      {">=", &pure<op_greater_or_equal>},
      {"!", &pure<op_not>},
      {"!!", &pure<op_not_not>},
      {"and", &pure<op_and>},
      {"or", &pure<op_or>},
      {"?:", &pure<op_ternary>},
      {"+", &pure<op_add>},
      {"-", &pure<op_subtract>},
      {"*", &pure<op_multiply>},
      {"/", &pure<op_divide>},
      {"%", &pure<op_modulo>},
      {"min", &pure<op_min>},
      {"max", &pure<op_max>},
      {"count", &pure<op_count>},
      {"cat", &pure<op_cat>},
      {"merge", &pure<op_merge>},
      {"in", &pure<op_membership>},
      {"log", &op_log},
  };

  dispatch_table::const_iterator pos = dt.find(name);

  if (pos == dt.end()) return nullptr;

  return pos->second;
}

if_branch select_branch(const json::array& operands) {
  const std::size_t num = operands.size();

  for (std::size_t pos = 0; pos + 1 < num; pos += 2) {
    if (truthy(operands[pos])) return {operands[pos + 1], pos + 1};
  }

  // trailing else
  if (num % 2) return {operands[num - 1], num - 1};

  return {nullptr, std::nullopt};
}

}  // namespace tracelogic
