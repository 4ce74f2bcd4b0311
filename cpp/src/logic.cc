/// implements the tracelogic evaluator

#include "tracelogic/logic.hpp"

// standard headers
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

// 3rd party headers
#include <boost/json.hpp>

// tracelogic headers
#include "tracelogic/details/coercion.hpp"
#include "tracelogic/details/cxx-compat.hpp"
#include "tracelogic/details/operators.hpp"
#include "tracelogic/details/variables.hpp"

namespace tracelogic {

namespace json = boost::json;

namespace {

constexpr std::string_view IF_OPERATOR = "if";

CXX_NORETURN
void throw_malformed_node(const json::object& node) {
  if (node.empty()) throw malformed_rule_error{"operation without operator"};

  throw malformed_rule_error{"operation with more than one operator: " +
                             json::serialize(node)};
}

CXX_NORETURN
void throw_unrecognized(std::string_view name) {
  throw unrecognized_operator_error{"unrecognized operation " + std::string(name)};
}

/// tracks the nesting depth of operation nodes
struct depth_guard {
  depth_guard(std::size_t& curr, std::size_t limit) : depth(curr) {
    if (depth >= limit) {
      CXX_UNLIKELY;
      throw recursion_limit_error{"rule nesting exceeds " + std::to_string(limit)};
    }

    ++depth;
  }

  ~depth_guard() { --depth; }

 private:
  std::size_t& depth;

  depth_guard(const depth_guard&) = delete;
  depth_guard& operator=(const depth_guard&) = delete;
};

json::value make_trace(std::string_view name, json::array executed) {
  json::object res;

  res.emplace(name, std::move(executed));
  return res;
}

struct evaluator {
  evaluator(const json::value& dataContext, const evaluation_options& opts)
      : data(dataContext), max_depth(opts.max_depth), logger(opts.logger) {
    if (!logger) logger = stream_sink(std::cerr);
  }

  /// evaluates \p rule and returns its value and executed logic
  evaluation_result eval(const json::value& rule);

 private:
  const json::value& data;
  std::size_t max_depth;
  log_sink logger;
  std::size_t depth = 0;

  evaluator(const evaluator&) = delete;
  evaluator(evaluator&&) = delete;
  evaluator& operator=(const evaluator&) = delete;
  evaluator& operator=(evaluator&&) = delete;

  /// evaluates an operation node
  evaluation_result eval_operation(const json::object& node);

  /// evaluates all operands of an operation
  /// \details
  ///    a non-array operand stands for a single element array
  void eval_operands(const json::value& operands, json::array& values,
                     json::array& executed);
};

evaluation_result evaluator::eval(const json::value& rule) {
  if (const json::object* node = rule.if_object()) return eval_operation(*node);

  // primitives, including arrays, evaluate to themselves
  return {rule, rule};
}

void evaluator::eval_operands(const json::value& operands, json::array& values,
                              json::array& executed) {
  auto eval_one = [this, &values, &executed](const json::value& operand) -> void {
    evaluation_result sub = eval(operand);

    values.push_back(std::move(sub.value));
    executed.push_back(std::move(sub.trace));
  };

  if (const json::array* arr = operands.if_array()) {
    CXX_LIKELY;
    values.reserve(arr->size());
    executed.reserve(arr->size());

    for (const json::value& operand : *arr) eval_one(operand);
  } else {
    eval_one(operands);
  }
}

evaluation_result evaluator::eval_operation(const json::object& node) {
  if (node.size() != 1) {
    CXX_UNLIKELY;
    throw_malformed_node(node);
  }

  depth_guard guard{depth, max_depth};

  const json::key_value_pair& op = *node.begin();
  const std::string_view name = op.key();
  json::array values;
  json::array executed;

  eval_operands(op.value(), values, executed);

  // operators with access to the data context
  if (context_function fn = find_context_operator(name))
    return {fn(data, values), make_trace(name, std::move(executed))};

  // if replaces its trace with the trace of the selected branch
  if (name == IF_OPERATOR) {
    if_branch branch = select_branch(values);

    if (!branch.position) return {nullptr, json::object()};

    return {std::move(branch.value), std::move(executed[*branch.position])};
  }

  operator_function fn = find_operator(name);

  if (fn == nullptr) {
    CXX_UNLIKELY;
    throw_unrecognized(name);
  }

  return {fn(values, logger), make_trace(name, std::move(executed))};
}

}  // namespace

log_sink stream_sink(std::ostream& os) {
  return [&os](const json::value& val) -> void { os << val << std::endl; };
}

evaluation_result evaluate(const json::value& rule) {
  return evaluate(rule, json::object(), evaluation_options{});
}

evaluation_result evaluate(const json::value& rule, const json::value& data) {
  return evaluate(rule, data, evaluation_options{});
}

evaluation_result evaluate(const json::value& rule, const json::value& data,
                           const evaluation_options& opts) {
  evaluator ev{data, opts};

  return ev.eval(rule);
}

json::value apply(const json::value& rule, const json::value& data) {
  return evaluate(rule, data).value;
}

}  // namespace tracelogic
