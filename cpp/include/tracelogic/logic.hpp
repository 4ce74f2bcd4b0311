#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

namespace tracelogic {

//
// exception classes

/// thrown when no type conversion rules are able to satisfy an operation's type requirements
struct type_error : std::runtime_error {
  using base = std::runtime_error;
  using base::base;
};

/// thrown when a variable name cannot be found and no default was supplied
struct variable_resolution_error : std::runtime_error {
  using base = std::runtime_error;
  using base::base;
};

/// thrown when an operation node names an operator that does not exist
struct unrecognized_operator_error : std::runtime_error {
  using base = std::runtime_error;
  using base::base;
};

/// thrown when a rule is structurally invalid
/// \details
///    e.g., an operation node without a key, an operation node
///    with more than one key, or an operator called with the
///    wrong number of operands.
struct malformed_rule_error : std::runtime_error {
  using base = std::runtime_error;
  using base::base;
};

/// thrown when operation nodes are nested deeper than evaluation_options::max_depth
struct recursion_limit_error : std::runtime_error {
  using base = std::runtime_error;
  using base::base;
};


//
// configuration

/// receives the operand of every evaluated log operation
using log_sink = std::function<void(const boost::json::value&)>;

/// returns a log_sink that prints each value on its own line to \p os.
/// \pre os must outlive the returned sink
log_sink stream_sink(std::ostream& os);

/// default bound on nested operation nodes
constexpr std::size_t default_max_depth = 256;

struct evaluation_options {
  /// maximum number of nested operation nodes
  std::size_t max_depth = default_max_depth;

  /// sink for the log operator; logs to std::cerr when empty
  log_sink logger = {};
};


//
// API to evaluate a rule

/// the outcome of an evaluation
struct evaluation_result {
  /// the computed value
  boost::json::value value;

  /// the rule reduced to the sub-rules that were actually executed
  boost::json::value trace;
};

/// evaluates the rule \p rule with the provided data \p data.
/// \param  rule a jsonlogic expression
/// \param  data a json value that the rule may access through var,
///         missing, and missing_some. Defaults to an empty object.
/// \param  opts evaluation limits and the sink for the log operator
/// \return the computed value together with the executed-logic trace
/// \throws variable_resolution_error, unrecognized_operator_error,
///         malformed_rule_error, recursion_limit_error, type_error
/// \{
evaluation_result evaluate(const boost::json::value& rule);

evaluation_result evaluate(const boost::json::value& rule,
                           const boost::json::value& data);

evaluation_result evaluate(const boost::json::value& rule,
                           const boost::json::value& data,
                           const evaluation_options& opts);
/// \}

/// evaluates \p rule against \p data and returns only the computed value.
boost::json::value apply(const boost::json::value& rule,
                         const boost::json::value& data);


//
// conversion functions

/// returns true if \p el is truthy
/// \details
///    null, false, 0, 0.0, "", and [] are falsy,
///    everything else (including objects) is truthy.
bool truthy(const boost::json::value& el);

/// returns true if \p el is !truthy
bool falsy(const boost::json::value& el);

/// returns the canonical string form of \p el
/// \details
///    strings are returned unchanged, integral doubles print
///    without a fraction, arrays print as their comma separated
///    elements, and objects as json.
std::string to_string(const boost::json::value& el);

} // namespace tracelogic
