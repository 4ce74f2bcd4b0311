#pragma once

#include <cstdint>

#include <boost/json.hpp>

namespace tracelogic {

/// a number as seen by the arithmetic operators
/// \details
///    integral numbers stay integral as long as all operands are
///    integral and no overflow occurs.
struct number {
  bool integral = true;
  std::int64_t ival = 0;
  double rval = 0.0;

  double real() const { return integral ? double(ival) : rval; }

  boost::json::value to_json() const;
};

number make_number(std::int64_t v);
number make_number(double v);

/// returns true if \p v is an int64, uint64, or double
bool is_number(const boost::json::value& v);

/// equality with cross-type coercion (==)
/// \details
///    if either operand is a string, the canonical string forms
///    are compared; otherwise if either is a boolean, their truthiness
///    is compared; otherwise native equality is used.
bool loose_equal(const boost::json::value& lhs, const boost::json::value& rhs);

/// equality without coercion (===)
/// \details
///    operands of different kinds are never equal. Two numbers are
///    also equal if their relative difference is within 1e-9.
bool strict_equal(const boost::json::value& lhs, const boost::json::value& rhs);

/// relational operators
/// \details
///    if either operand is a number, both are converted to double;
///    a failing conversion yields false.
/// \{
bool less(const boost::json::value& lhs, const boost::json::value& rhs);
bool less_or_equal(const boost::json::value& lhs, const boost::json::value& rhs);
/// \}

/// chained relational operators: operands[0] < operands[1] < ...
/// \pre operands.size() >= 2
/// \{
bool less(const boost::json::array& operands);
bool less_or_equal(const boost::json::array& operands);
/// \}

/// converts strings to int64 (or double if the string contains a '.')
/// \return \p v unchanged, if \p v is not a string
/// \throw  type_error if the string does not hold a number
boost::json::value to_numeric(const boost::json::value& v);

/// converts \p v to a number for integer-preserving arithmetic
/// \details
///    strings are converted with to_numeric, booleans count as 0 and 1.
/// \throw  type_error for null, arrays, objects, and non-numeric strings
number to_number(const boost::json::value& v);

/// converts \p v to double
/// \throw  type_error for null, arrays, objects, and non-numeric strings
double to_real(const boost::json::value& v);

/// flattens array operands by one level and appends non-array operands
boost::json::array merge(const boost::json::array& operands);

} // namespace tracelogic
