#pragma once

#include <string_view>

#include <boost/json.hpp>

namespace tracelogic {

/// finds the value at \p path inside \p data.
/// \param  data the data context
/// \param  path dot separated segments; a segment selects an object
///         member, or an array element if it is a non-negative integer.
/// \return a pointer into \p data, nullptr if any segment cannot be resolved.
///         An empty path returns &data.
const boost::json::value* find_var(const boost::json::value& data,
                                   std::string_view path);

/// returns the value at \p path inside \p data
/// \details
///    \p path is converted to its canonical string form;
///    a null path selects the entire data context.
/// \throw  variable_resolution_error if the path cannot be resolved
/// \{
boost::json::value get_var(const boost::json::value& data,
                           const boost::json::value& path);

/// returns \p fallback if the path cannot be resolved
boost::json::value get_var(const boost::json::value& data,
                           const boost::json::value& path,
                           const boost::json::value& fallback);
/// \}

/// returns the names in \p names that cannot be resolved in \p data.
/// \details
///    if the first name is an array, its elements are used as names
///    and the remaining operands are ignored.
boost::json::array missing(const boost::json::value& data,
                           const boost::json::array& names);

/// returns an empty array if at least \p min_required names in \p names
///   can be resolved, and the missing names otherwise.
boost::json::array missing_some(const boost::json::value& data,
                                double min_required,
                                const boost::json::array& names);

/// an operator that reads the data context
/// \param  data     the data context
/// \param  operands the already evaluated operands
using context_function = boost::json::value (*)(const boost::json::value& data,
                                                const boost::json::array& operands);

/// looks up var, missing, and missing_some
/// \return the operator's implementation, or nullptr for all other names
context_function find_context_operator(std::string_view name);

} // namespace tracelogic
