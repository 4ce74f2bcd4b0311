#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include <boost/json.hpp>

#include "tracelogic/logic.hpp"

namespace tracelogic {

/// an entry in the operator table
/// \param  operands the already evaluated operands
/// \param  logger   the sink used by the log operator
/// \return the operation's value
using operator_function = boost::json::value (*)(const boost::json::array& operands,
                                                 const log_sink& logger);

/// looks up the operator \p name in the operator table
/// \return the operator's implementation, or nullptr if \p name is not
///         in the table.
/// \note   var, missing, missing_some, and if are not part of the table.
operator_function find_operator(std::string_view name);

/// the branch selected by an if operation
struct if_branch {
  /// the value of the selected branch, null if none was taken
  boost::json::value value;

  /// the position of the selected branch among the operands
  std::optional<std::size_t> position;
};

/// selects the branch of an if/elseif/else chain
/// \details
///    operands are consumed in (condition, result) pairs; a trailing
///    odd operand is the else branch.
if_branch select_branch(const boost::json::array& operands);

} // namespace tracelogic
