/**
 * @file depaths_common.hpp
 * @brief Error taxonomy shared by the model, the path finder and the front end.
 *
 * Everything here is reported by throwing. Empty selections and pairs with
 * no paths are not errors, they simply produce empty results.
 */

#pragma once

#include <stdexcept>
#include <string>


namespace depaths {

/**
 * @brief a required option is missing or has a bad value.
 *
 * Always raised before any graph work begins.
 */
struct ConfigurationError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief the graph edge list could not be read
 */
struct GraphFormatError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief an adjacency provider was queried for a node it doesn't know
 */
struct UnknownNodeError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief a fan-out observed its cancellation flag raised.
 *
 * Partial results are never handed out: this is thrown instead.
 */
struct OperationCancelled: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

} // namespace depaths
