/**
 * @file Value.hpp
 * @brief JSON value type used for snapshots and option trees
 *
 * Uses nlohmann::json as the underlying value model.
 */

#ifndef STRUCTMERGE_VALUE_HPP
#define STRUCTMERGE_VALUE_HPP

#include <nlohmann/json.hpp>

namespace structmerge {

/**
 * @brief JSON-like value type
 *
 * Alias for nlohmann::json. Record snapshots and MergeOptions conversions
 * are expressed in terms of it.
 */
using Value = nlohmann::json;

} // namespace structmerge

#endif // STRUCTMERGE_VALUE_HPP
