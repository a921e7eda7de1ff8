/**
 * @file Options.hpp
 * @brief Merge policy and options
 *
 * Policies decide, per leaf field, whether the source value overwrites the
 * destination value:
 * - IncludeAll: always overwrite
 * - ExcludeEmpty: overwrite only when the source field is non-empty
 * - OverwriteEmpty: overwrite only when the destination field is empty
 *
 * Include and exclude lists hold qualified field paths ("Address.Street").
 * They are plain strings; a path that matches no field is inert.
 */

#ifndef STRUCTMERGE_OPTIONS_HPP
#define STRUCTMERGE_OPTIONS_HPP

#include "structmerge/Value.hpp"
#include <string>
#include <vector>

namespace structmerge {

/**
 * @brief Per-field overwrite policy
 */
enum class MergePolicy {
    IncludeAll,
    ExcludeEmpty,
    OverwriteEmpty
};

/**
 * @brief What to do when a field-level custom merge throws
 *
 * Record-level custom merges always propagate.
 */
enum class OverrideErrors {
    Propagate, ///< Abort the merge with the thrown exception
    Ignore     ///< Log a warning and continue with the next field
};

/**
 * @brief Options for a single merge call
 */
struct MergeOptions {
    MergePolicy policy = MergePolicy::IncludeAll;
    std::vector<std::string> include; // restricts merging when non-empty
    std::vector<std::string> exclude; // always skipped
    OverrideErrors field_override_errors = OverrideErrors::Propagate;
};

/**
 * @brief Get the canonical name of a policy
 * @return "include_all", "exclude_empty" or "overwrite_empty"
 */
std::string policy_name(MergePolicy policy);

/**
 * @brief Parse a policy name (case-insensitive)
 *
 * Accepts the canonical names plus the CamelCase forms
 * ("IncludeAll", "ExcludeEmpty", "OverwriteEmpty").
 *
 * @throws std::invalid_argument for unknown names
 */
MergePolicy parse_policy(const std::string& name);

// ============================================================================
// nlohmann::json conversions
// ============================================================================

/**
 * @brief Serialize options into a JSON tree
 *
 * Example:
 * ```cpp
 * MergeOptions opts;
 * opts.policy = MergePolicy::ExcludeEmpty;
 * opts.exclude = {"Password"};
 * Value v = opts;
 * // {"policy": "exclude_empty", "include": [], "exclude": ["Password"],
 * //  "field_override_errors": "propagate"}
 * ```
 */
void to_json(Value& j, const MergeOptions& options);

/**
 * @brief Read options from a JSON tree
 *
 * Missing keys keep their defaults. Unknown policy names throw
 * std::invalid_argument; wrongly typed entries throw nlohmann's
 * type_error.
 */
void from_json(const Value& j, MergeOptions& options);

void to_json(Value& j, MergePolicy policy);
void from_json(const Value& j, MergePolicy& policy);

} // namespace structmerge

#endif // STRUCTMERGE_OPTIONS_HPP
