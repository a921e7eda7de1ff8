/**
 * @file PathFilter.hpp
 * @brief Qualified field paths and include/exclude evaluation
 *
 * A qualified path is the field name for top-level fields and
 * "<parent path>.<name>" for fields of nested records ("Address.Street").
 *
 * Filter rules:
 * - Include (when non-empty): a path is included if it is listed exactly,
 *   or, for top-level paths only, if any listed path starts with it as a
 *   plain string prefix. Including "Address.Street" therefore pulls the
 *   top-level "Address" into recursion; inside it only "Address.Street"
 *   matches.
 * - Exclude: a path listed exactly is always skipped.
 *
 * Paths are never validated against a record; unmatched entries are inert.
 */

#ifndef STRUCTMERGE_PATH_FILTER_HPP
#define STRUCTMERGE_PATH_FILTER_HPP

#include "structmerge/Describe.hpp"
#include "structmerge/Options.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace structmerge {

/**
 * @brief Build the qualified path of a field
 *
 * @param prefix Empty at top level, otherwise the parent path followed by '.'
 * @param name Field name
 *
 * Examples:
 * - qualify("", "Name") → "Name"
 * - qualify("Address.", "Street") → "Address.Street"
 */
std::string qualify(const std::string& prefix, const std::string& name);

/**
 * @brief Prefix for the fields of the record at `path`
 *
 * nested_prefix("Address") → "Address."
 */
std::string nested_prefix(const std::string& path);

/**
 * @brief True if the path has no '.' separator
 */
bool is_top_level(const std::string& path);

/**
 * @brief Include/exclude sets of one merge call
 */
class PathFilter {
public:
    PathFilter() = default;
    explicit PathFilter(const MergeOptions& options);
    PathFilter(const std::vector<std::string>& include,
               const std::vector<std::string>& exclude);

    /**
     * @brief True when an include list restricts the merge
     */
    bool restricted() const noexcept {
        return !include_.empty();
    }

    /**
     * @brief Include rule; always true when not restricted
     */
    bool includes(const std::string& path) const;

    /**
     * @brief Exclude rule; exact membership only
     */
    bool excludes(const std::string& path) const;

    /**
     * @brief includes(path) and not excludes(path)
     */
    bool admits(const std::string& path) const {
        return includes(path) && !excludes(path);
    }

private:
    std::unordered_set<std::string> include_;
    std::unordered_set<std::string> exclude_;
};

/**
 * @brief List every qualified path the engine can visit in a record
 *
 * Paths come in declaration order, a record field before its own fields.
 * Atomic records and records with a custom merge are listed but not
 * descended into. Non-records yield an empty list.
 *
 * Example:
 * ```cpp
 * field_paths<Person>();
 * // ["Name", "Age", "Address", "Address.Street", "Address.City", ...]
 * ```
 */
std::vector<std::string> field_paths(const TypeDescriptor& type);

template <typename T>
std::vector<std::string> field_paths() {
    return field_paths(descriptor_of<T>());
}

} // namespace structmerge

#endif // STRUCTMERGE_PATH_FILTER_HPP
