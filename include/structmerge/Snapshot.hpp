/**
 * @file Snapshot.hpp
 * @brief Record to JSON conversion for diagnostics
 *
 * Example:
 * ```cpp
 * Person p{"Alice", 30, {"Main St", "Springfield", ""}};
 * snapshot(p);
 * // {"Name": "Alice", "Age": 30,
 * //  "Address": {"Street": "Main St", "City": "Springfield", "Country": ""}}
 * ```
 */

#ifndef STRUCTMERGE_SNAPSHOT_HPP
#define STRUCTMERGE_SNAPSHOT_HPP

#include "structmerge/Describe.hpp"
#include "structmerge/Value.hpp"

namespace structmerge {

/**
 * @brief Convert any value the library can describe into a Value
 *
 * Read-only fields are included. Timestamps become their tick count
 * since the clock's epoch.
 */
template <typename T>
Value snapshot(const T& value) {
    return snapshot(static_cast<const void*>(&value), descriptor_of<std::remove_cv_t<T>>());
}

} // namespace structmerge

#endif // STRUCTMERGE_SNAPSHOT_HPP
