/**
 * @file Merge.hpp
 * @brief Policy-driven field merge of two records of the same type
 *
 * Merging rules:
 * - Fields are visited in registration order, nested records recursively,
 *   each leaf deciding on its own (a nested record is never replaced as a
 *   whole unless it is atomic).
 * - Include/exclude lists filter by qualified path (see PathFilter.hpp).
 * - Read-only fields and fields that cannot be assigned are never touched.
 * - Types providing merge_from(const SourceRef&) are merged only by it.
 * - Atomic records (timestamps) are copied wholesale whatever the policy.
 * - Leaves follow the policy:
 *   IncludeAll always copies, ExcludeEmpty copies non-empty source values,
 *   OverwriteEmpty copies into empty destination values.
 *
 * Example:
 * ```cpp
 * Person dst{"Alice", 30};
 * Person src{"", 25};
 *
 * MergeOptions opts;
 * opts.policy = MergePolicy::ExcludeEmpty;
 * merge(&dst, src, opts);
 * // dst: {"Alice", 25}
 * ```
 */

#ifndef STRUCTMERGE_MERGE_HPP
#define STRUCTMERGE_MERGE_HPP

#include "structmerge/Describe.hpp"
#include "structmerge/Errors.hpp"
#include "structmerge/Options.hpp"
#include <type_traits>

namespace structmerge {

namespace detail {

/**
 * @brief Validate, unwrap and merge type-erased arguments
 *
 * @param destination Object the caller's pointer points to (may be null)
 * @param destination_type Its descriptor
 */
void merge_root(void* destination, const TypeDescriptor& destination_type,
                const void* source, const TypeDescriptor& source_type,
                const MergeOptions& options);

} // namespace detail

/**
 * @brief Merge source into *destination
 *
 * @param destination Pointer to a record, or to an optional / unique_ptr /
 *                    shared_ptr / raw pointer holding one. Null owning
 *                    holders get a default-constructed record first.
 * @param source Record of the same type (not a pointer to one)
 * @param options Policy and filters; defaults to IncludeAll
 *
 * @throws InvalidDestination if destination is not a non-null pointer to a
 *         mutable record (checked first)
 * @throws InvalidSource if source is not a record
 * @throws TypeMismatch if the record types differ
 * @throws anything a custom merge throws
 *
 * Fields assigned before an exception stay assigned.
 */
template <typename Dst, typename Src>
void merge(Dst&& destination, const Src& source,
           const MergeOptions& options = MergeOptions{}) {
    using D = std::remove_cv_t<std::remove_reference_t<Dst>>;
    using S = std::remove_cv_t<Src>;

    if constexpr (std::is_pointer_v<D>) {
        using Pointee = std::remove_pointer_t<D>;
        if constexpr (!std::is_object_v<Pointee> || std::is_const_v<Pointee> ||
                      std::is_volatile_v<Pointee>) {
            throw InvalidDestination(detail::demangle(typeid(D).name()));
        } else {
            detail::merge_root(static_cast<void*>(destination), descriptor_of<Pointee>(),
                               static_cast<const void*>(&source), descriptor_of<S>(),
                               options);
        }
    } else {
        throw InvalidDestination(detail::demangle(typeid(D).name()));
    }
}

/**
 * @brief Emptiness predicate used by the ExcludeEmpty and OverwriteEmpty policies
 *
 * - text, collections: size() == 0
 * - bool: false
 * - integers, enums: zero
 * - floating point: exactly zero (-0.0 included, NaN excluded)
 * - pointers, optional, smart pointers, any: null / no value
 * - records, opaque values: never empty
 */
bool is_empty(const void* value, const TypeDescriptor& type);

template <typename T>
bool is_empty(const T& value) {
    return is_empty(static_cast<const void*>(&value), descriptor_of<std::remove_cv_t<T>>());
}

} // namespace structmerge

#endif // STRUCTMERGE_MERGE_HPP
