/**
 * @file Descriptor.hpp
 * @brief Runtime type descriptors consumed by the merge engine
 *
 * Every C++ type the engine touches is described once by a TypeDescriptor:
 * its category, how to test it for emptiness, how to assign it, and, for
 * records, the ordered list of registered fields. Descriptors are built by
 * descriptor_of<T>() (see Describe.hpp) and never change afterwards.
 */

#ifndef STRUCTMERGE_DESCRIPTOR_HPP
#define STRUCTMERGE_DESCRIPTOR_HPP

#include "structmerge/Errors.hpp"
#include "structmerge/Value.hpp"
#include <functional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace structmerge {

/**
 * @brief Field category, drives emptiness and recursion
 */
enum class Category {
    Boolean,
    SignedInteger,
    UnsignedInteger,
    FloatingPoint,
    Text,
    Record,      ///< described aggregate, walked field by field
    Indirection, ///< pointer, optional, smart pointer, std::any
    Collection,  ///< sequence or mapping, opaque leaf
    Opaque       ///< anything else, never empty
};

/**
 * @brief Get human-readable category name
 * @return e.g. "boolean", "signed-integer", "record"
 */
const char* category_name(Category category) noexcept;

struct TypeDescriptor;
class SourceRef;

using DescriptorFn = const TypeDescriptor& (*)();

/**
 * @brief One registered field of a record
 *
 * The field type is resolved lazily through a function pointer so that
 * records may reach themselves through an indirection.
 */
struct FieldDescriptor {
    std::string name;
    DescriptorFn type = nullptr;
    bool settable = true;
    std::function<void*(void*)> access;             // record -> field
    std::function<const void*(const void*)> read;   // const record -> const field
};

/**
 * @brief Everything the engine knows about one C++ type
 */
struct TypeDescriptor {
    std::string name;
    std::type_index id = std::type_index(typeid(void));
    Category category = Category::Opaque;

    /// Copied wholesale instead of walked (timestamps, RecordBuilder::atomic()).
    bool atomic = false;

    /// Registered fields in declaration order (records only).
    std::vector<FieldDescriptor> fields;

    bool (*is_empty)(const void* value) = nullptr;

    /// Null when the type cannot be assigned (not copy-assignable).
    void (*assign)(void* destination, const void* source) = nullptr;

    /// Set when the type provides merge_from(const SourceRef&).
    void (*custom_merge)(void* destination, const SourceRef& source) = nullptr;

    /// Leaf conversion for snapshots; null for records and indirections.
    Value (*to_value)(const void* value) = nullptr;

    // Indirections only.
    DescriptorFn element = nullptr;                 // null for std::any
    void* (*materialize)(void* reference) = nullptr; // engage if null, return element
    const void* (*deref)(const void* reference) = nullptr;

    bool is_record() const noexcept { return category == Category::Record; }
    bool settable() const noexcept { return assign != nullptr; }
};

/**
 * @brief Read-only, type-erased view of a source value
 *
 * Handed to custom merges. The implementer checks the concrete type:
 *
 * ```cpp
 * struct Date {
 *     std::chrono::system_clock::time_point when;
 *
 *     void merge_from(const structmerge::SourceRef& src) {
 *         when = src.get<Date>().when; // throws InvalidSource on mismatch
 *     }
 * };
 * ```
 */
class SourceRef {
public:
    SourceRef(const void* data, const TypeDescriptor& type) noexcept
        : data_(data)
        , type_(&type)
    {}

    const void* data() const noexcept {
        return data_;
    }

    const TypeDescriptor& type() const noexcept {
        return *type_;
    }

    /**
     * @brief Get the source as T, or nullptr if it is another type
     */
    template <typename T>
    const T* get_if() const noexcept {
        if (type_->id != std::type_index(typeid(T))) {
            return nullptr;
        }
        return static_cast<const T*>(data_);
    }

    /**
     * @brief Get the source as T
     * @throws InvalidSource if the source is another type
     */
    template <typename T>
    const T& get() const {
        if (const T* value = get_if<T>()) {
            return *value;
        }
        throw InvalidSource(type_->name);
    }

private:
    const void* data_;
    const TypeDescriptor* type_;
};

/**
 * @brief Convert a described value into a JSON tree
 *
 * Records become objects keyed by field name, indirections become null or
 * their element, sequences become arrays, string-keyed maps become
 * objects, other maps become arrays of [key, value] pairs and opaque
 * values become null.
 */
Value snapshot(const void* value, const TypeDescriptor& type);

namespace detail {

/**
 * @brief Readable type name from a typeid name (identity where unsupported)
 */
std::string demangle(const char* name);

} // namespace detail

} // namespace structmerge

#endif // STRUCTMERGE_DESCRIPTOR_HPP
