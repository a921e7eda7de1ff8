/**
 * @file Describe.hpp
 * @brief Record registration and descriptor construction
 *
 * A record type registers its fields through an ADL-visible function:
 *
 * ```cpp
 * struct Address {
 *     std::string street;
 *     std::string city;
 *     std::string country;
 * };
 *
 * inline void describe(structmerge::RecordBuilder<Address>& r) {
 *     r.name("Address")
 *      .field("Street", &Address::street)
 *      .field("City", &Address::city)
 *      .field("Country", &Address::country);
 * }
 * ```
 *
 * Types providing `void merge_from(const structmerge::SourceRef&)` are
 * records too, merged only by that member. std::chrono::time_point is a
 * built-in atomic record.
 *
 * Category deduction (first match wins):
 * - Record: describe() found, merge_from() present, or time_point
 * - Boolean: bool
 * - SignedInteger / UnsignedInteger: integral types and enums
 * - FloatingPoint: float, double, long double
 * - Text: std::basic_string, std::basic_string_view
 * - Indirection: object pointers, optional, unique_ptr, shared_ptr, any
 * - Collection: built-in arrays, or begin(), end(), size() and value_type
 * - Opaque: everything else
 */

#ifndef STRUCTMERGE_DESCRIBE_HPP
#define STRUCTMERGE_DESCRIBE_HPP

#include "structmerge/Descriptor.hpp"
#include <any>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace structmerge {

template <typename T>
const TypeDescriptor& descriptor_of();

namespace detail {
template <typename T>
void assign_value(void* destination, const void* source);

template <typename T>
struct slices_on_copy;
} // namespace detail

/**
 * @brief Registers the fields of record T
 *
 * Passed to `describe(RecordBuilder<T>&)`. Registration order is the
 * order in which the engine visits fields.
 */
template <typename T>
class RecordBuilder {
public:
    explicit RecordBuilder(TypeDescriptor& descriptor)
        : descriptor_(descriptor)
    {}

    /**
     * @brief Set the name used in error messages
     */
    RecordBuilder& name(std::string record_name) {
        descriptor_.name = std::move(record_name);
        return *this;
    }

    /**
     * @brief Register a mergeable field
     *
     * `const` members are registered as read-only.
     *
     * @throws std::invalid_argument if the name is empty or contains '.'
     * @throws std::logic_error if the name is already registered, or if the
     *         field owns a polymorphic object through unique_ptr
     */
    template <typename M>
    RecordBuilder& field(std::string field_name, M T::*member) {
        add(std::move(field_name), member, true);
        return *this;
    }

    /**
     * @brief Register a field the engine must never alter
     *
     * It still takes part in path filtering and snapshots. A friend
     * describe() can register private members this way.
     */
    template <typename M>
    RecordBuilder& readonly(std::string field_name, M T::*member) {
        add(std::move(field_name), member, false);
        return *this;
    }

    /**
     * @brief Copy the whole record on merge instead of walking its fields
     */
    RecordBuilder& atomic() {
        static_assert(std::is_copy_assignable_v<T>, "atomic records must be copy-assignable");
        descriptor_.atomic = true;
        descriptor_.assign = &detail::assign_value<T>;
        return *this;
    }

private:
    template <typename M>
    void add(std::string field_name, M T::*member, bool settable) {
        static_assert(std::is_object_v<M>, "only data members can be registered as fields");

        if (field_name.empty() || field_name.find('.') != std::string::npos) {
            throw std::invalid_argument("Invalid field name '" + field_name +
                                        "' in record '" + descriptor_.name + "'");
        }
        for (const auto& existing : descriptor_.fields) {
            if (existing.name == field_name) {
                throw std::logic_error("Duplicate field '" + field_name +
                                       "' in record '" + descriptor_.name + "'");
            }
        }

        using Field = std::remove_cv_t<M>;
        settable = settable && !std::is_const_v<M>;

        // A deep copy through the static type would slice the pointee.
        if constexpr (detail::slices_on_copy<Field>::value) {
            if (settable) {
                throw std::logic_error("Field '" + field_name + "' in record '" + descriptor_.name +
                                       "' owns a polymorphic object and cannot be copied; "
                                       "register it with readonly() or hold it in a shared_ptr");
            }
        }

        FieldDescriptor field;
        field.name = std::move(field_name);
        field.type = &descriptor_of<Field>;
        field.settable = settable;
        field.access = [member](void* record) -> void* {
            return const_cast<Field*>(&(static_cast<T*>(record)->*member));
        };
        field.read = [member](const void* record) -> const void* {
            return &(static_cast<const T*>(record)->*member);
        };
        descriptor_.fields.push_back(std::move(field));
    }

    TypeDescriptor& descriptor_;
};

namespace detail {

// ============================================================================
// Type traits
// ============================================================================

template <typename T, typename = void>
struct finds_describe : std::false_type {};

template <typename T>
struct finds_describe<T, std::void_t<decltype(describe(std::declval<RecordBuilder<T>&>()))>>
    : std::true_type {};

// RecordBuilder<T> only exists for class types.
template <typename T>
struct has_describe : std::conjunction<std::is_class<T>, finds_describe<T>> {};

template <typename T, typename = void>
struct has_merge_from : std::false_type {};

template <typename T>
struct has_merge_from<T, std::void_t<decltype(
    std::declval<T&>().merge_from(std::declval<const SourceRef&>()))>>
    : std::true_type {};

template <typename T>
struct is_time_point : std::false_type {};

template <typename Clock, typename Duration>
struct is_time_point<std::chrono::time_point<Clock, Duration>> : std::true_type {};

template <typename T>
struct is_text : std::false_type {};

template <typename C, typename Traits, typename Alloc>
struct is_text<std::basic_string<C, Traits, Alloc>> : std::true_type {};

template <typename C, typename Traits>
struct is_text<std::basic_string_view<C, Traits>> : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};

template <typename U>
struct is_optional<std::optional<U>> : std::true_type {};

template <typename T>
struct is_unique_ptr : std::false_type {};

template <typename U, typename Deleter>
struct is_unique_ptr<std::unique_ptr<U, Deleter>> : std::true_type {};

template <typename T>
struct is_shared_ptr : std::false_type {};

template <typename U>
struct is_shared_ptr<std::shared_ptr<U>> : std::true_type {};

template <typename T>
struct slices_on_copy : std::false_type {};

template <typename U, typename Deleter>
struct slices_on_copy<std::unique_ptr<U, Deleter>> : std::is_polymorphic<U> {};

template <typename U, std::size_t N>
struct slices_on_copy<U[N]> : slices_on_copy<U> {};

template <typename T>
constexpr bool is_object_pointer_v =
    std::is_pointer_v<T> && std::is_object_v<std::remove_pointer_t<T>>;

template <typename T>
constexpr bool is_indirection_v =
    is_object_pointer_v<T> || is_optional<T>::value || is_unique_ptr<T>::value ||
    is_shared_ptr<T>::value || std::is_same_v<T, std::any>;

template <typename T, typename = void>
struct is_collection : std::false_type {};

template <typename T>
struct is_collection<T, std::void_t<
    typename T::value_type,
    decltype(std::declval<const T&>().begin()),
    decltype(std::declval<const T&>().end()),
    decltype(std::declval<const T&>().size())>>
    : std::true_type {};

template <typename T, typename = void>
struct is_map_like : std::false_type {};

template <typename T>
struct is_map_like<T, std::void_t<typename T::key_type, typename T::mapped_type>>
    : std::true_type {};

/**
 * @brief True for types the engine treats as records
 */
template <typename T>
constexpr bool is_record_type() {
    if constexpr (!std::is_class_v<T>) {
        return false;
    } else if constexpr (has_describe<T>::value || has_merge_from<T>::value) {
        return true;
    } else {
        return is_time_point<T>::value;
    }
}

template <typename T>
constexpr Category category_of() {
    if constexpr (is_record_type<T>()) {
        return Category::Record;
    } else if constexpr (std::is_same_v<T, bool>) {
        return Category::Boolean;
    } else if constexpr (std::is_enum_v<T>) {
        return std::is_signed_v<std::underlying_type_t<T>> ? Category::SignedInteger
                                                           : Category::UnsignedInteger;
    } else if constexpr (std::is_integral_v<T>) {
        return std::is_signed_v<T> ? Category::SignedInteger : Category::UnsignedInteger;
    } else if constexpr (std::is_floating_point_v<T>) {
        return Category::FloatingPoint;
    } else if constexpr (is_text<T>::value) {
        return Category::Text;
    } else if constexpr (is_indirection_v<T>) {
        return Category::Indirection;
    } else if constexpr (std::is_array_v<T> || is_collection<T>::value) {
        return Category::Collection;
    } else {
        return Category::Opaque;
    }
}

// ============================================================================
// Indirection element access
// ============================================================================

template <typename T, typename = void>
struct element_of {
    using type = void;
};

template <typename U>
struct element_of<U*> {
    using type = U;
};

template <typename U>
struct element_of<std::optional<U>> {
    using type = U;
};

template <typename U, typename Deleter>
struct element_of<std::unique_ptr<U, Deleter>> {
    using type = U;
};

template <typename U>
struct element_of<std::shared_ptr<U>> {
    using type = U;
};

template <typename T>
using element_t = typename element_of<T>::type;

/**
 * @brief True when a destination holder of type T can be written through
 */
template <typename T>
constexpr bool can_materialize() {
    using E = element_t<T>;
    return !std::is_void_v<E> && !std::is_const_v<E>;
}

/**
 * @brief True when an empty holder of type T can be given a default element
 */
template <typename T>
constexpr bool can_create() {
    if constexpr (is_object_pointer_v<T>) {
        return false;
    } else if constexpr (is_unique_ptr<T>::value) {
        return std::is_same_v<T, std::unique_ptr<element_t<T>>> &&
               std::is_default_constructible_v<element_t<T>>;
    } else {
        return std::is_default_constructible_v<element_t<T>>;
    }
}

/**
 * @brief Address of the element held by a destination holder
 *
 * Creates a default element in an empty holder where possible.
 * Returns nullptr when the holder stays empty.
 */
template <typename T>
void* materialize_element(void* reference) {
    T& ref = *static_cast<T*>(reference);
    if constexpr (is_object_pointer_v<T>) {
        // Raw pointers are borrowed; a null one cannot be materialized.
        return ref;
    } else if constexpr (is_optional<T>::value) {
        if (!ref.has_value()) {
            if constexpr (can_create<T>()) {
                ref.emplace();
            } else {
                return nullptr;
            }
        }
        return &*ref;
    } else {
        using E = element_t<T>;
        if (!ref) {
            if constexpr (!can_create<T>()) {
                return nullptr;
            } else if constexpr (is_unique_ptr<T>::value) {
                ref = std::make_unique<E>();
            } else {
                ref = std::make_shared<E>();
            }
        }
        return ref.get();
    }
}

template <typename T>
const void* deref_element(const void* reference) {
    const T& ref = *static_cast<const T*>(reference);
    if constexpr (is_optional<T>::value) {
        return ref.has_value() ? static_cast<const void*>(&*ref) : nullptr;
    } else if constexpr (is_object_pointer_v<T>) {
        return ref;
    } else if constexpr (std::is_same_v<T, std::any>) {
        return nullptr;
    } else {
        return ref.get();
    }
}

// ============================================================================
// Emptiness and assignment
// ============================================================================

template <typename T>
bool is_empty_value(const void* value) {
    const T& v = *static_cast<const T*>(value);
    constexpr Category category = category_of<T>();

    if constexpr (category == Category::Boolean) {
        return !v;
    } else if constexpr (std::is_enum_v<T>) {
        return static_cast<std::underlying_type_t<T>>(v) == 0;
    } else if constexpr (category == Category::SignedInteger ||
                         category == Category::UnsignedInteger) {
        return v == 0;
    } else if constexpr (category == Category::FloatingPoint) {
        return v == 0;
    } else if constexpr (std::is_array_v<T>) {
        return std::extent_v<T> == 0;
    } else if constexpr (category == Category::Text || category == Category::Collection) {
        return v.size() == 0;
    } else if constexpr (category == Category::Indirection) {
        if constexpr (is_optional<T>::value || std::is_same_v<T, std::any>) {
            return !v.has_value();
        } else {
            return v == nullptr;
        }
    } else {
        // Records and opaque values always count as present.
        return false;
    }
}

template <typename T>
constexpr bool is_assignable_field() {
    if constexpr (std::is_array_v<T>) {
        return is_assignable_field<std::remove_extent_t<T>>();
    } else if constexpr (is_unique_ptr<T>::value) {
        using E = element_t<T>;
        return std::is_same_v<T, std::unique_ptr<E>> && !std::is_polymorphic_v<E> &&
               std::is_copy_constructible_v<E>;
    } else if constexpr (is_collection<T>::value) {
        // Container copy assignment is declared even for move-only elements.
        return std::is_copy_assignable_v<T> &&
               std::is_copy_constructible_v<typename T::value_type>;
    } else {
        return std::is_copy_assignable_v<T>;
    }
}

template <typename T>
void assign_value(void* destination, const void* source) {
    T& dst = *static_cast<T*>(destination);
    const T& src = *static_cast<const T*>(source);
    if constexpr (std::is_array_v<T>) {
        for (std::size_t i = 0; i < std::extent_v<T>; ++i) {
            assign_value<std::remove_extent_t<T>>(&dst[i], &src[i]);
        }
    } else if constexpr (is_unique_ptr<T>::value) {
        // Owning pointers are deep copied.
        dst = src ? std::make_unique<element_t<T>>(*src) : T();
    } else {
        dst = src;
    }
}

template <typename T>
void custom_merge_value(void* destination, const SourceRef& source) {
    static_cast<T*>(destination)->merge_from(source);
}

// ============================================================================
// Snapshot leaves
// ============================================================================

template <typename T>
Value leaf_value(const void* value) {
    const T& v = *static_cast<const T*>(value);
    constexpr Category category = category_of<T>();

    if constexpr (is_time_point<T>::value) {
        return Value(static_cast<std::int64_t>(v.time_since_epoch().count()));
    } else if constexpr (std::is_enum_v<T>) {
        return Value(static_cast<std::underlying_type_t<T>>(v));
    } else if constexpr (category == Category::Boolean ||
                         category == Category::SignedInteger ||
                         category == Category::UnsignedInteger ||
                         category == Category::FloatingPoint) {
        return Value(v);
    } else if constexpr (category == Category::Text) {
        if constexpr (std::is_same_v<typename T::value_type, char>) {
            return Value(std::string(v.data(), v.size()));
        } else {
            return Value();
        }
    } else if constexpr (category == Category::Collection) {
        if constexpr (is_map_like<T>::value) {
            using Key = std::remove_cv_t<typename T::key_type>;
            using Mapped = std::remove_cv_t<typename T::mapped_type>;
            if constexpr (std::is_same_v<Key, std::string>) {
                Value out = Value::object();
                for (const typename T::value_type& entry : v) {
                    out[entry.first] = snapshot(&entry.second, descriptor_of<Mapped>());
                }
                return out;
            } else {
                Value out = Value::array();
                for (const typename T::value_type& entry : v) {
                    out.push_back(Value::array({
                        snapshot(&entry.first, descriptor_of<Key>()),
                        snapshot(&entry.second, descriptor_of<Mapped>())
                    }));
                }
                return out;
            }
        } else {
            using Element = std::remove_cv_t<std::remove_reference_t<decltype(*std::begin(v))>>;
            Value out = Value::array();
            for (const auto& element : v) {
                out.push_back(snapshot(&element, descriptor_of<Element>()));
            }
            return out;
        }
    } else {
        return Value();
    }
}

// ============================================================================
// Descriptor construction
// ============================================================================

template <typename T>
TypeDescriptor build_descriptor() {
    TypeDescriptor descriptor;
    descriptor.name = demangle(typeid(T).name());
    descriptor.id = std::type_index(typeid(T));
    descriptor.category = category_of<T>();
    descriptor.is_empty = &is_empty_value<T>;

    // Records are walked; only atomic ones are assigned (see RecordBuilder::atomic).
    if constexpr (is_time_point<T>::value ||
                  (!is_record_type<T>() && is_assignable_field<T>())) {
        descriptor.assign = &assign_value<T>;
    }

    if constexpr (has_merge_from<T>::value) {
        descriptor.custom_merge = &custom_merge_value<T>;
    }

    if constexpr (is_time_point<T>::value) {
        descriptor.atomic = true;
        descriptor.to_value = &leaf_value<T>;
    } else if constexpr (has_describe<T>::value) {
        RecordBuilder<T> builder(descriptor);
        describe(builder);
    } else if constexpr (is_indirection_v<T>) {
        using E = element_t<T>;
        if constexpr (!std::is_void_v<E>) {
            descriptor.element = &descriptor_of<std::remove_cv_t<E>>;
        }
        if constexpr (can_materialize<T>()) {
            descriptor.materialize = &materialize_element<T>;
        }
        descriptor.deref = &deref_element<T>;
    } else if constexpr (!is_record_type<T>()) {
        descriptor.to_value = &leaf_value<T>;
    }

    return descriptor;
}

} // namespace detail

/**
 * @brief Get the descriptor of T, building it on first use
 *
 * The result lives for the whole program.
 *
 * @throws std::invalid_argument, std::logic_error from a faulty describe()
 */
template <typename T>
const TypeDescriptor& descriptor_of() {
    static_assert(!std::is_reference_v<T> && !std::is_const_v<T> && !std::is_volatile_v<T>,
                  "descriptor_of expects an unqualified object type");
    static const TypeDescriptor descriptor = detail::build_descriptor<T>();
    return descriptor;
}

} // namespace structmerge

#endif // STRUCTMERGE_DESCRIBE_HPP
