/**
 * @file Snapshot.cpp
 * @brief Implementation of record snapshots
 */

#include "structmerge/Snapshot.hpp"

namespace structmerge {

Value snapshot(const void* value, const TypeDescriptor& type) {
    if (type.to_value) {
        return type.to_value(value);
    }

    if (type.category == Category::Indirection) {
        const void* element = type.deref ? type.deref(value) : nullptr;
        if (element == nullptr || type.element == nullptr) {
            return nullptr;
        }
        return snapshot(element, type.element());
    }

    if (type.is_record()) {
        Value result = Value::object();
        for (const auto& field : type.fields) {
            result[field.name] = snapshot(field.read(value), field.type());
        }
        return result;
    }

    return nullptr;
}

} // namespace structmerge
