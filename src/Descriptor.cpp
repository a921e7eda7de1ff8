/**
 * @file Descriptor.cpp
 * @brief Category names and type-name demangling
 */

#include "structmerge/Descriptor.hpp"
#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
    #include <cxxabi.h>
#endif

namespace structmerge {

const char* category_name(Category category) noexcept {
    switch (category) {
        case Category::Boolean: return "boolean";
        case Category::SignedInteger: return "signed-integer";
        case Category::UnsignedInteger: return "unsigned-integer";
        case Category::FloatingPoint: return "floating-point";
        case Category::Text: return "text";
        case Category::Record: return "record";
        case Category::Indirection: return "indirection";
        case Category::Collection: return "collection";
        case Category::Opaque: return "opaque";
    }
    return "unknown";
}

namespace detail {

std::string demangle(const char* name) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> readable(
        abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    if (status == 0 && readable) {
        return readable.get();
    }
#endif
    return name;
}

} // namespace detail

} // namespace structmerge
