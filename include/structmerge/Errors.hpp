/**
 * @file Errors.hpp
 * @brief Exception types for structmerge merge failures
 *
 * Error taxonomy:
 * - MergeError: Base class
 * - InvalidDestination: Destination is not a mutable reference to a record
 * - InvalidSource: Source is not a record value
 * - TypeMismatch: Source and destination are different record types
 *
 * All of them are validation failures; retrying the same call fails the
 * same way.
 */

#ifndef STRUCTMERGE_ERRORS_HPP
#define STRUCTMERGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace structmerge {

/**
 * @brief Base class for all structmerge exceptions
 */
class MergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Destination must be a pointer to a record
 *
 * Raised for non-pointer destinations, null pointers, pointers to const,
 * and pointers to anything that is not a record or an indirection to one.
 */
class InvalidDestination : public MergeError {
public:
    InvalidDestination()
        : MergeError("destination must be a pointer to a record")
    {}

    /**
     * @brief Construct with the offending destination type
     * @param type Name of the type that was passed as destination
     */
    explicit InvalidDestination(std::string type)
        : MergeError("destination must be a pointer to a record, got '" + type + "'")
        , type_(std::move(type))
    {}

    /**
     * @brief Get the destination type name (empty when unknown)
     */
    const std::string& type() const noexcept {
        return type_;
    }

private:
    std::string type_;
};

/**
 * @brief Source must be a record value
 *
 * Also raised by custom merges when the erased source is not the
 * concrete type they expect.
 */
class InvalidSource : public MergeError {
public:
    InvalidSource()
        : MergeError("source must be a record")
    {}

    /**
     * @brief Construct with the offending source type
     * @param type Name of the type that was passed as source
     */
    explicit InvalidSource(std::string type)
        : MergeError("source must be a record, got '" + type + "'")
        , type_(std::move(type))
    {}

    /**
     * @brief Get the source type name (empty when unknown)
     */
    const std::string& type() const noexcept {
        return type_;
    }

private:
    std::string type_;
};

/**
 * @brief Source and destination records are of different types
 */
class TypeMismatch : public MergeError {
public:
    /**
     * @brief Construct with both type names
     * @param destination_type Type of the dereferenced destination
     * @param source_type Type of the source
     */
    TypeMismatch(std::string destination_type, std::string source_type)
        : MergeError("source and destination types do not match: '" +
                     destination_type + "' vs '" + source_type + "'")
        , destination_type_(std::move(destination_type))
        , source_type_(std::move(source_type))
    {}

    const std::string& destination_type() const noexcept {
        return destination_type_;
    }

    const std::string& source_type() const noexcept {
        return source_type_;
    }

private:
    std::string destination_type_;
    std::string source_type_;
};

} // namespace structmerge

#endif // STRUCTMERGE_ERRORS_HPP
