#pragma once
#include "core/Error.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace RS {

// Thrown by resource hosts when a named resource does not resolve.
class ResourceNotFoundError : public std::runtime_error {
public:
    explicit ResourceNotFoundError(std::string name);

    auto resourceName() const -> std::string const& { return this->name; }

private:
    std::string name;
};

// Thrown by UI hosts when an operation is attempted in a state that forbids it.
class IllegalStateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Failure — the normalized description of whatever a caller caught while
 * initializing or styling a component. Classification only looks at this
 * value, never at the live exception, so records can outlive the throw site.
 */
struct Failure {
    enum class Type {
        ResourceNotFound,
        IllegalState,
        OutOfMemory,
        Runtime,
        Unknown
    };

    Type        type = Type::Unknown;
    std::string typeName;
    std::string message;
    std::string stackSummary;
    // Set when the failure names the resource that did not resolve.
    std::optional<std::string> resourceName;

    static auto FromException(std::exception_ptr const& error) -> Failure;
    static auto FromError(Error const& error) -> Failure;
    static auto Make(Type type, std::string message) -> Failure;
    static auto MissingResource(std::string name) -> Failure;
};

[[nodiscard]] auto failureTypeToString(Failure::Type type) -> std::string_view;

} // namespace RS
