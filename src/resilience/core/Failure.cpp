#include "core/Failure.hpp"

#include <cstdlib>
#include <memory>
#include <new>
#include <typeinfo>
#include <utility>

#ifdef __GNUG__
#include <cxxabi.h>
#endif

namespace RS {
namespace {

auto demangle(char const* name) -> std::string {
#ifdef __GNUG__
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled{abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free};
    if (status == 0 && demangled) {
        return std::string{demangled.get()};
    }
#endif
    return std::string{name};
}

// Walks std::nested_exception chains so "caused by" context survives.
auto describeChain(std::exception const& error, int depth = 0) -> std::string {
    std::string summary = demangle(typeid(error).name());
    summary.append(": ").append(error.what());
    if (depth >= 8) {
        return summary;
    }
    try {
        std::rethrow_if_nested(error);
    } catch (std::exception const& nested) {
        summary.append("\n  caused by ").append(describeChain(nested, depth + 1));
    } catch (...) {
        summary.append("\n  caused by <non-standard exception>");
    }
    return summary;
}

auto fromStdException(Failure::Type type, std::exception const& error) -> Failure {
    Failure failure;
    failure.type         = type;
    failure.typeName     = demangle(typeid(error).name());
    failure.message      = error.what();
    failure.stackSummary = describeChain(error);
    return failure;
}

} // namespace

ResourceNotFoundError::ResourceNotFoundError(std::string name)
    : std::runtime_error("Resource not found: " + name), name(std::move(name)) {}

auto Failure::FromException(std::exception_ptr const& error) -> Failure {
    if (!error) {
        return Make(Type::Unknown, "No exception");
    }
    try {
        std::rethrow_exception(error);
    } catch (ResourceNotFoundError const& e) {
        Failure failure      = fromStdException(Type::ResourceNotFound, e);
        failure.resourceName = e.resourceName();
        return failure;
    } catch (IllegalStateError const& e) {
        return fromStdException(Type::IllegalState, e);
    } catch (std::bad_alloc const& e) {
        return fromStdException(Type::OutOfMemory, e);
    } catch (std::exception const& e) {
        return fromStdException(Type::Runtime, e);
    } catch (...) {
        Failure failure = Make(Type::Unknown, "Non-standard exception");
        failure.typeName = "<unknown>";
        return failure;
    }
}

auto Failure::FromError(Error const& error) -> Failure {
    Type type = Type::Runtime;
    switch (error.code) {
    case Error::Code::ResourceNotFound:
        type = Type::ResourceNotFound;
        break;
    case Error::Code::IllegalState:
        type = Type::IllegalState;
        break;
    case Error::Code::OutOfMemory:
        type = Type::OutOfMemory;
        break;
    default:
        break;
    }
    Failure failure;
    failure.type         = type;
    failure.typeName     = std::string{"RS::Error("}.append(errorCodeToString(error.code)).append(")");
    failure.message      = error.message.value_or("");
    failure.stackSummary = describeError(error);
    return failure;
}

auto Failure::Make(Type type, std::string message) -> Failure {
    Failure failure;
    failure.type         = type;
    failure.typeName     = std::string{failureTypeToString(type)};
    failure.stackSummary = failure.typeName + ": " + message;
    failure.message      = std::move(message);
    return failure;
}

auto Failure::MissingResource(std::string name) -> Failure {
    Failure failure      = Make(Type::ResourceNotFound, "Resource not found: " + name);
    failure.resourceName = std::move(name);
    return failure;
}

auto failureTypeToString(Failure::Type type) -> std::string_view {
    switch (type) {
    case Failure::Type::ResourceNotFound:
        return "resource_not_found";
    case Failure::Type::IllegalState:
        return "illegal_state";
    case Failure::Type::OutOfMemory:
        return "out_of_memory";
    case Failure::Type::Runtime:
        return "runtime";
    case Failure::Type::Unknown:
        return "unknown";
    }
    return "unknown";
}

} // namespace RS
