#include "atlas/core/lifecycle/lifecycle_errors.h"

namespace atlas {
namespace core {
namespace lifecycle {

namespace {

std::string JoinKeys(const std::vector<ComponentKey>& keys) {
    std::string result;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += keys[i];
    }
    return result;
}

} // namespace

std::string DescribeException(std::exception_ptr error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

AlreadyInCreationException::AlreadyInCreationException(const ComponentKey& key, const std::string& detail)
    : LifecycleException(key, "Component '" + key + "' is currently in creation" +
                              (detail.empty() ? std::string(": is there an unresolvable circular reference?")
                                              : ": " + detail)) {}

ConstructionFailedException::ConstructionFailedException(const ComponentKey& key, BuildStage stage,
                                                         std::exception_ptr cause)
    : LifecycleException(key, "Error creating component '" + key + "' at stage " + ToString(stage) +
                              ": " + DescribeException(cause)),
      stage_(stage),
      cause_(cause),
      cause_message_(DescribeException(cause)) {}

ConstructionFailedException::ConstructionFailedException(const ComponentKey& key, BuildStage stage,
                                                         const std::string& message)
    : LifecycleException(key, "Error creating component '" + key + "' at stage " + ToString(stage) +
                              ": " + message),
      stage_(stage),
      cause_message_(message) {}

std::string ConstructionFailedException::GetRootCauseMessage() const {
    std::string message = cause_message_;
    std::exception_ptr cause = cause_;
    while (cause) {
        try {
            std::rethrow_exception(cause);
        } catch (const ConstructionFailedException& nested) {
            message = nested.GetCauseMessage();
            cause = nested.GetCause();
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "unknown exception";
        }
    }
    return message;
}

std::vector<ComponentKey> ConstructionFailedException::GetKeyChain() const {
    std::vector<ComponentKey> chain{GetKey()};
    std::exception_ptr cause = cause_;
    while (cause) {
        try {
            std::rethrow_exception(cause);
        } catch (const ConstructionFailedException& nested) {
            chain.push_back(nested.GetKey());
            cause = nested.GetCause();
        } catch (const LifecycleException& other) {
            chain.push_back(other.GetKey());
            break;
        } catch (const std::exception&) {
            break;
        }
    }
    return chain;
}

UnresolvedRawInjectionException::UnresolvedRawInjectionException(const ComponentKey& key,
                                                                 std::vector<ComponentKey> dependents)
    : LifecycleException(key, "Component '" + key + "' has been injected into other components [" +
                              JoinKeys(dependents) + "] in its raw version as part of a circular reference, "
                              "but has eventually been wrapped"),
      dependents_(std::move(dependents)) {}

ComponentNotFoundException::ComponentNotFoundException(const ComponentKey& key)
    : LifecycleException(key, "No component named '" + key + "' is defined") {}

ComponentNotFoundException::ComponentNotFoundException(const ComponentKey& key, const std::string& message)
    : LifecycleException(key, message) {}

AmbiguousComponentException::AmbiguousComponentException(const std::string& type_name,
                                                         std::vector<ComponentKey> candidates)
    : LifecycleException(candidates.empty() ? ComponentKey() : candidates.front(),
                         "Expected single matching component of type " + type_name + " but found " +
                         std::to_string(candidates.size()) + ": " + JoinKeys(candidates)),
      candidates_(std::move(candidates)) {}

DuplicateComponentException::DuplicateComponentException(const ComponentKey& key)
    : LifecycleException(key, "Could not register component under key '" + key + "': there is already a bound object") {}

CreationNotAllowedException::CreationNotAllowedException(const ComponentKey& key)
    : LifecycleException(key, "Singleton creation of '" + key +
                              "' not allowed while singletons of this registry are in destruction") {}

} // namespace lifecycle
} // namespace core
} // namespace atlas
