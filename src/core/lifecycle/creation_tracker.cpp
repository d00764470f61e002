#include "atlas/core/lifecycle/creation_tracker.h"
#include "atlas/core/lifecycle/lifecycle_errors.h"

namespace atlas {
namespace core {
namespace lifecycle {

void CreationTracker::BeginCreation(const ComponentKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (excluded_.count(key) > 0) {
        return;
    }

    if (!in_creation_.insert(key).second) {
        throw AlreadyInCreationException(key);
    }
}

void CreationTracker::EndCreation(const ComponentKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (excluded_.count(key) > 0) {
        return;
    }

    if (in_creation_.erase(key) == 0) {
        throw InconsistentTrackerStateException(key, "Component '" + key + "' isn't currently in creation");
    }
}

bool CreationTracker::IsInCreation(const ComponentKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return excluded_.count(key) == 0 && in_creation_.count(key) > 0;
}

void CreationTracker::SetExcluded(const ComponentKey& key, bool excluded) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (excluded) {
        excluded_.insert(key);
        in_creation_.erase(key);
    } else {
        excluded_.erase(key);
    }
}

bool CreationTracker::IsExcluded(const ComponentKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return excluded_.count(key) > 0;
}

void CreationTracker::Forget(const ComponentKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_creation_.erase(key);
}

std::vector<ComponentKey> CreationTracker::GetKeysInCreation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ComponentKey>(in_creation_.begin(), in_creation_.end());
}

void CreationTracker::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    in_creation_.clear();
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
