#include "atlas/core/lifecycle/dependency_graph.h"
#include "atlas/common/spdlog/atlas_log_manager.h"
#include <algorithm>

namespace atlas {
namespace core {
namespace lifecycle {

namespace logging = atlas::common::spdlog;

bool DependencyGraph::KeySet::Add(const ComponentKey& key) {
    if (!index_.insert(key).second) {
        return false;
    }
    ordered_.push_back(key);
    return true;
}

bool DependencyGraph::KeySet::Remove(const ComponentKey& key) {
    if (index_.erase(key) == 0) {
        return false;
    }
    ordered_.erase(std::remove(ordered_.begin(), ordered_.end(), key), ordered_.end());
    return true;
}

void DependencyGraph::RegisterEdge(const ComponentKey& owner, const ComponentKey& dependent) {
    bool added = false;
    {
        std::lock_guard<std::mutex> lock(dependents_mutex_);
        added = dependents_[owner].Add(dependent);
        dependencies_[dependent].Add(owner);
    }

    if (added) {
        ATLAS_LOG_TRACE(logging::kLifecycleLoggerName, "Registered edge {} -> {}", owner, dependent);
    }
}

void DependencyGraph::RegisterContained(const ComponentKey& container, const ComponentKey& contained) {
    {
        std::lock_guard<std::mutex> lock(contained_mutex_);
        if (!contained_[container].Add(contained)) {
            return;
        }
    }
    RegisterEdge(contained, container);
}

std::vector<ComponentKey> DependencyGraph::DependentsOf(const ComponentKey& key) const {
    std::lock_guard<std::mutex> lock(dependents_mutex_);
    return Lookup(dependents_, key);
}

std::vector<ComponentKey> DependencyGraph::DependenciesOf(const ComponentKey& key) const {
    std::lock_guard<std::mutex> lock(dependents_mutex_);
    return Lookup(dependencies_, key);
}

std::vector<ComponentKey> DependencyGraph::ContainedIn(const ComponentKey& container) const {
    std::lock_guard<std::mutex> lock(contained_mutex_);
    return Lookup(contained_, container);
}

bool DependencyGraph::HasDependents(const ComponentKey& key) const {
    std::lock_guard<std::mutex> lock(dependents_mutex_);
    auto it = dependents_.find(key);
    return it != dependents_.end() && !it->second.Empty();
}

bool DependencyGraph::IsTransitivelyDependent(const ComponentKey& key, const ComponentKey& candidate) const {
    std::lock_guard<std::mutex> lock(dependents_mutex_);

    std::unordered_set<ComponentKey> visited;
    std::vector<ComponentKey> pending{key};

    while (!pending.empty()) {
        ComponentKey current = pending.back();
        pending.pop_back();

        if (!visited.insert(current).second) {
            continue;
        }

        auto it = dependents_.find(current);
        if (it == dependents_.end()) {
            continue;
        }

        for (const auto& next : it->second.Keys()) {
            if (next == candidate) {
                return true;
            }
            pending.push_back(next);
        }
    }

    return false;
}

std::vector<ComponentKey> DependencyGraph::TakeDependents(const ComponentKey& key) {
    std::lock_guard<std::mutex> lock(dependents_mutex_);

    auto it = dependents_.find(key);
    if (it == dependents_.end()) {
        return {};
    }

    std::vector<ComponentKey> result = it->second.Keys();
    dependents_.erase(it);
    return result;
}

std::vector<ComponentKey> DependencyGraph::TakeContained(const ComponentKey& container) {
    std::lock_guard<std::mutex> lock(contained_mutex_);

    auto it = contained_.find(container);
    if (it == contained_.end()) {
        return {};
    }

    std::vector<ComponentKey> result = it->second.Keys();
    contained_.erase(it);
    return result;
}

void DependencyGraph::RemoveKey(const ComponentKey& key) {
    {
        std::lock_guard<std::mutex> lock(contained_mutex_);
        EraseFrom(contained_, key);
    }

    std::lock_guard<std::mutex> lock(dependents_mutex_);
    EraseFrom(dependents_, key);
    EraseFrom(dependencies_, key);
}

void DependencyGraph::Clear() {
    {
        std::lock_guard<std::mutex> lock(contained_mutex_);
        contained_.clear();
    }

    std::lock_guard<std::mutex> lock(dependents_mutex_);
    dependents_.clear();
    dependencies_.clear();
}

std::vector<ComponentKey> DependencyGraph::Lookup(const KeyIndex& index, const ComponentKey& key) {
    auto it = index.find(key);
    if (it == index.end()) {
        return {};
    }
    return it->second.Keys();
}

void DependencyGraph::EraseFrom(KeyIndex& index, const ComponentKey& key) {
    index.erase(key);
    for (auto it = index.begin(); it != index.end();) {
        it->second.Remove(key);
        if (it->second.Empty()) {
            it = index.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
