#include "atlas/core/lifecycle/disposal_coordinator.h"
#include "atlas/common/spdlog/atlas_log_manager.h"
#include <algorithm>

namespace atlas {
namespace core {
namespace lifecycle {

namespace logging = atlas::common::spdlog;

DisposalCoordinator::DisposalCoordinator(ObjectRegistry& registry, DependencyGraph& graph)
    : registry_(registry), graph_(graph) {
}

void DisposalCoordinator::RegisterDisposal(const ComponentKey& key, DisposalCallback callback) {
    std::lock_guard<std::mutex> lock(disposal_mutex_);

    if (disposals_.find(key) == disposals_.end()) {
        disposal_order_.push_back(key);
    }
    disposals_[key] = std::move(callback);
}

bool DisposalCoordinator::HasDisposal(const ComponentKey& key) const {
    std::lock_guard<std::mutex> lock(disposal_mutex_);
    return disposals_.find(key) != disposals_.end();
}

std::vector<ComponentKey> DisposalCoordinator::GetDisposalKeys() const {
    std::lock_guard<std::mutex> lock(disposal_mutex_);
    return disposal_order_;
}

void DisposalCoordinator::DisposeAll() {
    ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Disposing components");

    registry_.SetInDestruction(true);

    std::vector<ComponentKey> keys = GetDisposalKeys();
    for (auto it = keys.rbegin(); it != keys.rend(); ++it) {
        DisposeOne(*it);
    }

    {
        std::lock_guard<std::recursive_mutex> construction(registry_.GetConstructionLock());
        graph_.Clear();
        registry_.Clear();
    }

    {
        std::lock_guard<std::mutex> lock(disposal_mutex_);
        disposals_.clear();
        disposal_order_.clear();
    }

    ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Disposal finished, {} failure(s)", total_failures_.load());
}

void DisposalCoordinator::DisposeOne(const ComponentKey& key) {
    DisposalCallback callback = TakeDisposal(key);
    DestroyComponent(key, callback);

    if (!registry_.IsInDestruction()) {
        registry_.Remove(key);
    }
}

std::vector<DisposalError> DisposalCoordinator::GetSuppressedErrors() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return suppressed_errors_;
}

void DisposalCoordinator::SetSuppressedErrorLimit(size_t limit) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    suppressed_error_limit_ = limit;
    if (suppressed_errors_.size() > limit) {
        suppressed_errors_.resize(limit);
    }
}

size_t DisposalCoordinator::GetSuppressedErrorLimit() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return suppressed_error_limit_;
}

DisposalCallback DisposalCoordinator::TakeDisposal(const ComponentKey& key) {
    std::lock_guard<std::mutex> lock(disposal_mutex_);

    auto it = disposals_.find(key);
    if (it == disposals_.end()) {
        return DisposalCallback();
    }

    DisposalCallback callback = std::move(it->second);
    disposals_.erase(it);
    disposal_order_.erase(std::remove(disposal_order_.begin(), disposal_order_.end(), key),
                          disposal_order_.end());
    return callback;
}

void DisposalCoordinator::DestroyComponent(const ComponentKey& key, const DisposalCallback& callback) {
    // 依赖方先销毁
    for (const auto& dependent : graph_.TakeDependents(key)) {
        DisposeOne(dependent);
    }

    if (callback) {
        ATLAS_LOG_TRACE(logging::kLifecycleLoggerName, "Invoking destroy callback of '{}'", key);
        try {
            callback();
        } catch (const std::exception& e) {
            ATLAS_LOG_WARN(logging::kLifecycleLoggerName, "Destruction of component '{}' threw an exception: {}",
                           key, e.what());
            RecordError(key, e.what());
        } catch (...) {
            ATLAS_LOG_WARN(logging::kLifecycleLoggerName,
                           "Destruction of component '{}' threw an unknown exception", key);
            RecordError(key, "unknown exception");
        }
    }

    // 包含的组件随后销毁
    for (const auto& contained : graph_.TakeContained(key)) {
        DisposeOne(contained);
    }

    graph_.RemoveKey(key);
}

void DisposalCoordinator::RecordError(const ComponentKey& key, const std::string& message) {
    total_failures_.fetch_add(1);

    std::lock_guard<std::mutex> lock(error_mutex_);
    if (suppressed_errors_.size() < suppressed_error_limit_) {
        suppressed_errors_.push_back(DisposalError{key, message});
    }
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
