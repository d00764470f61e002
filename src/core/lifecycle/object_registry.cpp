#include "atlas/core/lifecycle/object_registry.h"
#include "atlas/core/lifecycle/lifecycle_errors.h"
#include "atlas/common/spdlog/atlas_log_manager.h"
#include <algorithm>
#include <stdexcept>

namespace atlas {
namespace core {
namespace lifecycle {

namespace logging = atlas::common::spdlog;

ObjectRegistry::ObjectRegistry(CreationTracker& tracker)
    : tracker_(tracker) {
}

LookupResult ObjectRegistry::Get(const ComponentKey& key, bool allow_early_reference) {
    bool own_build = false;
    {
        std::lock_guard<std::mutex> cache(cache_mutex_);

        auto finished = finished_.find(key);
        if (finished != finished_.end()) {
            return LookupResult::Finished(finished->second);
        }

        if (!tracker_.IsInCreation(key)) {
            return LookupResult::Absent();
        }

        // 早期引用只交给正在构造它的线程
        auto creator = creators_.find(key);
        if (creator != creators_.end() && creator->second != std::this_thread::get_id()) {
            return LookupResult::Absent();
        }
        own_build = creator != creators_.end();

        auto early = early_objects_.find(key);
        if (early != early_objects_.end()) {
            return LookupResult::Early(early->second);
        }

        if (!allow_early_reference || early_factories_.find(key) == early_factories_.end()) {
            return LookupResult::Absent();
        }
    }

    // 本线程正在构造该键时等待构造锁，否则只尝试获取
    std::unique_lock<std::recursive_mutex> construction(construction_lock_, std::defer_lock);
    if (own_build) {
        construction.lock();
    } else if (!construction.try_lock()) {
        return LookupResult::Absent();
    }

    EarlyFactory factory;
    {
        std::lock_guard<std::mutex> cache(cache_mutex_);

        auto finished = finished_.find(key);
        if (finished != finished_.end()) {
            return LookupResult::Finished(finished->second);
        }

        auto early = early_objects_.find(key);
        if (early != early_objects_.end()) {
            return LookupResult::Early(early->second);
        }

        auto it = early_factories_.find(key);
        if (it == early_factories_.end()) {
            return LookupResult::Absent();
        }
        factory = it->second;
    }

    ComponentRef early_instance = factory();

    std::lock_guard<std::mutex> cache(cache_mutex_);
    if (early_factories_.erase(key) > 0 && early_instance) {
        early_objects_[key] = early_instance;
        ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Materialized early reference of '{}'", key);
        return LookupResult::Early(early_instance);
    }

    auto finished = finished_.find(key);
    if (finished != finished_.end()) {
        return LookupResult::Finished(finished->second);
    }

    auto early = early_objects_.find(key);
    if (early != early_objects_.end()) {
        return LookupResult::Early(early->second);
    }

    return LookupResult::Absent();
}

ComponentRef ObjectRegistry::GetOrCreate(const ComponentKey& key, const ProduceCallback& produce,
                                         const BuildContext& context) {
    uint64_t observed = 0;
    {
        std::lock_guard<std::mutex> cache(cache_mutex_);

        auto finished = finished_.find(key);
        if (finished != finished_.end()) {
            return finished->second;
        }

        auto completed = completed_.find(key);
        if (completed != completed_.end()) {
            observed = completed->second;
        }
    }

    const std::thread::id self = std::this_thread::get_id();
    std::unique_lock<std::recursive_mutex> construction;
    bool claimed = false;

    while (true) {
        construction = AcquireConstructionLock(key, context);
        std::unique_lock<std::mutex> cache(cache_mutex_);

        auto finished = finished_.find(key);
        if (finished != finished_.end()) {
            return finished->second;
        }

        // 与本次调用重叠的构造失败，直接抛出同一异常对象
        auto failure = failures_.find(key);
        if (failure != failures_.end() && failure->second.sequence > observed) {
            std::rethrow_exception(failure->second.error);
        }

        auto creator = creators_.find(key);
        if (creator == creators_.end()) {
            creators_[key] = self;
            claimed = true;
            break;
        }

        if (creator->second == self) {
            break;
        }

        if (!context.IsRoot()) {
            throw AlreadyInCreationException(key, "being created by another thread while building " +
                                                  context.Describe());
        }

        if (construction.owns_lock()) {
            construction.unlock();
        }
        cache_cv_.wait(cache, [this, &key]() { return creators_.find(key) == creators_.end(); });
    }

    if (in_destruction_) {
        if (claimed) {
            ReleaseClaim(key);
        }
        throw CreationNotAllowedException(key);
    }

    try {
        tracker_.BeginCreation(key);
    } catch (...) {
        if (claimed) {
            ReleaseClaim(key);
        }
        throw;
    }

    ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Creating shared instance of '{}'", key);

    ComponentRef instance;
    std::exception_ptr error;
    try {
        instance = produce();
        if (!instance) {
            throw ConstructionFailedException(key, BuildStage::INSTANTIATING, "production returned no instance");
        }
    } catch (...) {
        error = std::current_exception();
    }

    try {
        tracker_.EndCreation(key);
    } catch (...) {
        if (!error) {
            error = std::current_exception();
        }
    }

    FinishedCallback callback;
    {
        std::lock_guard<std::mutex> cache(cache_mutex_);

        uint64_t sequence = ++completed_[key];
        early_factories_.erase(key);
        early_objects_.erase(key);

        if (!error) {
            auto inserted = finished_.emplace(key, instance);
            if (!inserted.second) {
                instance = inserted.first->second;
            }
            AddRegisteredKey(key);
            failures_.erase(key);

            auto it = finished_callbacks_.find(key);
            if (it != finished_callbacks_.end()) {
                callback = std::move(it->second);
                finished_callbacks_.erase(it);
            }
        } else {
            failures_[key] = Failure{sequence, error};
        }

        if (claimed) {
            creators_.erase(key);
        }
    }
    cache_cv_.notify_all();

    if (error) {
        ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Creation of '{}' failed: {}", key, DescribeException(error));
        std::rethrow_exception(error);
    }

    ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Finished shared instance of '{}'", key);

    if (construction.owns_lock()) {
        construction.unlock();
    }
    if (callback) {
        callback(key, instance);
    }

    return instance;
}

void ObjectRegistry::RegisterEarlyFactory(const ComponentKey& key, EarlyFactory factory) {
    if (!factory) {
        throw std::invalid_argument("Early factory for '" + key + "' must not be empty");
    }

    std::lock_guard<std::mutex> cache(cache_mutex_);

    if (finished_.find(key) != finished_.end()) {
        return;
    }

    early_factories_[key] = std::move(factory);
    early_objects_.erase(key);
}

void ObjectRegistry::Register(const ComponentKey& key, const ComponentRef& instance) {
    if (!instance) {
        throw std::invalid_argument("Instance registered under '" + key + "' must not be empty");
    }

    std::unique_lock<std::recursive_mutex> construction(construction_lock_);

    FinishedCallback callback;
    {
        std::lock_guard<std::mutex> cache(cache_mutex_);

        if (finished_.find(key) != finished_.end()) {
            throw DuplicateComponentException(key);
        }

        finished_[key] = instance;
        early_factories_.erase(key);
        early_objects_.erase(key);
        failures_.erase(key);
        AddRegisteredKey(key);

        auto it = finished_callbacks_.find(key);
        if (it != finished_callbacks_.end()) {
            callback = std::move(it->second);
            finished_callbacks_.erase(it);
        }
    }

    ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Registered pre-built instance '{}'", key);

    construction.unlock();
    if (callback) {
        callback(key, instance);
    }
}

void ObjectRegistry::Remove(const ComponentKey& key) {
    std::lock_guard<std::recursive_mutex> construction(construction_lock_);

    {
        std::lock_guard<std::mutex> cache(cache_mutex_);
        finished_.erase(key);
        early_objects_.erase(key);
        early_factories_.erase(key);
        failures_.erase(key);
        finished_callbacks_.erase(key);
        RemoveRegisteredKey(key);
    }

    tracker_.Forget(key);
}

void ObjectRegistry::Clear() {
    std::lock_guard<std::recursive_mutex> construction(construction_lock_);

    {
        std::lock_guard<std::mutex> cache(cache_mutex_);
        finished_.clear();
        early_objects_.clear();
        early_factories_.clear();
        failures_.clear();
        finished_callbacks_.clear();
        registered_order_.clear();
        registered_set_.clear();
    }

    tracker_.Clear();
    in_destruction_ = false;
}

bool ObjectRegistry::ContainsFinished(const ComponentKey& key) const {
    std::lock_guard<std::mutex> cache(cache_mutex_);
    return finished_.find(key) != finished_.end();
}

bool ObjectRegistry::HasEarlyReference(const ComponentKey& key) const {
    std::lock_guard<std::mutex> cache(cache_mutex_);
    return early_objects_.find(key) != early_objects_.end() ||
           early_factories_.find(key) != early_factories_.end();
}

std::vector<ComponentKey> ObjectRegistry::GetRegisteredKeys() const {
    std::lock_guard<std::mutex> cache(cache_mutex_);
    return registered_order_;
}

size_t ObjectRegistry::GetRegisteredCount() const {
    std::lock_guard<std::mutex> cache(cache_mutex_);
    return registered_order_.size();
}

void ObjectRegistry::SetFinishedCallback(const ComponentKey& key, FinishedCallback callback) {
    if (!callback) {
        return;
    }

    ComponentRef instance;
    {
        std::lock_guard<std::mutex> cache(cache_mutex_);

        auto finished = finished_.find(key);
        if (finished == finished_.end()) {
            finished_callbacks_[key] = std::move(callback);
            return;
        }
        instance = finished->second;
    }

    callback(key, instance);
}

std::unique_lock<std::recursive_mutex> ObjectRegistry::AcquireConstructionLock(const ComponentKey& key,
                                                                               const BuildContext& context) {
    std::unique_lock<std::recursive_mutex> lock(construction_lock_, std::try_to_lock);
    if (lock.owns_lock()) {
        return lock;
    }

    if (locking_mode_ == LockingMode::LENIENT && context.IsRoot()) {
        ATLAS_LOG_INFO(logging::kLifecycleLoggerName,
                       "Construction lock held by another thread, creating '{}' without it", key);
        return lock;
    }

    lock.lock();
    return lock;
}

void ObjectRegistry::ReleaseClaim(const ComponentKey& key) {
    {
        std::lock_guard<std::mutex> cache(cache_mutex_);
        creators_.erase(key);
    }
    cache_cv_.notify_all();
}

void ObjectRegistry::AddRegisteredKey(const ComponentKey& key) {
    if (registered_set_.insert(key).second) {
        registered_order_.push_back(key);
    }
}

void ObjectRegistry::RemoveRegisteredKey(const ComponentKey& key) {
    if (registered_set_.erase(key) > 0) {
        registered_order_.erase(std::remove(registered_order_.begin(), registered_order_.end(), key),
                                registered_order_.end());
    }
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
