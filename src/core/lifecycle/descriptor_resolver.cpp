#include "atlas/core/lifecycle/descriptor_resolver.h"
#include "atlas/common/spdlog/atlas_log_manager.h"
#include <algorithm>

namespace atlas {
namespace core {
namespace lifecycle {

namespace logging = atlas::common::spdlog;

bool DescriptorRegistry::RegisterDescriptor(ComponentDescriptor descriptor) {
    if (descriptor.key.empty()) {
        ATLAS_LOG_ERROR(logging::kLifecycleLoggerName, "Component key cannot be empty");
        return false;
    }

    if (!descriptor.produce) {
        ATLAS_LOG_ERROR(logging::kLifecycleLoggerName, "Component '{}' has no production callback", descriptor.key);
        return false;
    }

    const ComponentKey key = descriptor.key;

    std::lock_guard<std::mutex> lock(mutex_);

    if (descriptors_.find(key) != descriptors_.end()) {
        ATLAS_LOG_ERROR(logging::kLifecycleLoggerName, "Component '{}' is already defined", key);
        return false;
    }

    descriptors_[key] = std::make_shared<const ComponentDescriptor>(std::move(descriptor));
    order_.push_back(key);

    ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Component '{}' defined", key);
    return true;
}

bool DescriptorRegistry::RemoveDescriptor(const ComponentKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (descriptors_.erase(key) == 0) {
        return false;
    }

    order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
    return true;
}

bool DescriptorRegistry::HasDescriptor(const ComponentKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return descriptors_.find(key) != descriptors_.end();
}

std::vector<ComponentKey> DescriptorRegistry::GetDescriptorKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

size_t DescriptorRegistry::GetDescriptorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

DescriptorPtr DescriptorRegistry::Resolve(const ComponentKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = descriptors_.find(key);
    if (it != descriptors_.end()) {
        return it->second;
    }

    return nullptr;
}

std::vector<ComponentKey> DescriptorRegistry::FindKeysForType(const std::type_index& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ComponentKey> result;

    for (const auto& key : order_) {
        if (descriptors_.at(key)->Exposes(type)) {
            result.push_back(key);
        }
    }

    return result;
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
