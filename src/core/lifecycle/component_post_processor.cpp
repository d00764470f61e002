#include "atlas/core/lifecycle/component_post_processor.h"
#include <stdexcept>

namespace atlas {
namespace core {
namespace lifecycle {

namespace {

template<typename Hook>
ComponentRef ThreadThrough(const std::vector<PostProcessorPtr>& processors, const ComponentRef& instance,
                           Hook hook) {
    ComponentRef current = instance;
    for (const auto& processor : processors) {
        ComponentRef replaced = hook(*processor, current);
        if (replaced) {
            current = replaced;
        }
    }
    return current;
}

} // namespace

void PostProcessorChain::Add(PostProcessorPtr processor) {
    if (!processor) {
        throw std::invalid_argument("Post processor must not be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    processors_.push_back(std::move(processor));
}

void PostProcessorChain::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    processors_.clear();
}

size_t PostProcessorChain::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processors_.size();
}

bool PostProcessorChain::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processors_.empty();
}

std::vector<PostProcessorPtr> PostProcessorChain::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processors_;
}

ComponentRef PostProcessorChain::ApplyBeforeInstantiation(const ComponentDescriptor& descriptor) const {
    for (const auto& processor : Snapshot()) {
        ComponentRef result = processor->BeforeInstantiation(descriptor);
        if (result) {
            return result;
        }
    }
    return ComponentRef();
}

bool PostProcessorChain::ApplyAfterInstantiation(const ComponentRef& instance, const ComponentKey& key) const {
    for (const auto& processor : Snapshot()) {
        if (!processor->AfterInstantiation(instance, key)) {
            return false;
        }
    }
    return true;
}

ComponentRef PostProcessorChain::ApplyEarlyExposure(const ComponentRef& instance, const ComponentKey& key) const {
    return ThreadThrough(Snapshot(), instance, [&key](ComponentPostProcessor& processor, const ComponentRef& current) {
        return processor.BeforeEarlyExposure(current, key);
    });
}

ComponentRef PostProcessorChain::ApplyBeforeInitialize(const ComponentRef& instance, const ComponentKey& key) const {
    return ThreadThrough(Snapshot(), instance, [&key](ComponentPostProcessor& processor, const ComponentRef& current) {
        return processor.BeforeInitialize(current, key);
    });
}

ComponentRef PostProcessorChain::ApplyAfterInitialize(const ComponentRef& instance, const ComponentKey& key) const {
    return ThreadThrough(Snapshot(), instance, [&key](ComponentPostProcessor& processor, const ComponentRef& current) {
        return processor.AfterInitialize(current, key);
    });
}

std::vector<PostProcessorPtr> PostProcessorChain::DestructionAware(const ComponentRef& instance,
                                                                   const ComponentKey& key) const {
    std::vector<PostProcessorPtr> result;
    for (const auto& processor : Snapshot()) {
        if (processor->RequiresDestruction(instance, key)) {
            result.push_back(processor);
        }
    }
    return result;
}

bool PostProcessorChain::AnyRequiresDestruction(const ComponentRef& instance, const ComponentKey& key) const {
    return !DestructionAware(instance, key).empty();
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
