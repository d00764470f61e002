#include "atlas/core/lifecycle/component_container.h"
#include "atlas/common/spdlog/atlas_log_manager.h"

namespace atlas {
namespace core {
namespace lifecycle {

namespace logging = atlas::common::spdlog;

ComponentContainer::ComponentContainer()
    : ComponentContainer(RegistryConfig{}) {
}

ComponentContainer::ComponentContainer(const RegistryConfig& config)
    : registry_(tracker_),
      disposal_(registry_, graph_),
      pipeline_(registry_, tracker_, graph_, disposal_, descriptors_) {
    ApplyConfig(config);
}

ComponentContainer::~ComponentContainer() {
    if (config_.dispose_on_destruction) {
        Shutdown();
    }
}

void ComponentContainer::ApplyConfig(const RegistryConfig& config) {
    config_ = config;

    PipelineOptions options;
    options.allow_circular_references = config.allow_circular_references;
    options.allow_raw_injection_despite_wrapping = config.allow_raw_injection_despite_wrapping;
    pipeline_.SetOptions(options);

    registry_.SetLockingMode(config.GetLockingMode());
    disposal_.SetSuppressedErrorLimit(config.suppressed_error_limit);
}

bool ComponentContainer::ApplyConfig(const RegistryConfigLoader& loader) {
    ApplyConfig(loader.GetConfig());

    if (loader.HasLoggingSection()) {
        if (!ATLAS_LOG_MANAGER().InitializeFromJson(loader.GetLoggingSection())) {
            return false;
        }
    }

    ATLAS_LOG_INFO(logging::kLifecycleLoggerName, "Container configured: circular references {}, locking mode {}",
                   config_.allow_circular_references ? "allowed" : "forbidden", config_.locking_mode);
    return true;
}

bool ComponentContainer::RegisterDescriptor(ComponentDescriptor descriptor) {
    return descriptors_.RegisterDescriptor(std::move(descriptor));
}

void ComponentContainer::RegisterInstance(const ComponentKey& key, const ComponentRef& instance) {
    registry_.Register(key, instance);
}

void ComponentContainer::AddPostProcessor(PostProcessorPtr processor) {
    pipeline_.AddPostProcessor(std::move(processor));
}

ComponentRef ComponentContainer::GetComponent(const ComponentKey& key) {
    return pipeline_.GetComponent(key);
}

bool ComponentContainer::ContainsComponent(const ComponentKey& key) const {
    return registry_.ContainsFinished(key) || descriptors_.HasDescriptor(key);
}

void ComponentContainer::RemoveComponent(const ComponentKey& key) {
    disposal_.DisposeOne(key);
}

size_t ComponentContainer::PreInstantiateSingletons() {
    return pipeline_.PreInstantiateSingletons();
}

void ComponentContainer::Shutdown() {
    disposal_.DisposeAll();
}

void ComponentContainer::RegisterEdge(const ComponentKey& owner, const ComponentKey& dependent) {
    graph_.RegisterEdge(owner, dependent);
}

void ComponentContainer::RegisterContained(const ComponentKey& container, const ComponentKey& contained) {
    graph_.RegisterContained(container, contained);
}

void ComponentContainer::RegisterDisposal(const ComponentKey& key, DisposalCallback callback) {
    disposal_.RegisterDisposal(key, std::move(callback));
}

bool ComponentContainer::IsInCreation(const ComponentKey& key) const {
    return tracker_.IsInCreation(key);
}

std::vector<ComponentKey> ComponentContainer::DependentsOf(const ComponentKey& key) const {
    return graph_.DependentsOf(key);
}

bool ComponentContainer::ContainsFinished(const ComponentKey& key) const {
    return registry_.ContainsFinished(key);
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
