#include "atlas/core/lifecycle/construction_pipeline.h"
#include "atlas/core/lifecycle/lifecycle_errors.h"
#include "atlas/common/spdlog/atlas_log_manager.h"
#include <algorithm>
#include <optional>

namespace atlas {
namespace core {
namespace lifecycle {

namespace logging = atlas::common::spdlog;

ContainerDependencyResolver::ContainerDependencyResolver(ConstructionPipeline& pipeline)
    : pipeline_(pipeline) {
}

ResolvedDependency ContainerDependencyResolver::ResolveDependency(const DependencyPoint& point,
                                                                  const ComponentKey& requesting_key,
                                                                  const BuildContext& context) {
    ComponentKey target = point.target_key;

    if (target.empty()) {
        if (!point.target_type) {
            throw ComponentNotFoundException(requesting_key,
                "Injection point '" + point.name + "' of '" + requesting_key + "' declares neither key nor type");
        }

        target = pipeline_.DetermineCandidate(*point.target_type);
        if (target.empty()) {
            if (!point.required) {
                return ResolvedDependency{};
            }
            throw ComponentNotFoundException(requesting_key,
                "No component of type " + std::string(point.target_type->name()) +
                " available for injection point '" + point.name + "' of '" + requesting_key + "'");
        }
    } else if (!point.required && !pipeline_.IsResolvable(target)) {
        return ResolvedDependency{};
    }

    return ResolvedDependency{target, pipeline_.GetComponent(target, context)};
}

ConstructionPipeline::ConstructionPipeline(ObjectRegistry& registry,
                                           CreationTracker& tracker,
                                           DependencyGraph& graph,
                                           DisposalCoordinator& disposal,
                                           const DescriptorResolver& descriptors)
    : registry_(registry),
      tracker_(tracker),
      graph_(graph),
      disposal_(disposal),
      descriptors_(descriptors) {
    resolver_ = std::make_shared<ContainerDependencyResolver>(*this);
}

ComponentRef ConstructionPipeline::GetComponent(const ComponentKey& key, const BuildContext& context) {
    LookupResult cached = registry_.Get(key);
    if (cached.IsFinished()) {
        return cached.instance;
    }
    if (cached.IsEarly()) {
        ATLAS_LOG_TRACE(logging::kLifecycleLoggerName,
                        "Returning early reference of '{}' that is not fully initialized yet ({})",
                        key, context.Describe());
        return cached.instance;
    }

    DescriptorPtr descriptor = descriptors_.Resolve(key);
    if (!descriptor) {
        throw ComponentNotFoundException(key);
    }

    ResolveDependsOn(key, *descriptor, context);

    if (descriptor->IsSingleton()) {
        const BuildContext nested = context.Enter(key);
        return registry_.GetOrCreate(key, [this, &key, &descriptor, &nested]() {
            return CreateComponent(key, *descriptor, nested);
        }, context);
    }

    if (context.Contains(key)) {
        throw AlreadyInCreationException(key, "prototype requested again while building " + context.Describe());
    }

    return CreateComponent(key, *descriptor, context.Enter(key));
}

ComponentRef ConstructionPipeline::GetComponentByType(const std::type_index& type, const BuildContext& context) {
    ComponentKey key = DetermineCandidate(type);
    if (key.empty()) {
        throw ComponentNotFoundException(key, "No component of type " + std::string(type.name()) + " is defined");
    }
    return GetComponent(key, context);
}

ComponentKey ConstructionPipeline::DetermineCandidate(const std::type_index& type) const {
    std::vector<ComponentKey> candidates = descriptors_.FindKeysForType(type);

    // 直接注册的实例没有描述，按实例类型匹配
    for (const auto& key : registry_.GetRegisteredKeys()) {
        if (std::find(candidates.begin(), candidates.end(), key) != candidates.end()) {
            continue;
        }
        if (descriptors_.Resolve(key)) {
            continue;
        }
        LookupResult found = registry_.Get(key, false);
        if (found.IsFinished() && found.instance.Exposes(type)) {
            candidates.push_back(key);
        }
    }

    if (candidates.empty()) {
        return ComponentKey();
    }
    if (candidates.size() == 1) {
        return candidates.front();
    }

    std::vector<ComponentKey> primaries;
    for (const auto& key : candidates) {
        DescriptorPtr descriptor = descriptors_.Resolve(key);
        if (descriptor && descriptor->primary) {
            primaries.push_back(key);
        }
    }

    if (primaries.size() == 1) {
        return primaries.front();
    }

    throw AmbiguousComponentException(type.name(), candidates);
}

bool ConstructionPipeline::IsResolvable(const ComponentKey& key) const {
    return registry_.ContainsFinished(key) || descriptors_.Resolve(key) != nullptr;
}

ComponentRef ConstructionPipeline::CreateComponent(const ComponentKey& key, const ComponentDescriptor& descriptor,
                                                   const BuildContext& context) {
    BuildStage stage = BuildStage::INSTANTIATING;
    bool early_exposure = false;
    build_count_.fetch_add(1);

    ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Creating instance of component '{}'", key);

    try {
        if (!descriptor.synthetic) {
            ComponentRef shortcut = post_processors_.ApplyBeforeInstantiation(descriptor);
            if (shortcut) {
                stage = BuildStage::INITIALIZING;
                ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Instantiation of '{}' short-circuited by hook", key);
                return post_processors_.ApplyAfterInitialize(shortcut, key);
            }
        }

        if (!descriptor.produce) {
            throw ConstructionFailedException(key, stage, "no production callback defined");
        }

        ComponentRef raw = descriptor.produce(key, descriptor);
        if (!raw) {
            throw ConstructionFailedException(key, stage, "production callback returned no instance");
        }

        early_exposure = descriptor.IsSingleton() &&
                         allow_circular_references_ &&
                         descriptor.allow_circular_references &&
                         tracker_.IsInCreation(key);
        if (early_exposure) {
            stage = BuildStage::EARLY_EXPOSED;
            ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName,
                            "Eagerly caching '{}' to allow for resolving potential circular references", key);
            const bool synthetic = descriptor.synthetic;
            registry_.RegisterEarlyFactory(key, [this, key, raw, synthetic]() {
                return synthetic ? raw : post_processors_.ApplyEarlyExposure(raw, key);
            });
        }

        stage = BuildStage::POPULATING;
        PopulateComponent(key, descriptor, raw, context);

        stage = BuildStage::INITIALIZING;
        ComponentRef exposed = InitializeComponent(key, descriptor, raw);

        if (early_exposure) {
            LookupResult early = registry_.Get(key, false);
            if (early.IsEarly()) {
                if (exposed.SameInstance(raw)) {
                    exposed = early.instance;
                } else if (!allow_raw_injection_) {
                    std::vector<ComponentKey> holders = graph_.DependenciesOf(key);
                    if (!holders.empty()) {
                        throw UnresolvedRawInjectionException(key, holders);
                    }
                }
            }
        }

        if (descriptor.IsSingleton()) {
            RegisterDisposalIfNecessary(key, descriptor, exposed, raw);
        }

        ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Finished creating instance of component '{}'", key);
        return exposed;

    } catch (const AlreadyInCreationException&) {
        AbortBuild(key, early_exposure);
        throw;
    } catch (const UnresolvedRawInjectionException& e) {
        ATLAS_LOG_WARN(logging::kLifecycleLoggerName, "{}", e.what());
        AbortBuild(key, early_exposure);
        throw;
    } catch (const InconsistentTrackerStateException&) {
        AbortBuild(key, early_exposure);
        throw;
    } catch (const CreationNotAllowedException&) {
        AbortBuild(key, early_exposure);
        throw;
    } catch (const ConstructionFailedException& e) {
        AbortBuild(key, early_exposure);
        if (e.GetKey() == key) {
            ATLAS_LOG_WARN(logging::kLifecycleLoggerName, "{}", e.what());
            throw;
        }
        throw ConstructionFailedException(key, stage, std::current_exception());
    } catch (const std::exception& e) {
        ATLAS_LOG_WARN(logging::kLifecycleLoggerName, "Creation of component '{}' failed at stage {}: {}",
                       key, ToString(stage), e.what());
        AbortBuild(key, early_exposure);
        throw ConstructionFailedException(key, stage, std::current_exception());
    } catch (...) {
        ATLAS_LOG_WARN(logging::kLifecycleLoggerName, "Creation of component '{}' failed at stage {}: unknown error",
                       key, ToString(stage));
        AbortBuild(key, early_exposure);
        throw ConstructionFailedException(key, stage, std::current_exception());
    }
}

size_t ConstructionPipeline::PreInstantiateSingletons() {
    ATLAS_LOG_DEBUG(logging::kLifecycleLoggerName, "Pre-instantiating singletons");

    size_t count = 0;
    for (const auto& key : descriptors_.GetDescriptorKeys()) {
        DescriptorPtr descriptor = descriptors_.Resolve(key);
        if (!descriptor || !descriptor->IsSingleton()) {
            continue;
        }
        GetComponent(key);
        ++count;
    }

    return count;
}

void ConstructionPipeline::AddPostProcessor(PostProcessorPtr processor) {
    post_processors_.Add(std::move(processor));
}

void ConstructionPipeline::SetDependencyResolver(std::shared_ptr<DependencyResolver> resolver) {
    std::lock_guard<std::mutex> lock(resolver_mutex_);
    if (resolver) {
        resolver_ = std::move(resolver);
    } else {
        resolver_ = std::make_shared<ContainerDependencyResolver>(*this);
    }
}

std::shared_ptr<DependencyResolver> ConstructionPipeline::GetDependencyResolver() const {
    std::lock_guard<std::mutex> lock(resolver_mutex_);
    return resolver_;
}

void ConstructionPipeline::SetOptions(const PipelineOptions& options) {
    allow_circular_references_ = options.allow_circular_references;
    allow_raw_injection_ = options.allow_raw_injection_despite_wrapping;
}

PipelineOptions ConstructionPipeline::GetOptions() const {
    PipelineOptions options;
    options.allow_circular_references = allow_circular_references_;
    options.allow_raw_injection_despite_wrapping = allow_raw_injection_;
    return options;
}

void ConstructionPipeline::ResolveDependsOn(const ComponentKey& key, const ComponentDescriptor& descriptor,
                                            const BuildContext& context) {
    for (const auto& dependency : descriptor.depends_on) {
        if (graph_.IsTransitivelyDependent(dependency, key)) {
            throw ConstructionFailedException(key, BuildStage::REQUESTED,
                "Circular depends-on relationship between '" + key + "' and '" + dependency + "'");
        }

        graph_.RegisterEdge(key, dependency);

        try {
            GetComponent(dependency, context.Enter(key));
        } catch (const ComponentNotFoundException&) {
            throw ConstructionFailedException(key, BuildStage::REQUESTED, std::current_exception());
        } catch (const ConstructionFailedException& e) {
            if (e.GetKey() == key) {
                throw;
            }
            throw ConstructionFailedException(key, BuildStage::REQUESTED, std::current_exception());
        }
    }
}

void ConstructionPipeline::PopulateComponent(const ComponentKey& key, const ComponentDescriptor& descriptor,
                                             const ComponentRef& raw, const BuildContext& context) {
    if (!descriptor.synthetic && !post_processors_.ApplyAfterInstantiation(raw, key)) {
        ATLAS_LOG_TRACE(logging::kLifecycleLoggerName, "Population of '{}' skipped by hook", key);
        return;
    }

    if (descriptor.dependencies.empty()) {
        return;
    }

    std::shared_ptr<DependencyResolver> resolver = GetDependencyResolver();

    for (const auto& point : descriptor.dependencies) {
        ResolvedDependency resolved = resolver->ResolveDependency(point, key, context);
        if (!resolved.value) {
            ATLAS_LOG_TRACE(logging::kLifecycleLoggerName, "Optional dependency '{}' of '{}' not available",
                            point.name, key);
            continue;
        }

        graph_.RegisterEdge(key, resolved.key);

        if (point.inject) {
            point.inject(raw, resolved.value);
        }
    }
}

ComponentRef ConstructionPipeline::InitializeComponent(const ComponentKey& key, const ComponentDescriptor& descriptor,
                                                       const ComponentRef& raw) {
    ComponentRef current = raw;

    if (!descriptor.synthetic) {
        current = post_processors_.ApplyBeforeInitialize(current, key);
    }

    for (const auto& init : descriptor.init_methods) {
        ATLAS_LOG_TRACE(logging::kLifecycleLoggerName, "Invoking init method '{}' on '{}'", init.name, key);
        if (init.callback) {
            init.callback(current);
        }
    }

    if (!descriptor.synthetic) {
        current = post_processors_.ApplyAfterInitialize(current, key);
    }

    return current;
}

void ConstructionPipeline::AbortBuild(const ComponentKey& key, bool early_exposed) {
    failure_count_.fetch_add(1);
    if (!early_exposed) {
        return;
    }

    // 持有 key 早期引用的组件已经完成，它们引用的对象不会被发布
    std::vector<ComponentKey> holders = graph_.DependenciesOf(key);
    graph_.RemoveKey(key);

    for (const auto& holder : holders) {
        if (!registry_.ContainsFinished(holder)) {
            continue;
        }
        ATLAS_LOG_WARN(logging::kLifecycleLoggerName,
                       "Disposing '{}' which holds an early reference of failed component '{}'", holder, key);
        disposal_.DisposeOne(holder);
    }
}

void ConstructionPipeline::RegisterDisposalIfNecessary(const ComponentKey& key, const ComponentDescriptor& descriptor,
                                                       const ComponentRef& exposed, const ComponentRef& raw) {
    std::vector<PostProcessorPtr> hooks;
    if (!descriptor.synthetic) {
        hooks = post_processors_.DestructionAware(exposed, key);
    }

    if (!descriptor.destroy_method && hooks.empty()) {
        return;
    }

    std::optional<NamedCallback> destroy = descriptor.destroy_method;
    disposal_.RegisterDisposal(key, [key, exposed, raw, hooks, destroy]() {
        for (const auto& hook : hooks) {
            hook->BeforeDestruction(exposed, key);
        }
        if (destroy && destroy->callback) {
            destroy->callback(raw);
        }
    });
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
