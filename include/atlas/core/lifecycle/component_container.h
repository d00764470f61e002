#pragma once

#include "component_descriptor.h"
#include "component_post_processor.h"
#include "component_ref.h"
#include "construction_pipeline.h"
#include "creation_tracker.h"
#include "dependency_graph.h"
#include "descriptor_resolver.h"
#include "disposal_coordinator.h"
#include "lifecycle_errors.h"
#include "object_registry.h"
#include "registry_config.h"
#include <memory>
#include <typeindex>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 组件容器
 *
 * 持有构造追踪器、依赖图、注册表、销毁协调器、描述表和构造流水线，
 * 对外提供组件定义、获取和销毁接口
 */
class ComponentContainer {
public:
    ComponentContainer();
    explicit ComponentContainer(const RegistryConfig& config);

    /**
     * @brief 配置了 dispose_on_destruction 时销毁全部组件
     */
    ~ComponentContainer();

    // 禁止拷贝和赋值
    ComponentContainer(const ComponentContainer&) = delete;
    ComponentContainer& operator=(const ComponentContainer&) = delete;

    /**
     * @brief 应用配置
     */
    void ApplyConfig(const RegistryConfig& config);

    /**
     * @brief 应用加载好的配置，存在 logging 段时初始化日志
     * @return 日志初始化失败时返回false
     */
    bool ApplyConfig(const RegistryConfigLoader& loader);

    const RegistryConfig& GetConfig() const { return config_; }

    // ---- 组件定义 ----

    bool RegisterDescriptor(ComponentDescriptor descriptor);

    template<typename T, typename... Exposed>
    bool RegisterComponent(const ComponentKey& key) {
        return RegisterDescriptor(MakeDescriptor<T, Exposed...>(key));
    }

    /**
     * @brief 注册已构建好的实例
     * @throws DuplicateComponentException 键已绑定实例
     */
    void RegisterInstance(const ComponentKey& key, const ComponentRef& instance);

    template<typename T, typename... Exposed>
    void RegisterInstance(const ComponentKey& key, std::shared_ptr<T> instance) {
        RegisterInstance(key, ComponentRef::Of<T, Exposed...>(std::move(instance)));
    }

    void AddPostProcessor(PostProcessorPtr processor);

    // ---- 组件获取 ----

    ComponentRef GetComponent(const ComponentKey& key);

    /**
     * @brief 按键获取具体类型的组件
     * @throws ComponentNotFoundException 组件类型不是 T
     */
    template<typename T>
    std::shared_ptr<T> GetComponent(const ComponentKey& key) {
        auto typed = GetComponent(key).template As<T>();
        if (!typed) {
            throw ComponentNotFoundException(key, "Component '" + key + "' is not of type " + typeid(T).name());
        }
        return typed;
    }

    /**
     * @brief 按类型获取唯一（或主）组件
     */
    template<typename T>
    std::shared_ptr<T> GetComponent() {
        auto typed = pipeline_.GetComponentByType(std::type_index(typeid(T))).template As<T>();
        if (!typed) {
            throw ComponentNotFoundException(ComponentKey(), std::string("No component of type ") + typeid(T).name());
        }
        return typed;
    }

    bool ContainsComponent(const ComponentKey& key) const;

    /**
     * @brief 销毁并移除单个组件及依赖它的组件
     */
    void RemoveComponent(const ComponentKey& key);

    size_t PreInstantiateSingletons();

    /**
     * @brief 销毁全部组件
     */
    void Shutdown();

    // ---- 协作方接口 ----

    void RegisterEdge(const ComponentKey& owner, const ComponentKey& dependent);
    void RegisterContained(const ComponentKey& container, const ComponentKey& contained);
    void RegisterDisposal(const ComponentKey& key, DisposalCallback callback);
    bool IsInCreation(const ComponentKey& key) const;
    std::vector<ComponentKey> DependentsOf(const ComponentKey& key) const;
    bool ContainsFinished(const ComponentKey& key) const;

    ObjectRegistry& GetRegistry() { return registry_; }
    CreationTracker& GetTracker() { return tracker_; }
    DependencyGraph& GetGraph() { return graph_; }
    DisposalCoordinator& GetDisposal() { return disposal_; }
    DescriptorRegistry& GetDescriptors() { return descriptors_; }
    ConstructionPipeline& GetPipeline() { return pipeline_; }

private:
    RegistryConfig config_;
    CreationTracker tracker_;
    DependencyGraph graph_;
    ObjectRegistry registry_;
    DisposalCoordinator disposal_;
    DescriptorRegistry descriptors_;
    ConstructionPipeline pipeline_;
};

} // namespace lifecycle
} // namespace core
} // namespace atlas
