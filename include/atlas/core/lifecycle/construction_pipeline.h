#pragma once

#include "build_context.h"
#include "component_descriptor.h"
#include "component_post_processor.h"
#include "component_ref.h"
#include "creation_tracker.h"
#include "dependency_graph.h"
#include "descriptor_resolver.h"
#include "disposal_coordinator.h"
#include "object_registry.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <typeindex>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 已解析的依赖
 */
struct ResolvedDependency {
    ComponentKey key;
    ComponentRef value;
};

/**
 * @brief 依赖解析器
 */
class DependencyResolver {
public:
    virtual ~DependencyResolver() = default;

    /**
     * @brief 解析注入点
     * @param point 注入点
     * @param requesting_key 请求注入的组件
     * @param context 当前构造上下文（已包含 requesting_key）
     * @return 可选依赖未找到时 value 为空
     */
    virtual ResolvedDependency ResolveDependency(const DependencyPoint& point,
                                                 const ComponentKey& requesting_key,
                                                 const BuildContext& context) = 0;
};

/**
 * @brief 构造流程全局选项
 */
struct PipelineOptions {
    bool allow_circular_references = true;
    bool allow_raw_injection_despite_wrapping = false;
};

class ConstructionPipeline;

/**
 * @brief 默认依赖解析器，经流水线按键或按类型获取组件
 */
class ContainerDependencyResolver : public DependencyResolver {
public:
    explicit ContainerDependencyResolver(ConstructionPipeline& pipeline);

    ResolvedDependency ResolveDependency(const DependencyPoint& point,
                                         const ComponentKey& requesting_key,
                                         const BuildContext& context) override;

private:
    ConstructionPipeline& pipeline_;
};

/**
 * @brief 组件构造流水线
 *
 * REQUESTED -> INSTANTIATING -> EARLY_EXPOSED -> POPULATING -> INITIALIZING -> FINISHED，
 * 任一未完成阶段出错进入 FAILED
 */
class ConstructionPipeline {
public:
    ConstructionPipeline(ObjectRegistry& registry,
                         CreationTracker& tracker,
                         DependencyGraph& graph,
                         DisposalCoordinator& disposal,
                         const DescriptorResolver& descriptors);
    ~ConstructionPipeline() = default;

    // 禁止拷贝和赋值
    ConstructionPipeline(const ConstructionPipeline&) = delete;
    ConstructionPipeline& operator=(const ConstructionPipeline&) = delete;

    /**
     * @brief 获取组件，必要时构造
     * @throws ComponentNotFoundException 未定义
     * @throws ConstructionFailedException 构造失败
     * @throws AlreadyInCreationException 无法解析的循环引用
     * @throws UnresolvedRawInjectionException 早期引用被持有后实例被替换
     */
    ComponentRef GetComponent(const ComponentKey& key, const BuildContext& context = BuildContext());

    /**
     * @brief 按类型获取组件，多个候选时取主候选
     */
    ComponentRef GetComponentByType(const std::type_index& type, const BuildContext& context = BuildContext());

    /**
     * @brief 确定类型对应的唯一组件键
     * @return 无候选时返回空键
     * @throws AmbiguousComponentException 多个候选且无唯一主候选
     */
    ComponentKey DetermineCandidate(const std::type_index& type) const;

    /**
     * @brief 键是否已有实例或已定义
     */
    bool IsResolvable(const ComponentKey& key) const;

    /**
     * @brief 执行实例化、注入和初始化
     */
    ComponentRef CreateComponent(const ComponentKey& key, const ComponentDescriptor& descriptor,
                                 const BuildContext& context);

    /**
     * @brief 预先构造所有单例
     * @return 构造（或已存在）的单例数量
     */
    size_t PreInstantiateSingletons();

    void AddPostProcessor(PostProcessorPtr processor);
    const PostProcessorChain& GetPostProcessors() const { return post_processors_; }

    void SetDependencyResolver(std::shared_ptr<DependencyResolver> resolver);
    std::shared_ptr<DependencyResolver> GetDependencyResolver() const;

    void SetOptions(const PipelineOptions& options);
    PipelineOptions GetOptions() const;

    uint64_t GetBuildCount() const { return build_count_; }
    uint64_t GetFailureCount() const { return failure_count_; }

private:
    void ResolveDependsOn(const ComponentKey& key, const ComponentDescriptor& descriptor,
                          const BuildContext& context);
    void PopulateComponent(const ComponentKey& key, const ComponentDescriptor& descriptor,
                           const ComponentRef& raw, const BuildContext& context);
    ComponentRef InitializeComponent(const ComponentKey& key, const ComponentDescriptor& descriptor,
                                     const ComponentRef& raw);
    void RegisterDisposalIfNecessary(const ComponentKey& key, const ComponentDescriptor& descriptor,
                                     const ComponentRef& exposed, const ComponentRef& raw);

    /**
     * @brief 构造失败后的清理：统计失败次数；若早期引用已暴露，销毁并移除已完成的持有者
     */
    void AbortBuild(const ComponentKey& key, bool early_exposed);

    ObjectRegistry& registry_;
    CreationTracker& tracker_;
    DependencyGraph& graph_;
    DisposalCoordinator& disposal_;
    const DescriptorResolver& descriptors_;

    PostProcessorChain post_processors_;

    mutable std::mutex resolver_mutex_;
    std::shared_ptr<DependencyResolver> resolver_;

    std::atomic<bool> allow_circular_references_{true};
    std::atomic<bool> allow_raw_injection_{false};

    std::atomic<uint64_t> build_count_{0};
    std::atomic<uint64_t> failure_count_{0};
};

} // namespace lifecycle
} // namespace core
} // namespace atlas
