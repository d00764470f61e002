#pragma once

#include "component_descriptor.h"
#include "component_ref.h"
#include <memory>
#include <mutex>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 组件后处理器
 *
 * 各钩子返回空 ComponentRef 表示不替换实例
 */
class ComponentPostProcessor {
public:
    virtual ~ComponentPostProcessor() = default;

    /**
     * @brief 实例化之前调用，返回非空实例则跳过默认构造流程
     */
    virtual ComponentRef BeforeInstantiation(const ComponentDescriptor& descriptor) {
        (void)descriptor;
        return ComponentRef();
    }

    /**
     * @brief 实例化之后、注入之前调用，返回 false 跳过依赖注入
     */
    virtual bool AfterInstantiation(const ComponentRef& instance, const ComponentKey& key) {
        (void)instance;
        (void)key;
        return true;
    }

    /**
     * @brief 生成早期引用时调用，可返回包装后的早期实例
     */
    virtual ComponentRef BeforeEarlyExposure(const ComponentRef& instance, const ComponentKey& key) {
        (void)instance;
        (void)key;
        return ComponentRef();
    }

    virtual ComponentRef BeforeInitialize(const ComponentRef& instance, const ComponentKey& key) {
        (void)instance;
        (void)key;
        return ComponentRef();
    }

    virtual ComponentRef AfterInitialize(const ComponentRef& instance, const ComponentKey& key) {
        (void)instance;
        (void)key;
        return ComponentRef();
    }

    /**
     * @brief 该实例销毁时是否需要本处理器参与
     */
    virtual bool RequiresDestruction(const ComponentRef& instance, const ComponentKey& key) {
        (void)instance;
        (void)key;
        return false;
    }

    virtual void BeforeDestruction(const ComponentRef& instance, const ComponentKey& key) {
        (void)instance;
        (void)key;
    }
};

using PostProcessorPtr = std::shared_ptr<ComponentPostProcessor>;

/**
 * @brief 后处理器链，按注册顺序调用并传递可能被替换的实例
 */
class PostProcessorChain {
public:
    PostProcessorChain() = default;

    // 禁止拷贝和赋值
    PostProcessorChain(const PostProcessorChain&) = delete;
    PostProcessorChain& operator=(const PostProcessorChain&) = delete;

    void Add(PostProcessorPtr processor);
    void Clear();
    size_t Size() const;
    bool Empty() const;

    /**
     * @brief 当前处理器列表的快照
     */
    std::vector<PostProcessorPtr> Snapshot() const;

    /**
     * @brief 第一个返回非空实例的处理器生效
     */
    ComponentRef ApplyBeforeInstantiation(const ComponentDescriptor& descriptor) const;

    /**
     * @brief 任一处理器返回 false 即停止并返回 false
     */
    bool ApplyAfterInstantiation(const ComponentRef& instance, const ComponentKey& key) const;

    ComponentRef ApplyEarlyExposure(const ComponentRef& instance, const ComponentKey& key) const;
    ComponentRef ApplyBeforeInitialize(const ComponentRef& instance, const ComponentKey& key) const;
    ComponentRef ApplyAfterInitialize(const ComponentRef& instance, const ComponentKey& key) const;

    /**
     * @brief 需要参与该实例销毁的处理器
     */
    std::vector<PostProcessorPtr> DestructionAware(const ComponentRef& instance, const ComponentKey& key) const;

    bool AnyRequiresDestruction(const ComponentRef& instance, const ComponentKey& key) const;

private:
    mutable std::mutex mutex_;
    std::vector<PostProcessorPtr> processors_;
};

} // namespace lifecycle
} // namespace core
} // namespace atlas
