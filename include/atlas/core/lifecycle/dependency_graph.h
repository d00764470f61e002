#pragma once

#include "component_ref.h"
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 组件依赖图
 *
 * 边 (owner -> dependent) 表示 dependent 必须先于 owner 销毁。
 * 正向索引 owner -> dependents，反向索引 dependent -> owners，均保持插入顺序
 */
class DependencyGraph {
public:
    DependencyGraph() = default;
    ~DependencyGraph() = default;

    // 禁止拷贝和赋值
    DependencyGraph(const DependencyGraph&) = delete;
    DependencyGraph& operator=(const DependencyGraph&) = delete;

    /**
     * @brief 记录依赖边，重复注册无副作用
     */
    void RegisterEdge(const ComponentKey& owner, const ComponentKey& dependent);

    /**
     * @brief 记录包含关系，同时登记 (contained -> container) 边
     */
    void RegisterContained(const ComponentKey& container, const ComponentKey& contained);

    std::vector<ComponentKey> DependentsOf(const ComponentKey& key) const;
    std::vector<ComponentKey> DependenciesOf(const ComponentKey& key) const;
    std::vector<ComponentKey> ContainedIn(const ComponentKey& container) const;

    bool HasDependents(const ComponentKey& key) const;

    /**
     * @brief candidate 是否经正向索引可从 key 到达
     */
    bool IsTransitivelyDependent(const ComponentKey& key, const ComponentKey& candidate) const;

    /**
     * @brief 取出并移除 key 的正向依赖列表
     */
    std::vector<ComponentKey> TakeDependents(const ComponentKey& key);
    std::vector<ComponentKey> TakeContained(const ComponentKey& container);

    /**
     * @brief 从所有索引中移除 key
     */
    void RemoveKey(const ComponentKey& key);

    void Clear();

private:
    /**
     * @brief 保持插入顺序的键集合
     */
    class KeySet {
    public:
        bool Add(const ComponentKey& key);
        bool Remove(const ComponentKey& key);
        bool Contains(const ComponentKey& key) const { return index_.count(key) > 0; }
        bool Empty() const { return ordered_.empty(); }
        const std::vector<ComponentKey>& Keys() const { return ordered_; }

    private:
        std::vector<ComponentKey> ordered_;
        std::unordered_set<ComponentKey> index_;
    };

    using KeyIndex = std::unordered_map<ComponentKey, KeySet>;

    static std::vector<ComponentKey> Lookup(const KeyIndex& index, const ComponentKey& key);
    static void EraseFrom(KeyIndex& index, const ComponentKey& key);

    mutable std::mutex dependents_mutex_;
    KeyIndex dependents_;
    KeyIndex dependencies_;

    mutable std::mutex contained_mutex_;
    KeyIndex contained_;
};

} // namespace lifecycle
} // namespace core
} // namespace atlas
