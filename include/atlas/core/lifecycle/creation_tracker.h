#pragma once

#include "component_ref.h"
#include <mutex>
#include <unordered_set>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 构造追踪器，记录正在首次构造的组件键
 */
class CreationTracker {
public:
    CreationTracker() = default;
    ~CreationTracker() = default;

    // 禁止拷贝和赋值
    CreationTracker(const CreationTracker&) = delete;
    CreationTracker& operator=(const CreationTracker&) = delete;

    /**
     * @brief 标记开始构造
     * @throws AlreadyInCreationException 已在构造中
     */
    void BeginCreation(const ComponentKey& key);

    /**
     * @brief 标记构造结束（成功或失败）
     * @throws InconsistentTrackerStateException 未在构造中
     */
    void EndCreation(const ComponentKey& key);

    bool IsInCreation(const ComponentKey& key) const;

    /**
     * @brief 设置永久排除，被排除的键不参与追踪
     */
    void SetExcluded(const ComponentKey& key, bool excluded);
    bool IsExcluded(const ComponentKey& key) const;

    /**
     * @brief 无检查地移除构造标记
     */
    void Forget(const ComponentKey& key);

    std::vector<ComponentKey> GetKeysInCreation() const;

    void Clear();

private:
    mutable std::mutex mutex_;
    std::unordered_set<ComponentKey> in_creation_;
    std::unordered_set<ComponentKey> excluded_;
};

} // namespace lifecycle
} // namespace core
} // namespace atlas
