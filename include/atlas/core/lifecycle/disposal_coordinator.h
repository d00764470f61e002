#pragma once

#include "component_ref.h"
#include "dependency_graph.h"
#include "lifecycle_errors.h"
#include "object_registry.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

using DisposalCallback = std::function<void()>;

/**
 * @brief 销毁协调器
 *
 * 销毁某个键时先销毁其依赖方，再执行自身销毁回调，最后销毁其包含的组件。
 * 回调失败只记录不中断
 */
class DisposalCoordinator {
public:
    static constexpr size_t kDefaultSuppressedErrorLimit = 100;

    DisposalCoordinator(ObjectRegistry& registry, DependencyGraph& graph);
    ~DisposalCoordinator() = default;

    // 禁止拷贝和赋值
    DisposalCoordinator(const DisposalCoordinator&) = delete;
    DisposalCoordinator& operator=(const DisposalCoordinator&) = delete;

    /**
     * @brief 登记销毁回调，重复登记替换原回调但保留原顺序
     */
    void RegisterDisposal(const ComponentKey& key, DisposalCallback callback);

    bool HasDisposal(const ComponentKey& key) const;

    /**
     * @brief 已登记销毁的键，按登记顺序
     */
    std::vector<ComponentKey> GetDisposalKeys() const;

    /**
     * @brief 按登记逆序销毁全部组件，随后清空依赖图和注册表
     */
    void DisposeAll();

    /**
     * @brief 销毁单个组件及其依赖方
     */
    void DisposeOne(const ComponentKey& key);

    std::vector<DisposalError> GetSuppressedErrors() const;
    size_t GetTotalFailureCount() const { return total_failures_; }

    void SetSuppressedErrorLimit(size_t limit);
    size_t GetSuppressedErrorLimit() const;

    bool IsDisposing() const { return registry_.IsInDestruction(); }

private:
    DisposalCallback TakeDisposal(const ComponentKey& key);
    void DestroyComponent(const ComponentKey& key, const DisposalCallback& callback);
    void RecordError(const ComponentKey& key, const std::string& message);

    ObjectRegistry& registry_;
    DependencyGraph& graph_;

    mutable std::mutex disposal_mutex_;
    std::vector<ComponentKey> disposal_order_;
    std::unordered_map<ComponentKey, DisposalCallback> disposals_;

    mutable std::mutex error_mutex_;
    std::vector<DisposalError> suppressed_errors_;
    size_t suppressed_error_limit_{kDefaultSuppressedErrorLimit};
    std::atomic<size_t> total_failures_{0};
};

} // namespace lifecycle
} // namespace core
} // namespace atlas
