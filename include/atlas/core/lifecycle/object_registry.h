#pragma once

#include "build_context.h"
#include "component_ref.h"
#include "creation_tracker.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 构造锁策略
 */
enum class LockingMode {
    STRICT,    // 同键请求一律阻塞等待构造锁
    LENIENT    // 顶层请求在锁被占用时可无锁构造
};

using EarlyFactory = std::function<ComponentRef()>;
using ProduceCallback = std::function<ComponentRef()>;
using FinishedCallback = std::function<void(const ComponentKey&, const ComponentRef&)>;

/**
 * @brief 单例对象注册表
 *
 * 三级缓存：已完成实例、早期引用实例、早期引用工厂。
 * 构造锁（可重入）保护实例的构造与发布以及早期引用的生成；
 * 缓存锁保护各级缓存，加锁顺序为先构造锁后缓存锁。
 */
class ObjectRegistry {
public:
    explicit ObjectRegistry(CreationTracker& tracker);
    ~ObjectRegistry() = default;

    // 禁止拷贝和赋值
    ObjectRegistry(const ObjectRegistry&) = delete;
    ObjectRegistry& operator=(const ObjectRegistry&) = delete;

    /**
     * @brief 查询实例
     *
     * 只在本线程正在构造该键、需要由早期工厂生成早期引用时等待构造锁，其余情况不阻塞
     * @param key 组件键
     * @param allow_early_reference 是否允许由早期工厂生成早期引用
     * @return 已完成实例、早期引用或不存在
     */
    LookupResult Get(const ComponentKey& key, bool allow_early_reference = true);

    /**
     * @brief 获取已完成实例，不存在则调用 produce 构造并发布
     *
     * 同键并发调用至多执行一次 produce，其余调用方得到同一实例或同一异常对象
     * @throws AlreadyInCreationException 同线程重入或嵌套请求与他线程构造冲突
     * @throws CreationNotAllowedException 批量销毁进行中
     */
    ComponentRef GetOrCreate(const ComponentKey& key, const ProduceCallback& produce,
                             const BuildContext& context = BuildContext());

    /**
     * @brief 登记早期引用工厂，键已完成时忽略
     */
    void RegisterEarlyFactory(const ComponentKey& key, EarlyFactory factory);

    /**
     * @brief 直接注册已构建好的实例
     * @throws DuplicateComponentException 键已绑定实例
     */
    void Register(const ComponentKey& key, const ComponentRef& instance);

    /**
     * @brief 从所有缓存中移除键，并清除构造标记和失败记录
     */
    void Remove(const ComponentKey& key);

    /**
     * @brief 清空所有缓存并复位销毁标记
     */
    void Clear();

    bool ContainsFinished(const ComponentKey& key) const;
    bool HasEarlyReference(const ComponentKey& key) const;

    /**
     * @brief 已完成实例的键，按注册顺序
     */
    std::vector<ComponentKey> GetRegisteredKeys() const;
    size_t GetRegisteredCount() const;

    /**
     * @brief 设置完成回调，键完成时调用一次；已完成则立即调用
     *
     * 回调在构造线程上执行，调用前释放本次构造持有的构造锁；嵌套构造中外层仍持有该锁，
     * 回调不应等待其他线程的构造
     */
    void SetFinishedCallback(const ComponentKey& key, FinishedCallback callback);

    void SetLockingMode(LockingMode mode) { locking_mode_ = mode; }
    LockingMode GetLockingMode() const { return locking_mode_; }

    void SetInDestruction(bool in_destruction) { in_destruction_ = in_destruction; }
    bool IsInDestruction() const { return in_destruction_; }

    /**
     * @brief 构造锁，批量销毁收尾时使用
     */
    std::recursive_mutex& GetConstructionLock() { return construction_lock_; }

private:
    struct Failure {
        uint64_t sequence = 0;
        std::exception_ptr error;
    };

    std::unique_lock<std::recursive_mutex> AcquireConstructionLock(const ComponentKey& key,
                                                                   const BuildContext& context);
    void ReleaseClaim(const ComponentKey& key);
    void AddRegisteredKey(const ComponentKey& key);
    void RemoveRegisteredKey(const ComponentKey& key);

    CreationTracker& tracker_;

    std::recursive_mutex construction_lock_;

    mutable std::mutex cache_mutex_;
    std::condition_variable cache_cv_;

    std::unordered_map<ComponentKey, ComponentRef> finished_;
    std::unordered_map<ComponentKey, ComponentRef> early_objects_;
    std::unordered_map<ComponentKey, EarlyFactory> early_factories_;

    std::vector<ComponentKey> registered_order_;
    std::unordered_set<ComponentKey> registered_set_;

    std::unordered_map<ComponentKey, FinishedCallback> finished_callbacks_;

    // 正在构造各键的线程
    std::unordered_map<ComponentKey, std::thread::id> creators_;
    // 各键已结束的构造次数，用于识别重叠调用方应共享的失败
    std::unordered_map<ComponentKey, uint64_t> completed_;
    std::unordered_map<ComponentKey, Failure> failures_;

    std::atomic<LockingMode> locking_mode_{LockingMode::STRICT};
    std::atomic<bool> in_destruction_{false};
};

} // namespace lifecycle
} // namespace core
} // namespace atlas
