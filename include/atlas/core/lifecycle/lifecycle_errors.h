#pragma once

#include "component_ref.h"
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 生命周期异常基类，携带出错的组件键
 */
class LifecycleException : public std::runtime_error {
public:
    LifecycleException(const ComponentKey& key, const std::string& message)
        : std::runtime_error(message), key_(key) {}

    const ComponentKey& GetKey() const { return key_; }

private:
    ComponentKey key_;
};

/**
 * @brief 组件正在构造中又被请求（不允许循环的场景）
 */
class AlreadyInCreationException : public LifecycleException {
public:
    explicit AlreadyInCreationException(const ComponentKey& key, const std::string& detail = "");
};

/**
 * @brief 构造失败，记录失败阶段和原因
 *
 * 嵌套构造失败时逐层包装，原因链与依赖路径一致
 */
class ConstructionFailedException : public LifecycleException {
public:
    ConstructionFailedException(const ComponentKey& key, BuildStage stage, std::exception_ptr cause);
    ConstructionFailedException(const ComponentKey& key, BuildStage stage, const std::string& message);

    BuildStage GetStage() const { return stage_; }
    std::exception_ptr GetCause() const { return cause_; }
    const std::string& GetCauseMessage() const { return cause_message_; }

    /**
     * @brief 沿包装链找到最内层原因的描述
     */
    std::string GetRootCauseMessage() const;

    /**
     * @brief 原因链上各层的组件键（由外到内）
     */
    std::vector<ComponentKey> GetKeyChain() const;

private:
    BuildStage stage_;
    std::exception_ptr cause_;
    std::string cause_message_;
};

/**
 * @brief 早期引用已被其他组件持有，但最终实例被替换
 */
class UnresolvedRawInjectionException : public LifecycleException {
public:
    UnresolvedRawInjectionException(const ComponentKey& key, std::vector<ComponentKey> dependents);

    const std::vector<ComponentKey>& GetDependentKeys() const { return dependents_; }

private:
    std::vector<ComponentKey> dependents_;
};

class ComponentNotFoundException : public LifecycleException {
public:
    explicit ComponentNotFoundException(const ComponentKey& key);
    ComponentNotFoundException(const ComponentKey& key, const std::string& message);
};

/**
 * @brief 按类型查找时有多个候选且无主候选
 */
class AmbiguousComponentException : public LifecycleException {
public:
    AmbiguousComponentException(const std::string& type_name, std::vector<ComponentKey> candidates);

    const std::vector<ComponentKey>& GetCandidates() const { return candidates_; }

private:
    std::vector<ComponentKey> candidates_;
};

class DuplicateComponentException : public LifecycleException {
public:
    explicit DuplicateComponentException(const ComponentKey& key);
};

/**
 * @brief 批量销毁进行中时拒绝创建
 */
class CreationNotAllowedException : public LifecycleException {
public:
    explicit CreationNotAllowedException(const ComponentKey& key);
};

/**
 * @brief 构造追踪状态不一致（内部错误）
 */
class InconsistentTrackerStateException : public std::logic_error {
public:
    InconsistentTrackerStateException(const ComponentKey& key, const std::string& message)
        : std::logic_error(message), key_(key) {}

    const ComponentKey& GetKey() const { return key_; }

private:
    ComponentKey key_;
};

/**
 * @brief 销毁回调失败记录，只记录不抛出
 */
struct DisposalError {
    ComponentKey key;
    std::string message;
};

/**
 * @brief 取异常描述
 */
std::string DescribeException(std::exception_ptr error);

} // namespace lifecycle
} // namespace core
} // namespace atlas
