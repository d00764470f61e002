#pragma once

#include "component_descriptor.h"
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 组件描述来源
 */
class DescriptorResolver {
public:
    virtual ~DescriptorResolver() = default;

    /**
     * @brief 按键查找描述
     * @return 未定义时返回nullptr
     */
    virtual DescriptorPtr Resolve(const ComponentKey& key) const = 0;

    /**
     * @brief 查找具体类型或暴露类型匹配的组件键，按注册顺序
     */
    virtual std::vector<ComponentKey> FindKeysForType(const std::type_index& type) const = 0;

    /**
     * @brief 全部已定义的组件键，按注册顺序
     */
    virtual std::vector<ComponentKey> GetDescriptorKeys() const = 0;
};

/**
 * @brief 内存中的组件描述表
 */
class DescriptorRegistry : public DescriptorResolver {
public:
    DescriptorRegistry() = default;
    ~DescriptorRegistry() override = default;

    // 禁止拷贝和赋值
    DescriptorRegistry(const DescriptorRegistry&) = delete;
    DescriptorRegistry& operator=(const DescriptorRegistry&) = delete;

    /**
     * @brief 注册组件描述
     * @return 键为空、缺少生产回调或键重复时返回false
     */
    bool RegisterDescriptor(ComponentDescriptor descriptor);

    bool RemoveDescriptor(const ComponentKey& key);
    bool HasDescriptor(const ComponentKey& key) const;
    std::vector<ComponentKey> GetDescriptorKeys() const override;
    size_t GetDescriptorCount() const;

    DescriptorPtr Resolve(const ComponentKey& key) const override;
    std::vector<ComponentKey> FindKeysForType(const std::type_index& type) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ComponentKey, DescriptorPtr> descriptors_;
    std::vector<ComponentKey> order_;
};

} // namespace lifecycle
} // namespace core
} // namespace atlas
