#pragma once

#include "component_ref.h"
#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 组件作用域
 */
enum class ComponentScope {
    SINGLETON,   // 单例，注册表缓存
    PROTOTYPE    // 原型，每次请求都新建
};

/**
 * @brief 生产方式
 */
enum class ProductionStrategy {
    CONSTRUCTOR,
    FACTORY_METHOD,
    SUPPLIER
};

struct ComponentDescriptor;

using ProduceFn = std::function<ComponentRef(const ComponentKey&, const ComponentDescriptor&)>;
using InjectFn = std::function<void(const ComponentRef& target, const ComponentRef& value)>;
using LifecycleFn = std::function<void(const ComponentRef& instance)>;

/**
 * @brief 依赖注入点
 *
 * target_key 非空时按名称解析，否则按 target_type 解析
 */
struct DependencyPoint {
    std::string name;
    ComponentKey target_key;
    std::optional<std::type_index> target_type;
    bool required = true;
    InjectFn inject;
};

/**
 * @brief 具名生命周期回调（初始化/销毁）
 */
struct NamedCallback {
    std::string name;
    LifecycleFn callback;
};

/**
 * @brief 组件描述
 *
 * 构造开始后不可修改，由调用方持有，核心只读
 */
struct ComponentDescriptor {
    ComponentKey key;
    std::type_index type = typeid(void);
    // 除 type 外还可按这些类型查找和注入
    std::vector<std::type_index> exposed_types;
    ComponentScope scope = ComponentScope::SINGLETON;
    ProductionStrategy strategy = ProductionStrategy::CONSTRUCTOR;
    ProduceFn produce;

    std::vector<DependencyPoint> dependencies;
    std::vector<ComponentKey> depends_on;

    std::vector<NamedCallback> init_methods;
    std::optional<NamedCallback> destroy_method;

    bool allow_circular_references = true;
    bool primary = false;
    bool synthetic = false;

    bool IsSingleton() const { return scope == ComponentScope::SINGLETON; }
    bool IsPrototype() const { return scope == ComponentScope::PROTOTYPE; }

    bool Exposes(const std::type_index& wanted) const {
        return type == wanted ||
               std::find(exposed_types.begin(), exposed_types.end(), wanted) != exposed_types.end();
    }
};

using DescriptorPtr = std::shared_ptr<const ComponentDescriptor>;

/**
 * @brief 以默认构造方式创建类型 T 的描述
 *
 * Exposed 为 T 的基类（通常是接口），组件可按这些类型被查找和注入
 */
template<typename T, typename... Exposed>
ComponentDescriptor MakeDescriptor(const ComponentKey& key) {
    ComponentDescriptor descriptor;
    descriptor.key = key;
    descriptor.type = std::type_index(typeid(T));
    descriptor.exposed_types = {std::type_index(typeid(Exposed))...};
    descriptor.produce = [](const ComponentKey&, const ComponentDescriptor&) {
        return ComponentRef::Of<T, Exposed...>(std::make_shared<T>());
    };
    return descriptor;
}

/**
 * @brief 以自定义工厂创建类型 T 的描述，factory 返回 T*
 */
template<typename T, typename... Exposed, typename Factory>
ComponentDescriptor MakeDescriptor(const ComponentKey& key, Factory factory) {
    ComponentDescriptor descriptor;
    descriptor.key = key;
    descriptor.type = std::type_index(typeid(T));
    descriptor.exposed_types = {std::type_index(typeid(Exposed))...};
    descriptor.strategy = ProductionStrategy::FACTORY_METHOD;
    descriptor.produce = [factory](const ComponentKey&, const ComponentDescriptor&) {
        return ComponentRef::Of<T, Exposed...>(std::shared_ptr<T>(factory()));
    };
    return descriptor;
}

namespace detail {

template<typename T>
std::shared_ptr<T> CheckedCast(const ComponentRef& ref, const std::string& point) {
    auto typed = ref.As<T>();
    if (!typed) {
        throw std::invalid_argument("Type mismatch at injection point '" + point + "'");
    }
    return typed;
}

} // namespace detail

/**
 * @brief 创建按名称解析的依赖注入点
 * @param setter 注入函数 void(T&, std::shared_ptr<D>)
 */
template<typename T, typename D, typename Setter>
DependencyPoint MakeDependency(const std::string& name, const ComponentKey& target_key, Setter setter) {
    DependencyPoint point;
    point.name = name;
    point.target_key = target_key;
    point.target_type = std::type_index(typeid(D));
    point.inject = [name, setter](const ComponentRef& target, const ComponentRef& value) {
        auto owner = detail::CheckedCast<T>(target, name);
        if (!value) {
            setter(*owner, std::shared_ptr<D>());
            return;
        }
        setter(*owner, detail::CheckedCast<D>(value, name));
    };
    return point;
}

/**
 * @brief 创建按类型解析的依赖注入点
 */
template<typename T, typename D, typename Setter>
DependencyPoint MakeTypedDependency(const std::string& name, Setter setter, bool required = true) {
    DependencyPoint point = MakeDependency<T, D>(name, ComponentKey(), setter);
    point.required = required;
    return point;
}

/**
 * @brief 创建初始化/销毁回调
 */
template<typename T, typename Fn>
NamedCallback MakeCallback(const std::string& name, Fn fn) {
    return NamedCallback{name, [name, fn](const ComponentRef& instance) {
        fn(*detail::CheckedCast<T>(instance, name));
    }};
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
