#pragma once

#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 组件唯一标识
 */
using ComponentKey = std::string;

/**
 * @brief 类型擦除的组件实例句柄
 *
 * 持有 shared_ptr<void> 和构造时的静态类型，实例身份以对象地址为准。
 * Of<T, Exposed...> 额外记录实例在每个暴露类型下的指针，As<Exposed>() 据此返回
 */
class ComponentRef {
public:
    ComponentRef() : type_(typeid(void)) {}

    template<typename T, typename... Exposed>
    static ComponentRef Of(std::shared_ptr<T> instance) {
        using Concrete = typename std::remove_const<T>::type;
        ComponentRef ref;
        if (instance) {
            std::shared_ptr<Concrete> mutable_instance = std::const_pointer_cast<Concrete>(instance);
            ref.type_ = std::type_index(typeid(Concrete));
            ref.instance_ = std::static_pointer_cast<void>(mutable_instance);
            ref.views_.reserve(sizeof...(Exposed));
            // 转换后的指针可能与原地址不同（多继承），逐个保存
            (ref.AddView<Exposed>(mutable_instance), ...);
        }
        return ref;
    }

    /**
     * @brief 取出具体类型或暴露类型的实例
     * @return 类型不匹配或为空时返回nullptr
     */
    template<typename T>
    std::shared_ptr<T> As() const {
        if (!instance_) {
            return nullptr;
        }
        const std::type_index wanted(typeid(T));
        if (type_ == wanted) {
            return std::static_pointer_cast<T>(instance_);
        }
        for (const auto& view : views_) {
            if (view.type == wanted) {
                return std::static_pointer_cast<T>(view.pointer);
            }
        }
        return nullptr;
    }

    /**
     * @brief 实例能否以 type 取出
     */
    bool Exposes(const std::type_index& type) const {
        if (!instance_) {
            return false;
        }
        if (type_ == type) {
            return true;
        }
        for (const auto& view : views_) {
            if (view.type == type) {
                return true;
            }
        }
        return false;
    }

    const void* Identity() const { return instance_.get(); }
    const std::shared_ptr<void>& Get() const { return instance_; }
    std::type_index GetType() const { return type_; }

    bool SameInstance(const ComponentRef& other) const {
        return instance_.get() == other.instance_.get();
    }

    explicit operator bool() const { return instance_ != nullptr; }

    bool operator==(const ComponentRef& other) const { return SameInstance(other); }
    bool operator!=(const ComponentRef& other) const { return !SameInstance(other); }

private:
    struct View {
        std::type_index type;
        std::shared_ptr<void> pointer;
    };

    template<typename Base, typename Concrete>
    void AddView(const std::shared_ptr<Concrete>& instance) {
        static_assert(std::is_base_of<Base, Concrete>::value, "exposed type must be a base of the instance type");
        std::shared_ptr<Base> base = instance;
        views_.push_back(View{std::type_index(typeid(Base)),
                              std::static_pointer_cast<void>(std::const_pointer_cast<
                                  typename std::remove_const<Base>::type>(base))});
    }

    std::shared_ptr<void> instance_;
    std::type_index type_;
    std::vector<View> views_;
};

/**
 * @brief 注册表查询状态
 */
enum class LookupState {
    ABSENT,             // 不存在
    EARLY_REFERENCE,    // 构造中的早期引用
    FINISHED            // 已完成
};

/**
 * @brief 注册表三态查询结果
 */
struct LookupResult {
    LookupState state = LookupState::ABSENT;
    ComponentRef instance;

    static LookupResult Absent() { return LookupResult{}; }

    static LookupResult Early(ComponentRef ref) {
        return LookupResult{LookupState::EARLY_REFERENCE, std::move(ref)};
    }

    static LookupResult Finished(ComponentRef ref) {
        return LookupResult{LookupState::FINISHED, std::move(ref)};
    }

    bool IsAbsent() const { return state == LookupState::ABSENT; }
    bool IsEarly() const { return state == LookupState::EARLY_REFERENCE; }
    bool IsFinished() const { return state == LookupState::FINISHED; }
};

/**
 * @brief 构造阶段
 */
enum class BuildStage {
    REQUESTED,
    INSTANTIATING,
    EARLY_EXPOSED,
    POPULATING,
    INITIALIZING,
    FINISHED,
    FAILED
};

inline const char* ToString(BuildStage stage) {
    switch (stage) {
        case BuildStage::REQUESTED: return "REQUESTED";
        case BuildStage::INSTANTIATING: return "INSTANTIATING";
        case BuildStage::EARLY_EXPOSED: return "EARLY_EXPOSED";
        case BuildStage::POPULATING: return "POPULATING";
        case BuildStage::INITIALIZING: return "INITIALIZING";
        case BuildStage::FINISHED: return "FINISHED";
        case BuildStage::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
