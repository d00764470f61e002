#pragma once

#include "component_ref.h"
#include <algorithm>
#include <string>
#include <vector>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 构造上下文：当前调用链上正在构造的组件键
 *
 * 显式向下传递，根上下文表示顶层请求
 */
class BuildContext {
public:
    BuildContext() = default;

    /**
     * @brief 进入下一层构造
     * @return 追加了 key 的子上下文
     */
    BuildContext Enter(const ComponentKey& key) const {
        BuildContext child(*this);
        child.chain_.push_back(key);
        return child;
    }

    bool IsRoot() const { return chain_.empty(); }
    size_t Depth() const { return chain_.size(); }

    ComponentKey CurrentKey() const {
        return chain_.empty() ? ComponentKey() : chain_.back();
    }

    bool Contains(const ComponentKey& key) const {
        return std::find(chain_.begin(), chain_.end(), key) != chain_.end();
    }

    const std::vector<ComponentKey>& GetChain() const { return chain_; }

    /**
     * @brief 格式化为 "a -> b -> c"
     */
    std::string Describe() const {
        std::string result;
        for (size_t i = 0; i < chain_.size(); ++i) {
            if (i > 0) {
                result += " -> ";
            }
            result += chain_[i];
        }
        return result;
    }

private:
    std::vector<ComponentKey> chain_;
};

} // namespace lifecycle
} // namespace core
} // namespace atlas
