#pragma once

#include "object_registry.h"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace atlas {
namespace core {
namespace lifecycle {

/**
 * @brief 注册表配置
 */
struct RegistryConfig {
    bool allow_circular_references = true;
    bool allow_raw_injection_despite_wrapping = false;
    std::string locking_mode = "strict";
    size_t suppressed_error_limit = 100;
    bool dispose_on_destruction = true;

    /**
     * @brief 转换锁策略，未知取值按 STRICT 处理
     */
    LockingMode GetLockingMode() const {
        return locking_mode == "lenient" ? LockingMode::LENIENT : LockingMode::STRICT;
    }
};

/**
 * @brief 注册表配置加载
 */
class RegistryConfigLoader {
public:
    RegistryConfigLoader() = default;
    ~RegistryConfigLoader() = default;

    // 禁止拷贝和赋值
    RegistryConfigLoader(const RegistryConfigLoader&) = delete;
    RegistryConfigLoader& operator=(const RegistryConfigLoader&) = delete;

    /**
     * @brief 从JSON文件加载配置
     * @param config_file 配置文件路径
     * @return 是否加载成功
     */
    bool LoadFromFile(const std::string& config_file);

    /**
     * @brief 从JSON字符串加载配置
     * @param json_content JSON字符串内容
     * @return 是否加载成功
     */
    bool LoadFromString(const std::string& json_content);

    /**
     * @brief 验证配置是否有效
     */
    bool Validate() const;

    const RegistryConfig& GetConfig() const { return config_; }
    const nlohmann::json& GetRawConfig() const { return raw_config_; }

    /**
     * @brief 是否包含 logging 配置段
     */
    bool HasLoggingSection() const;
    nlohmann::json GetLoggingSection() const;

    bool IsLoaded() const { return loaded_; }

    /**
     * @brief 生成默认配置JSON
     */
    static nlohmann::json GenerateDefaultConfig();

private:
    bool ParseRegistryConfig(const nlohmann::json& json);

    RegistryConfig config_;
    nlohmann::json raw_config_;
    bool loaded_{false};
};

} // namespace lifecycle
} // namespace core
} // namespace atlas
