#pragma once

#include "atlas_log_common.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>

namespace atlas {
namespace common {
namespace spdlog {

/**
 * @brief 日志配置
 *
 * JSON格式：
 * {
 *   "global":  { "log_level": "info", "log_dir": "logs" },
 *   "loggers": [ { "name": "lifecycle", "rotation_type": "daily", "console_output": true } ]
 * }
 */
class AtlasLogConfig {
public:
    static AtlasLogConfig& Instance();
    
    bool LoadFromFile(const std::string& config_file);
    bool LoadFromString(const std::string& json_content);
    bool LoadFromJson(const nlohmann::json& config);
    
    const std::vector<LoggerConfig>& GetLoggerConfigs() const;
    const LoggerConfig* GetLoggerConfig(const std::string& name) const;
    
    void SetGlobalLogLevel(LogLevel level);
    LogLevel GetGlobalLogLevel() const;
    
    void SetGlobalLogDir(const std::string& log_dir);
    const std::string& GetGlobalLogDir() const;

    /**
     * @brief 恢复默认值（清空日志器配置）
     */
    void Reset();

private:
    AtlasLogConfig() = default;
    ~AtlasLogConfig() = default;
    AtlasLogConfig(const AtlasLogConfig&) = delete;
    AtlasLogConfig& operator=(const AtlasLogConfig&) = delete;
    
    bool ParseJsonConfig(const nlohmann::json& config);
    
    std::vector<LoggerConfig> logger_configs_;
    LogLevel global_log_level_{LogLevel::INFO};
    std::string global_log_dir_{"logs"};
};

} // namespace spdlog
} // namespace common
} // namespace atlas
