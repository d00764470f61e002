#pragma once

#include "atlas_log_common.h"
#include "atlas_log_config.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/hourly_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <functional>
#include <memory>
#include <unordered_map>
#include <mutex>
#include <vector>

namespace atlas {
namespace common {
namespace spdlog {

class AtlasLogManager {
public:
    static AtlasLogManager& Instance();
    
    bool Initialize(const std::string& config_file = "");
    bool InitializeFromString(const std::string& json_config);
    bool InitializeFromJson(const nlohmann::json& json_config);
    
    /**
     * @brief 获取日志器，未配置的名称按全局设置创建默认文件日志器
     */
    std::shared_ptr<::spdlog::logger> GetLogger(const std::string& name);
    
    bool HasLogger(const std::string& name);
    std::vector<std::string> GetLoggerNames();
    bool IsInitialized();
    
    void SetGlobalLogLevel(LogLevel level);
    void Shutdown();

private:
    AtlasLogManager() = default;
    ~AtlasLogManager() = default;
    AtlasLogManager(const AtlasLogManager&) = delete;
    AtlasLogManager& operator=(const AtlasLogManager&) = delete;
    
    /**
     * @brief 加锁后执行加载函数并创建配置中的全部日志器，已初始化时直接返回true
     */
    bool InitializeWith(const std::function<bool(AtlasLogConfig&)>& load);
    bool CreateConfiguredLoggers();
    bool CreateLogger(const LoggerConfig& config);
    std::vector<::spdlog::sink_ptr> BuildSinks(const LoggerConfig& config);
    
    std::unordered_map<std::string, std::shared_ptr<::spdlog::logger>> loggers_;
    std::mutex mutex_;
    bool initialized_{false};
};

// 便捷宏定义
#define ATLAS_LOG_MANAGER() atlas::common::spdlog::AtlasLogManager::Instance()
#define ATLAS_GET_LOGGER(name) ATLAS_LOG_MANAGER().GetLogger(name)

// 便捷日志宏
#define ATLAS_LOG_TRACE(logger_name, ...) do { if (auto atlas_logger_ = ATLAS_GET_LOGGER(logger_name)) atlas_logger_->trace(__VA_ARGS__); } while (0)
#define ATLAS_LOG_DEBUG(logger_name, ...) do { if (auto atlas_logger_ = ATLAS_GET_LOGGER(logger_name)) atlas_logger_->debug(__VA_ARGS__); } while (0)
#define ATLAS_LOG_INFO(logger_name, ...) do { if (auto atlas_logger_ = ATLAS_GET_LOGGER(logger_name)) atlas_logger_->info(__VA_ARGS__); } while (0)
#define ATLAS_LOG_WARN(logger_name, ...) do { if (auto atlas_logger_ = ATLAS_GET_LOGGER(logger_name)) atlas_logger_->warn(__VA_ARGS__); } while (0)
#define ATLAS_LOG_ERROR(logger_name, ...) do { if (auto atlas_logger_ = ATLAS_GET_LOGGER(logger_name)) atlas_logger_->error(__VA_ARGS__); } while (0)
#define ATLAS_LOG_CRITICAL(logger_name, ...) do { if (auto atlas_logger_ = ATLAS_GET_LOGGER(logger_name)) atlas_logger_->critical(__VA_ARGS__); } while (0)

} // namespace spdlog
} // namespace common
} // namespace atlas
