#pragma once

#include <string>
#include <memory>
#include <spdlog/spdlog.h>

namespace atlas {
namespace common {
namespace spdlog {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

enum class RotationType {
    DAILY,    // 按天分割
    HOURLY,   // 按小时分割
    NONE      // 不写文件，仅控制台
};

struct LoggerConfig {
    std::string name;
    std::string log_dir;
    std::string filename_pattern;
    LogLevel level;
    RotationType rotation_type;
    bool console_output;
    
    LoggerConfig() 
        : level(LogLevel::INFO)
        , rotation_type(RotationType::DAILY)
        , console_output(false) {}
};

// 生命周期核心使用的日志器名称
constexpr const char* kLifecycleLoggerName = "lifecycle";

::spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
LogLevel FromSpdlogLevel(::spdlog::level::level_enum level);

LogLevel ParseLogLevel(const std::string& level_str);
RotationType ParseRotationType(const std::string& rotation_str);

} // namespace spdlog
} // namespace common
} // namespace atlas
