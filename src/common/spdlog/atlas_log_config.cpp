#include "atlas/common/spdlog/atlas_log_config.h"
#include "atlas/common/spdlog/atlas_log_common.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace atlas {
namespace common {
namespace spdlog {

namespace {

struct LevelName {
    const char* name;
    LogLevel level;
    ::spdlog::level::level_enum spd_level;
};

// 名称、内部级别与spdlog级别的对照表
constexpr LevelName kLevelTable[] = {
    {"trace",    LogLevel::TRACE,    ::spdlog::level::trace},
    {"debug",    LogLevel::DEBUG,    ::spdlog::level::debug},
    {"info",     LogLevel::INFO,     ::spdlog::level::info},
    {"warn",     LogLevel::WARN,     ::spdlog::level::warn},
    {"error",    LogLevel::ERROR,    ::spdlog::level::err},
    {"critical", LogLevel::CRITICAL, ::spdlog::level::critical},
    {"off",      LogLevel::OFF,      ::spdlog::level::off},
};

/**
 * @brief 解析单个日志器条目，未指定的字段继承全局设置
 * @return 条目缺少name时返回false
 */
bool ParseLoggerEntry(const nlohmann::json& entry, LogLevel default_level,
                      const std::string& default_dir, LoggerConfig& out) {
    out.name = entry.value("name", std::string());
    if (out.name.empty()) {
        return false;
    }

    out.log_dir = entry.value("log_dir", default_dir);
    out.filename_pattern = entry.value("filename_pattern", out.name + ".log");
    out.level = entry.contains("level")
        ? ParseLogLevel(entry.at("level").get<std::string>())
        : default_level;
    out.rotation_type = ParseRotationType(entry.value("rotation_type", std::string("daily")));
    out.console_output = entry.value("console_output", false);
    return true;
}

} // namespace

AtlasLogConfig& AtlasLogConfig::Instance() {
    static AtlasLogConfig instance;
    return instance;
}

bool AtlasLogConfig::LoadFromFile(const std::string& config_file) {
    std::ifstream in(config_file);
    if (!in) {
        std::cerr << "[atlas] cannot open log config: " << config_file << std::endl;
        return false;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return LoadFromString(buffer.str());
}

bool AtlasLogConfig::LoadFromString(const std::string& json_content) {
    nlohmann::json parsed = nlohmann::json::parse(json_content, nullptr, false);
    if (parsed.is_discarded()) {
        std::cerr << "[atlas] log config is not valid JSON" << std::endl;
        return false;
    }
    return LoadFromJson(parsed);
}

bool AtlasLogConfig::LoadFromJson(const nlohmann::json& config) {
    try {
        return ParseJsonConfig(config);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[atlas] malformed log config: " << e.what() << std::endl;
        return false;
    }
}

const std::vector<LoggerConfig>& AtlasLogConfig::GetLoggerConfigs() const {
    return logger_configs_;
}

const LoggerConfig* AtlasLogConfig::GetLoggerConfig(const std::string& name) const {
    auto it = std::find_if(logger_configs_.begin(), logger_configs_.end(),
                           [&name](const LoggerConfig& c) { return c.name == name; });
    return it == logger_configs_.end() ? nullptr : &*it;
}

void AtlasLogConfig::SetGlobalLogLevel(LogLevel level) { global_log_level_ = level; }

LogLevel AtlasLogConfig::GetGlobalLogLevel() const { return global_log_level_; }

void AtlasLogConfig::SetGlobalLogDir(const std::string& log_dir) { global_log_dir_ = log_dir; }

const std::string& AtlasLogConfig::GetGlobalLogDir() const { return global_log_dir_; }

void AtlasLogConfig::Reset() {
    logger_configs_.clear();
    global_log_level_ = LogLevel::INFO;
    global_log_dir_ = "logs";
}

bool AtlasLogConfig::ParseJsonConfig(const nlohmann::json& config) {
    if (!config.is_object()) {
        std::cerr << "[atlas] log config root must be an object" << std::endl;
        return false;
    }

    auto global_it = config.find("global");
    if (global_it != config.end() && global_it->is_object()) {
        if (global_it->contains("log_level")) {
            global_log_level_ = ParseLogLevel(global_it->at("log_level").get<std::string>());
        }
        global_log_dir_ = global_it->value("log_dir", global_log_dir_);
    }

    auto loggers_it = config.find("loggers");
    if (loggers_it == config.end() || !loggers_it->is_array()) {
        return true;
    }

    // 全部条目解析成功后才替换现有配置
    std::vector<LoggerConfig> parsed;
    parsed.reserve(loggers_it->size());
    for (const auto& entry : *loggers_it) {
        LoggerConfig logger_config;
        if (!ParseLoggerEntry(entry, global_log_level_, global_log_dir_, logger_config)) {
            std::cerr << "[atlas] logger entry is missing \"name\"" << std::endl;
            return false;
        }
        parsed.push_back(std::move(logger_config));
    }
    logger_configs_ = std::move(parsed);
    return true;
}

LogLevel ParseLogLevel(const std::string& level_str) {
    for (const auto& entry : kLevelTable) {
        if (level_str == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::INFO;
}

RotationType ParseRotationType(const std::string& rotation_str) {
    if (rotation_str == "hourly") {
        return RotationType::HOURLY;
    }
    if (rotation_str == "none") {
        return RotationType::NONE;
    }
    return RotationType::DAILY;
}

::spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    for (const auto& entry : kLevelTable) {
        if (entry.level == level) {
            return entry.spd_level;
        }
    }
    return ::spdlog::level::info;
}

LogLevel FromSpdlogLevel(::spdlog::level::level_enum level) {
    for (const auto& entry : kLevelTable) {
        if (entry.spd_level == level) {
            return entry.level;
        }
    }
    return LogLevel::INFO;
}

} // namespace spdlog
} // namespace common
} // namespace atlas
