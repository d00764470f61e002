#include "atlas/common/spdlog/atlas_log_manager.h"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace atlas {
namespace common {
namespace spdlog {

namespace {

constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// 未提供配置文件时使用
constexpr const char* kDefaultLogConfig = R"({
    "global":  { "log_level": "info", "log_dir": "logs" },
    "loggers": [ { "name": "lifecycle", "rotation_type": "daily", "console_output": true } ]
})";

} // namespace

AtlasLogManager& AtlasLogManager::Instance() {
    static AtlasLogManager instance;
    return instance;
}

bool AtlasLogManager::Initialize(const std::string& config_file) {
    return InitializeWith([&config_file](AtlasLogConfig& config) {
        return config_file.empty() ? config.LoadFromString(kDefaultLogConfig)
                                   : config.LoadFromFile(config_file);
    });
}

bool AtlasLogManager::InitializeFromString(const std::string& json_config) {
    return InitializeWith([&json_config](AtlasLogConfig& config) {
        return config.LoadFromString(json_config);
    });
}

bool AtlasLogManager::InitializeFromJson(const nlohmann::json& json_config) {
    return InitializeWith([&json_config](AtlasLogConfig& config) {
        return config.LoadFromJson(json_config);
    });
}

bool AtlasLogManager::InitializeWith(const std::function<bool(AtlasLogConfig&)>& load) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return true;
    }

    if (!load(AtlasLogConfig::Instance())) {
        std::cerr << "[atlas] log configuration rejected" << std::endl;
        return false;
    }
    if (!CreateConfiguredLoggers()) {
        return false;
    }

    initialized_ = true;
    return true;
}

std::shared_ptr<::spdlog::logger> AtlasLogManager::GetLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto found = loggers_.find(name);
    if (found != loggers_.end()) {
        return found->second;
    }

    // 未配置的名称：写入全局目录下的 <name>.log，按天分割
    const auto& settings = AtlasLogConfig::Instance();
    LoggerConfig fallback;
    fallback.name = name;
    fallback.log_dir = settings.GetGlobalLogDir();
    fallback.filename_pattern = name + ".log";
    fallback.level = settings.GetGlobalLogLevel();

    if (!CreateLogger(fallback)) {
        return nullptr;
    }
    return loggers_.at(name);
}

bool AtlasLogManager::HasLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return loggers_.count(name) > 0;
}

std::vector<std::string> AtlasLogManager::GetLoggerNames() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(loggers_.size());
    for (const auto& entry : loggers_) {
        names.push_back(entry.first);
    }
    return names;
}

bool AtlasLogManager::IsInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void AtlasLogManager::SetGlobalLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    AtlasLogConfig::Instance().SetGlobalLogLevel(level);

    const auto spd_level = ToSpdlogLevel(level);
    for (auto& entry : loggers_) {
        entry.second->set_level(spd_level);
    }
}

void AtlasLogManager::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : loggers_) {
        entry.second->flush();
    }
    loggers_.clear();
    ::spdlog::shutdown();
    initialized_ = false;
}

bool AtlasLogManager::CreateConfiguredLoggers() {
    for (const auto& logger_config : AtlasLogConfig::Instance().GetLoggerConfigs()) {
        if (!CreateLogger(logger_config)) {
            return false;
        }
    }
    return true;
}

std::vector<::spdlog::sink_ptr> AtlasLogManager::BuildSinks(const LoggerConfig& config) {
    std::vector<::spdlog::sink_ptr> sinks;

    if (config.rotation_type != RotationType::NONE) {
        std::filesystem::path dir(config.log_dir);
        std::filesystem::create_directories(dir);
        if (!std::filesystem::is_directory(dir)) {
            throw std::runtime_error("log path is not a directory: " + config.log_dir);
        }

        const std::string file = (dir / config.filename_pattern).string();
        if (config.rotation_type == RotationType::HOURLY) {
            sinks.push_back(std::make_shared<::spdlog::sinks::hourly_file_sink_mt>(file, false));
        } else {
            // 每天00:00切换文件
            sinks.push_back(std::make_shared<::spdlog::sinks::daily_file_sink_mt>(file, 0, 0));
        }
    }

    if (config.console_output) {
        sinks.push_back(std::make_shared<::spdlog::sinks::stdout_color_sink_mt>());
    }
    return sinks;
}

bool AtlasLogManager::CreateLogger(const LoggerConfig& config) {
    try {
        auto sinks = BuildSinks(config);
        auto logger = std::make_shared<::spdlog::logger>(config.name, sinks.begin(), sinks.end());
        logger->set_level(ToSpdlogLevel(config.level));
        logger->set_pattern(kLogPattern);

        // 同名日志器可能已按默认配置创建过，先替换掉
        ::spdlog::drop(config.name);
        ::spdlog::register_logger(logger);
        loggers_[config.name] = std::move(logger);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[atlas] cannot create logger '" << config.name << "': " << e.what() << std::endl;
        return false;
    }
}

} // namespace spdlog
} // namespace common
} // namespace atlas
