#include "atlas/core/lifecycle/registry_config.h"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace atlas {
namespace core {
namespace lifecycle {

bool RegistryConfigLoader::LoadFromFile(const std::string& config_file) {
    try {
        if (!std::filesystem::exists(config_file)) {
            std::cerr << "Configuration file not found: " << config_file << std::endl;
            return false;
        }

        std::ifstream file(config_file);
        if (!file.is_open()) {
            std::cerr << "Failed to open configuration file: " << config_file << std::endl;
            return false;
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
        file.close();

        return LoadFromString(content);

    } catch (const std::exception& e) {
        std::cerr << "Error loading config file " << config_file << ": " << e.what() << std::endl;
        return false;
    }
}

bool RegistryConfigLoader::LoadFromString(const std::string& json_content) {
    loaded_ = false;

    try {
        raw_config_ = nlohmann::json::parse(json_content);
        config_ = RegistryConfig{};

        if (!raw_config_.is_object()) {
            std::cerr << "Configuration root must be a JSON object" << std::endl;
            return false;
        }

        if (!ParseRegistryConfig(raw_config_)) {
            return false;
        }

        if (!Validate()) {
            std::cerr << "Configuration validation failed" << std::endl;
            return false;
        }

        loaded_ = true;
        return true;

    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing configuration: " << e.what() << std::endl;
        return false;
    }
}

bool RegistryConfigLoader::Validate() const {
    if (config_.locking_mode != "strict" && config_.locking_mode != "lenient") {
        std::cerr << "Unknown locking mode: " << config_.locking_mode << std::endl;
        return false;
    }

    if (config_.suppressed_error_limit == 0) {
        std::cerr << "Suppressed error limit must be greater than zero" << std::endl;
        return false;
    }

    if (raw_config_.contains("logging") && !raw_config_["logging"].is_object()) {
        std::cerr << "Logging section must be a JSON object" << std::endl;
        return false;
    }

    return true;
}

bool RegistryConfigLoader::HasLoggingSection() const {
    return raw_config_.is_object() && raw_config_.contains("logging");
}

nlohmann::json RegistryConfigLoader::GetLoggingSection() const {
    if (!HasLoggingSection()) {
        return nlohmann::json::object();
    }
    return raw_config_["logging"];
}

nlohmann::json RegistryConfigLoader::GenerateDefaultConfig() {
    RegistryConfig defaults;

    return nlohmann::json{
        {"registry", {
            {"allow_circular_references", defaults.allow_circular_references},
            {"allow_raw_injection_despite_wrapping", defaults.allow_raw_injection_despite_wrapping},
            {"locking_mode", defaults.locking_mode},
            {"suppressed_error_limit", defaults.suppressed_error_limit},
            {"dispose_on_destruction", defaults.dispose_on_destruction}
        }},
        {"logging", {
            {"global", {
                {"log_level", "info"},
                {"log_dir", "logs"}
            }},
            {"loggers", nlohmann::json::array({
                {
                    {"name", "lifecycle"},
                    {"rotation_type", "daily"},
                    {"console_output", false}
                }
            })}
        }}
    };
}

bool RegistryConfigLoader::ParseRegistryConfig(const nlohmann::json& json) {
    if (!json.contains("registry")) {
        return true;
    }

    const auto& registry_json = json["registry"];
    if (!registry_json.is_object()) {
        std::cerr << "Registry section must be a JSON object" << std::endl;
        return false;
    }

    if (registry_json.contains("allow_circular_references")) {
        config_.allow_circular_references = registry_json["allow_circular_references"].get<bool>();
    }

    if (registry_json.contains("allow_raw_injection_despite_wrapping")) {
        config_.allow_raw_injection_despite_wrapping =
            registry_json["allow_raw_injection_despite_wrapping"].get<bool>();
    }

    if (registry_json.contains("locking_mode")) {
        config_.locking_mode = registry_json["locking_mode"].get<std::string>();
    }

    if (registry_json.contains("suppressed_error_limit")) {
        const auto& limit = registry_json["suppressed_error_limit"];
        if (!limit.is_number_unsigned()) {
            std::cerr << "suppressed_error_limit must be a non-negative integer" << std::endl;
            return false;
        }
        config_.suppressed_error_limit = limit.get<size_t>();
    }

    if (registry_json.contains("dispose_on_destruction")) {
        config_.dispose_on_destruction = registry_json["dispose_on_destruction"].get<bool>();
    }

    return true;
}

} // namespace lifecycle
} // namespace core
} // namespace atlas
