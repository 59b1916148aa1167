#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <sstream>
#include <nlohmann/json.hpp>
#include "utils/logger.hpp"

namespace pmx {
namespace config {

struct LoggingConfig {
    std::string log_level;
    std::string log_file_path;
    size_t log_max_file_size;
    size_t log_max_files;
    bool console_output;

    LoggingConfig() : log_level("INFO"), log_file_path("logs/pmx.log"),
                     log_max_file_size(10 * 1024 * 1024), log_max_files(3),
                     console_output(true) {}
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Merge a JSON document over the current values, apply environment overrides and validate.
    // Returns false (and logs) on a missing file, parse error or failed validation; a rejected
    // document leaves every value unchanged.
    bool load_config(const std::string& config_file_path);
    bool load_from_string(const std::string& json_text);
    bool save_config(const std::string& config_file_path) const;
    bool reload_config();

    // Like load_config, but a parse or validation failure throws ConfigurationError
    void load_config_strict(const std::string& config_file_path);

    LoggingConfig get_logging_config() const;
    void set_logging_config(const LoggingConfig& config);

    // Generic configuration access with dotted keys ("hedge.risk_cap")
    template<typename T>
    T get_value(const std::string& key, const T& default_value = T{}) const;

    template<typename T>
    void set_value(const std::string& key, const T& value);

    bool has_value(const std::string& key) const;
    nlohmann::json get_section(const std::string& section) const;

    // Environment variable support
    std::string get_env_var(const std::string& var_name, const std::string& default_value = "") const;
    void load_env_overrides();

    // Configuration validation
    bool validate_config() const;
    std::vector<std::string> get_validation_errors() const;

    // Validation errors of the most recent rejected load; empty after a successful one
    std::vector<std::string> last_load_errors() const;

    std::string dump_config() const;
    void print_config_summary() const;

private:
    mutable std::mutex config_mutex_;
    nlohmann::json config_json_;
    std::string config_file_path_;
    std::vector<std::string> load_errors_;

    static bool read_document(const std::string& config_file_path, nlohmann::json& document);
    bool merge_document(nlohmann::json candidate, const nlohmann::json& document, const std::string& source);
    void apply_env_overrides(nlohmann::json& target) const;

    static void collect_errors(const nlohmann::json& config, std::vector<std::string>& errors);
    static void collect_logging_errors(const nlohmann::json& config, std::vector<std::string>& errors);
    static void collect_analytics_errors(const nlohmann::json& config, std::vector<std::string>& errors);

    static nlohmann::json default_config();
    static std::vector<std::string> split_key(const std::string& key);

    // Environment variable mappings
    static const std::unordered_map<std::string, std::string> ENV_VAR_MAPPINGS;
};

// Template implementation
template<typename T>
T ConfigManager::get_value(const std::string& key, const T& default_value) const {
    std::lock_guard<std::mutex> lock(config_mutex_);

    const nlohmann::json* current = &config_json_;
    for (const auto& k : split_key(key)) {
        if (current->is_object() && current->contains(k)) {
            current = &(*current)[k];
        } else {
            return default_value;
        }
    }

    try {
        return current->get<T>();
    } catch (const nlohmann::json::exception&) {
        return default_value;
    }
}

template<typename T>
void ConfigManager::set_value(const std::string& key, const T& value) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    auto keys = split_key(key);
    if (keys.empty()) {
        utils::Logger::warn("Ignoring config write with empty key");
        return;
    }

    nlohmann::json* current = &config_json_;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        if (!current->contains(keys[i]) || !(*current)[keys[i]].is_object()) {
            (*current)[keys[i]] = nlohmann::json::object();
        }
        current = &(*current)[keys[i]];
    }

    (*current)[keys.back()] = value;
}

} // namespace config
} // namespace pmx
