#include "config/config_manager.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace pmx {
namespace config {

// Environment variable mappings
const std::unordered_map<std::string, std::string> ConfigManager::ENV_VAR_MAPPINGS = {
    {"PMX_LOG_LEVEL", "logging.log_level"},
    {"PMX_LOG_FILE", "logging.log_file_path"},
    {"PMX_WORKER_THREADS", "engine.worker_threads"},
    {"PMX_RISK_CAP", "hedge.risk_cap"},
    {"PMX_CORRELATION_WEIGHT", "hedge.correlation_weight"},
    {"PMX_TOP_LEVELS", "orderbook.top_levels"}
};

namespace {

nlohmann::json logging_config_to_json(const LoggingConfig& config) {
    return nlohmann::json{
        {"log_level", config.log_level},
        {"log_file_path", config.log_file_path},
        {"log_max_file_size", config.log_max_file_size},
        {"log_max_files", config.log_max_files},
        {"console_output", config.console_output}
    };
}

// Node at a dotted path when present; nullptr otherwise
const nlohmann::json* find_path(const nlohmann::json& root, const std::vector<std::string>& keys) {
    const nlohmann::json* current = &root;
    for (const auto& k : keys) {
        if (!current->is_object() || !current->contains(k)) {
            return nullptr;
        }
        current = &(*current)[k];
    }
    return current;
}

template<typename T>
T value_at(const nlohmann::json& root, const std::vector<std::string>& keys, const T& default_value) {
    const nlohmann::json* node = find_path(root, keys);
    if (node == nullptr) {
        return default_value;
    }
    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception&) {
        return default_value;
    }
}

LoggingConfig logging_config_from_json(const nlohmann::json& root) {
    LoggingConfig defaults;
    LoggingConfig config;
    config.log_level = value_at<std::string>(root, {"logging", "log_level"}, defaults.log_level);
    config.log_file_path = value_at<std::string>(root, {"logging", "log_file_path"}, defaults.log_file_path);
    config.log_max_file_size = value_at<size_t>(root, {"logging", "log_max_file_size"}, defaults.log_max_file_size);
    config.log_max_files = value_at<size_t>(root, {"logging", "log_max_files"}, defaults.log_max_files);
    config.console_output = value_at<bool>(root, {"logging", "console_output"}, defaults.console_output);
    return config;
}

void set_path(nlohmann::json& root, const std::vector<std::string>& keys, const nlohmann::json& value) {
    if (keys.empty()) {
        return;
    }
    nlohmann::json* current = &root;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        if (!current->contains(keys[i]) || !(*current)[keys[i]].is_object()) {
            (*current)[keys[i]] = nlohmann::json::object();
        }
        current = &(*current)[keys[i]];
    }
    (*current)[keys.back()] = value;
}

} // namespace

ConfigManager::ConfigManager() : config_json_(default_config()) {
}

ConfigManager::~ConfigManager() = default;

nlohmann::json ConfigManager::default_config() {
    nlohmann::json config = nlohmann::json::object();
    config["logging"] = logging_config_to_json(LoggingConfig());
    config["engine"] = nlohmann::json{{"worker_threads", 0}};
    return config;
}

std::vector<std::string> ConfigManager::split_key(const std::string& key) {
    std::vector<std::string> keys;
    std::stringstream ss(key);
    std::string item;
    while (std::getline(ss, item, '.')) {
        if (!item.empty()) {
            keys.push_back(item);
        }
    }
    return keys;
}

bool ConfigManager::read_document(const std::string& config_file_path, nlohmann::json& document) {
    if (!std::filesystem::exists(config_file_path)) {
        utils::Logger::warn("Config file does not exist: {}", config_file_path);
        return false;
    }

    std::ifstream file(config_file_path);
    if (!file.is_open()) {
        utils::Logger::error("Cannot open config file: {}", config_file_path);
        return false;
    }

    document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        utils::Logger::error("JSON parsing error in config file: {}", config_file_path);
        return false;
    }
    return true;
}

bool ConfigManager::load_config(const std::string& config_file_path) {
    nlohmann::json base;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_file_path_ = config_file_path;
        load_errors_.clear();
        base = config_json_;
    }

    nlohmann::json document;
    if (!read_document(config_file_path, document)) {
        return false;
    }
    return merge_document(std::move(base), document, config_file_path);
}

bool ConfigManager::load_from_string(const std::string& json_text) {
    nlohmann::json base;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        load_errors_.clear();
        base = config_json_;
    }

    nlohmann::json document = nlohmann::json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        utils::Logger::error("JSON parsing error in inline config");
        return false;
    }
    return merge_document(std::move(base), document, "<inline>");
}

void ConfigManager::load_config_strict(const std::string& config_file_path) {
    if (!load_config(config_file_path)) {
        std::string message = "failed to load " + config_file_path;
        auto errors = last_load_errors();
        if (!errors.empty()) {
            message += ": " + errors.front();
        }
        throw ConfigurationError(message);
    }
}

bool ConfigManager::merge_document(nlohmann::json candidate, const nlohmann::json& document,
                                   const std::string& source) {
    if (!document.is_object()) {
        utils::Logger::error("Config root must be a JSON object: {}", source);
        return false;
    }

    // The live configuration only changes once the merged copy validates
    candidate.merge_patch(document);
    apply_env_overrides(candidate);

    std::vector<std::string> errors;
    collect_errors(candidate, errors);
    if (!errors.empty()) {
        utils::Logger::error("Configuration validation failed, keeping previous values");
        for (const auto& error : errors) {
            utils::Logger::error("Config validation error: {}", error);
        }
        std::lock_guard<std::mutex> lock(config_mutex_);
        load_errors_ = std::move(errors);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_json_ = std::move(candidate);
    }
    utils::Logger::info("Configuration loaded successfully from: {}", source);
    return true;
}

bool ConfigManager::save_config(const std::string& config_file_path) const {
    std::lock_guard<std::mutex> lock(config_mutex_);

    std::filesystem::path path(config_file_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            utils::Logger::error("Cannot create config directory {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream file(config_file_path);
    if (!file.is_open()) {
        utils::Logger::error("Cannot write config file: {}", config_file_path);
        return false;
    }

    file << config_json_.dump(4);
    return true;
}

bool ConfigManager::reload_config() {
    if (config_file_path_.empty()) {
        utils::Logger::warn("No config file path set for reload");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        load_errors_.clear();
    }

    nlohmann::json document;
    if (!read_document(config_file_path_, document)) {
        return false;
    }
    return merge_document(default_config(), document, config_file_path_);
}

LoggingConfig ConfigManager::get_logging_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return logging_config_from_json(config_json_);
}

void ConfigManager::set_logging_config(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_json_["logging"] = logging_config_to_json(config);
}

bool ConfigManager::has_value(const std::string& key) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return find_path(config_json_, split_key(key)) != nullptr;
}

nlohmann::json ConfigManager::get_section(const std::string& section) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    if (config_json_.contains(section) && config_json_[section].is_object()) {
        return config_json_[section];
    }
    return nlohmann::json::object();
}

std::string ConfigManager::get_env_var(const std::string& var_name, const std::string& default_value) const {
    const char* value = std::getenv(var_name.c_str());
    return value ? std::string(value) : default_value;
}

void ConfigManager::load_env_overrides() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    apply_env_overrides(config_json_);
}

void ConfigManager::apply_env_overrides(nlohmann::json& target) const {
    for (const auto& [env_var, config_path] : ENV_VAR_MAPPINGS) {
        std::string env_value = get_env_var(env_var);
        if (env_value.empty()) {
            continue;
        }

        // Numbers and booleans keep their JSON type, anything else is a string
        nlohmann::json parsed = nlohmann::json::parse(env_value, nullptr, false);
        if (!parsed.is_discarded() && (parsed.is_number() || parsed.is_boolean())) {
            set_path(target, split_key(config_path), parsed);
        } else {
            set_path(target, split_key(config_path), env_value);
        }
        utils::Logger::debug("Applied env override {} -> {}", env_var, config_path);
    }
}

bool ConfigManager::validate_config() const {
    return get_validation_errors().empty();
}

std::vector<std::string> ConfigManager::get_validation_errors() const {
    std::vector<std::string> errors;
    std::lock_guard<std::mutex> lock(config_mutex_);
    collect_errors(config_json_, errors);
    return errors;
}

std::vector<std::string> ConfigManager::last_load_errors() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return load_errors_;
}

void ConfigManager::collect_errors(const nlohmann::json& config, std::vector<std::string>& errors) {
    collect_logging_errors(config, errors);
    collect_analytics_errors(config, errors);
}

void ConfigManager::collect_logging_errors(const nlohmann::json& config, std::vector<std::string>& errors) {
    auto logging = logging_config_from_json(config);

    // An unknown name falls back to whichever default it is given
    if (utils::parse_log_level(logging.log_level, utils::LogLevel::TRACE) !=
        utils::parse_log_level(logging.log_level, utils::LogLevel::CRITICAL)) {
        errors.push_back("Unknown log level: " + logging.log_level);
    }

    if (logging.log_file_path.empty()) {
        errors.push_back("Log file path cannot be empty");
    }

    if (logging.log_max_files == 0) {
        errors.push_back("Log max files must be positive");
    }
}

void ConfigManager::collect_analytics_errors(const nlohmann::json& config, std::vector<std::string>& errors) {
    auto number_at = [&config](const std::string& key, double& out) {
        const nlohmann::json* node = find_path(config, split_key(key));
        if (node == nullptr) {
            return false;
        }
        out = node->is_number() ? node->get<double>() : std::nan("");
        return true;
    };
    double value = 0.0;

    if (number_at("engine.worker_threads", value) && (!std::isfinite(value) || value < 0)) {
        errors.push_back("Engine worker threads cannot be negative");
    }

    if (number_at("orderbook.top_levels", value) && (!std::isfinite(value) || value < 1)) {
        errors.push_back("Orderbook top levels must be at least 1");
    }

    if (number_at("hedge.risk_cap", value) && (!std::isfinite(value) || value <= 0)) {
        errors.push_back("Hedge risk cap must be positive");
    }

    if (number_at("hedge.correlation_weight", value) && (!std::isfinite(value) || value <= 0 || value >= 1)) {
        errors.push_back("Hedge correlation weight must be between 0 and 1 (exclusive)");
    }

    if (number_at("payoff.probability_step", value) && (!std::isfinite(value) || value <= 0 || value > 1)) {
        errors.push_back("Payoff probability step must be in (0, 1]");
    }

    if (number_at("alignment.tolerance_ms", value) && (!std::isfinite(value) || value < 0)) {
        errors.push_back("Alignment tolerance cannot be negative");
    }

    if (number_at("consistency.max_findings", value) && (!std::isfinite(value) || value < 0)) {
        errors.push_back("Consistency max findings cannot be negative");
    }

    const nlohmann::json* mode = find_path(config, {"alignment", "mode"});
    if (mode != nullptr) {
        if (!mode->is_string() || (mode->get<std::string>() != "exact" && mode->get<std::string>() != "nearest")) {
            errors.push_back("Alignment mode must be \"exact\" or \"nearest\"");
        }
    }
}

std::string ConfigManager::dump_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_json_.dump(4);
}

void ConfigManager::print_config_summary() const {
    auto logging = get_logging_config();
    utils::Logger::info("=== Configuration Summary ===");
    utils::Logger::info("Log level: {}", logging.log_level);
    utils::Logger::info("Log file: {}", logging.log_file_path);
    utils::Logger::info("Worker threads: {}", get_value<int>("engine.worker_threads", 0));
    utils::Logger::info("Risk cap: {}", get_value<double>("hedge.risk_cap", 1500.0));
    utils::Logger::info("Correlation weight: {}", get_value<double>("hedge.correlation_weight", 0.5));
    utils::Logger::info("=============================");
}

} // namespace config
} // namespace pmx
