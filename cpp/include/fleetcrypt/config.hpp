#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "logging.hpp"

namespace fleetcrypt {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);

            load_from_env();

            if (!config_file.empty() && std::filesystem::exists(config_file)) {
                load_from_file(config_file);
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        // Storage
        set_if_env("store.dir", "FC_DATA_DIR", ".");
        set_if_env("store.dictionary", "FC_DICTIONARY", "words_alpha.txt");

        // Parsing and inference
        set_if_env("parse.clear_threshold", "FC_CLEAR_THRESHOLD", "0.25");
        set_if_env("infer.group_count", "FC_GROUP_COUNT", "4");
        set_if_env("infer.max_candidates", "FC_MAX_CANDIDATES", "0");
        set_if_env("session.deduplicate", "FC_DEDUPLICATE", "true");

        // Logging
        set_if_env("log.level", "FC_LOG_LEVEL", "info");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        auto not_space = [](int ch) { return !std::isspace(ch); };

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) continue;

            std::string key = line.substr(0, equals_pos);
            std::string value = line.substr(equals_pos + 1);

            key.erase(key.begin(), std::find_if(key.begin(), key.end(), not_space));
            key.erase(std::find_if(key.rbegin(), key.rend(), not_space).base(), key.end());
            value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
            value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());

            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    bool validate() {
        bool valid = true;

        if (get<std::string>("store.dir").empty()) {
            LOG_ERROR("Store directory not configured");
            valid = false;
        }

        int group_count = get<int>("infer.group_count", 4);
        if (group_count < 1) {
            LOG_WARN("Invalid infer.group_count ", group_count, ", defaulting to 4");
            set("infer.group_count", "4");
        }

        if (get<int>("infer.max_candidates", 0) < 0) {
            LOG_WARN("Negative infer.max_candidates, defaulting to unlimited");
            set("infer.max_candidates", "0");
        }

        double threshold = get<double>("parse.clear_threshold", 0.25);
        if (threshold < 0.0 || threshold >= 1.0) {
            LOG_WARN("parse.clear_threshold must be in [0, 1), defaulting to 0.25");
            set("parse.clear_threshold", "0.25");
        }

        std::string log_level = get<std::string>("log.level");
        if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
            log_level != "error" && log_level != "off") {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            set("log.level", "info");
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration on startup
inline bool init_config(const std::string& config_file = "fleetcrypt.env") {
    Config& config = Config::getInstance();

    const char* log_level_env = std::getenv("FC_LOG_LEVEL");
    if (log_level_env) {
        set_log_level(parse_log_level(log_level_env));
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(parse_log_level(config.get<std::string>("log.level", "info")));
    return true;
}

} // namespace fleetcrypt
