#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <type_traits>
#include "otree/logging.hpp"

namespace otree {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            load_from_file(config_file);
        }

        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    // Sorted snapshot of every key, for printing
    std::map<std::string, std::string> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_;
    }

    void print() const {
        for (const auto& [key, value] : entries()) {
            LOG_INFO("  ", key, " = ", key == "db.password" && !value.empty() ? "****" : value);
        }
    }

private:
    Config() {
        std::lock_guard<std::mutex> lock(mutex_);
        load_from_env();
    }
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, long long>) {
                return std::stoll(it->second);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void load_from_env() {
        // Index defaults
        set_if_env("index.desired_cube_size", "OTREE_DESIRED_CUBE_SIZE", "100000");
        set_if_env("index.max_depth", "OTREE_MAX_DEPTH", "24");
        set_if_env("index.worker_threads", "OTREE_WORKER_THREADS", "0");  // 0 = auto-detect

        // Write path
        set_if_env("writer.commit_retries", "OTREE_COMMIT_RETRIES", "3");

        // Keeper backend: local | postgres
        set_if_env("keeper.backend", "OTREE_KEEPER", "local");

        // PostgreSQL keeper
        set_if_env("db.host", "OTREE_DB_HOST", "localhost");
        set_if_env("db.port", "OTREE_DB_PORT", "5432");
        set_if_env("db.user", "OTREE_DB_USER", "postgres");
        set_if_env("db.password", "OTREE_DB_PASS", "");
        set_if_env("db.name", "OTREE_DB_NAME", "otree");

        // Logging
        set_if_env("log.level", "OTREE_LOG_LEVEL", "info");
        set_if_env("log.file", "OTREE_LOG_FILE", "");
    }

    void set_if_env(const std::string& key, const char* env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var);
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

        auto trim = [](std::string& s) {
            s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
            s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
        };

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) continue;

            std::string key = line.substr(0, equals_pos);
            std::string value = line.substr(equals_pos + 1);
            trim(key);
            trim(value);
            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    bool validate() {
        bool valid = true;

        if (get_unlocked<long long>("index.desired_cube_size", 0) <= 0) {
            LOG_ERROR("index.desired_cube_size must be positive");
            valid = false;
        }

        int max_depth = get_unlocked<int>("index.max_depth", 0);
        if (max_depth <= 0 || max_depth > 48) {
            LOG_ERROR("index.max_depth must be in [1, 48], got ", max_depth);
            valid = false;
        }

        std::string backend = get_unlocked<std::string>("keeper.backend", "");
        if (backend != "local" && backend != "postgres") {
            LOG_ERROR("Unknown keeper backend '", backend, "'");
            valid = false;
        }

        std::string log_level = get_unlocked<std::string>("log.level", "");
        if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
            log_level != "error" && log_level != "fatal") {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

// Initialize configuration and logging on startup
inline bool init_config(const std::string& config_file = "otree.env") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(parse_log_level(config.get<std::string>("log.level")));

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace otree
