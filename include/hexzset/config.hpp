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

namespace hexzset {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Environment variables first, then the optional key=value file on top
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

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            if (key == "db.password") {
                LOG_INFO("  ", key, " = ", value.empty() ? "" : "********");
            } else {
                LOG_INFO("  ", key, " = ", value);
            }
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        // Database
        set_if_env("db.host", "HZ_DB_HOST", "localhost");
        set_if_env("db.port", "HZ_DB_PORT", "5432");
        set_if_env("db.user", "HZ_DB_USER", "postgres");
        set_if_env("db.password", "HZ_DB_PASS", "");
        set_if_env("db.name", "HZ_DB_NAME", "hexzset");

        // Member table
        set_if_env("store.table", "HZ_STORE_TABLE", "hexzset_member");

        // Logging
        set_if_env("log.level", "HZ_LOG_LEVEL", "info");
        set_if_env("log.file", "HZ_LOG_FILE", "");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else {
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
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);
                trim(key);
                trim(value);
                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    bool validate() {
        bool valid = true;

        if (get<std::string>("db.host").empty()) {
            LOG_ERROR("Database host not configured");
            valid = false;
        }

        if (get<int>("db.port") <= 0 || get<int>("db.port") > 65535) {
            LOG_ERROR("Invalid database port: ", get<std::string>("db.port"));
            valid = false;
        }

        if (get<std::string>("db.user").empty()) {
            LOG_ERROR("Database user not configured");
            valid = false;
        }

        // Table name goes into SQL text, keep it to an identifier
        std::string table = get<std::string>("store.table");
        if (table.empty() || std::isdigit(static_cast<unsigned char>(table[0])) ||
            !std::all_of(table.begin(), table.end(),
                         [](unsigned char c) { return std::isalnum(c) || c == '_'; })) {
            LOG_ERROR("Invalid store table name: '", table, "'");
            valid = false;
        }

        std::string log_level = get<std::string>("log.level");
        if (!parse_log_level(log_level)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            set("log.level", "info");
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Load configuration and apply the logging settings it carries
inline bool init_config(const std::string& config_file = "hexzset.env") {
    Config& config = Config::getInstance();

    if (const char* log_level_env = std::getenv("HZ_LOG_LEVEL")) {
        set_log_level(std::string(log_level_env));
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(config.get<std::string>("log.level"));

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

} // namespace hexzset
