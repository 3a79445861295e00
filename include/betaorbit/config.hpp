#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include "logging.hpp"

namespace betaorbit {

/**
 * Key/value configuration. Environment variables seed every known key
 * with a default; an optional file of `key = value` lines overrides them.
 */
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

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

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) != 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
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
            } else if constexpr (std::is_same_v<T, unsigned>) {
                return static_cast<unsigned>(std::stoul(it->second));
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return static_cast<std::int64_t>(std::stoll(it->second));
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                return static_cast<std::uint64_t>(std::stoull(it->second));
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
        set_if_env("log.level", "BO_LOG_LEVEL", "info");
        set_if_env("log.file", "BO_LOG_FILE", "");

        set_if_env("register.dir", "BO_REGISTER_DIR", "./betaorbit_saves");

        set_if_env("orbit.max_n", "BO_MAX_N", "1000000");
        set_if_env("orbit.max_restarts", "BO_MAX_RESTARTS", "4");
        set_if_env("orbit.starting_precision", "BO_STARTING_PRECISION", "64");
        set_if_env("orbit.save_period", "BO_SAVE_PERIOD", "100000");
        set_if_env("orbit.check_memory_period", "BO_CHECK_MEMORY_PERIOD", "200000");
        set_if_env("orbit.needed_bytes", "BO_NEEDED_BYTES", "1073741824");  // 1 GiB headroom
        set_if_env("orbit.guard_bits", "BO_GUARD_BITS", "5");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.count(key) == 0) {
            values_[key] = default_value;
        }
    }

    static std::string trim(const std::string& s) {
        auto first = std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); });
        auto last = std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base();
        return first < last ? std::string(first, last) : std::string();
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, equals_pos));
            if (!key.empty()) {
                values_[key] = trim(line.substr(equals_pos + 1));
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    bool validate() {
        bool valid = true;

        LogLevel parsed;
        std::string log_level = get_unlocked<std::string>("log.level", "info");
        if (!parse_log_level(log_level, parsed)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        if (get_unlocked<int>("orbit.starting_precision", 0) < 8) {
            LOG_ERROR("orbit.starting_precision must be at least 8 bits");
            valid = false;
        }
        if (get_unlocked<int>("orbit.max_restarts", -1) < 0) {
            LOG_ERROR("orbit.max_restarts must be non-negative");
            valid = false;
        }
        std::int64_t save_period = get_unlocked<std::int64_t>("orbit.save_period", 0);
        if (save_period <= 0) {
            LOG_ERROR("orbit.save_period must be positive");
            valid = false;
        }
        if (get_unlocked<std::int64_t>("orbit.check_memory_period", 0) < save_period) {
            LOG_ERROR("orbit.check_memory_period must be at least orbit.save_period");
            valid = false;
        }
        if (get_unlocked<std::string>("register.dir", "").empty()) {
            LOG_ERROR("register.dir not configured");
            valid = false;
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

inline bool init_config(const std::string& config_file = "betaorbit.env") {
    Config& config = Config::getInstance();

    const char* log_level_env = std::getenv("BO_LOG_LEVEL");
    LogLevel level;
    if (log_level_env && parse_log_level(log_level_env, level)) {
        set_log_level(level);
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    if (parse_log_level(config.get<std::string>("log.level"), level)) {
        set_log_level(level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_INFO("Configuration loaded successfully");
    return true;
}

} // namespace betaorbit
