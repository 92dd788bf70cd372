#ifndef UTILS_HPP
#define UTILS_HPP

#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Function to parse key-value pairs from a string (using optional version)
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    static vector<string> defaultConfigPaths() {
        const string name = Constants::CONFIG_FILE_NAME;
        return {
            name,                         // Current directory
            "../" + name,                 // Parent directory
            "/etc/agent_memory_cache/" + name,
            "../../" + name               // Development path
        };
    }

    // Applies one setting to config. Returns false (after a warning on stderr)
    // when the key is unknown or the value does not parse; config keeps its
    // previous value in that case.
    static bool applySetting(AppConfig& config, const string& key, const string& value) {
        auto readInt = [&key, &value](int minimum) -> optional<int> {
            auto val = stringToInt(value);
            if (!val) {
                cerr << "Warning: Invalid integer for " << key << ": " << value << endl;
                return nullopt;
            }
            if (*val < minimum) {
                cerr << "Warning: " << key << " must be at least " << minimum << ", got " << *val << endl;
                return nullopt;
            }
            return val;
        };

        if (key == "cache_capacity") {
            if (auto val = readInt(1)) { config.cache_capacity = *val; return true; }
        } else if (key == "cache_default_ttl_seconds") {
            if (auto val = readInt(0)) { config.cache_default_ttl_seconds = *val; return true; }
        } else if (key == "sweep_interval_seconds") {
            if (auto val = readInt(0)) { config.sweep_interval_seconds = *val; return true; }
        } else if (key == "use_redis") {
            if (auto val = readInt(0)) { config.use_redis = (*val == 1); return true; }
        } else if (key == "redis_host") {
            config.redis_host = value;
            return true;
        } else if (key == "redis_port") {
            if (auto val = readInt(1)) {
                if (*val <= 65535) { config.redis_port = *val; return true; }
                cerr << "Warning: redis_port out of range: " << *val << endl;
            }
        } else if (key == "redis_key_prefix") {
            config.redis_key_prefix = value;
            return true;
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                cerr << "Warning: " << e.what() << endl;
            }
        } else if (key == "metrics_prefix") {
            config.metrics_prefix = value;
            return true;
        } else if (key == "metrics_batch_size") {
            if (auto val = readInt(1)) { config.metrics_batch_size = *val; return true; }
        } else {
            cerr << "Warning: Unknown configuration key: " << key << endl;
        }
        return false;
    }

    // Reads key = value lines into config. Returns false if the file cannot be opened.
    static bool loadConfigurationFile(const string& path, AppConfig& config) {
        std::ifstream configFile(path);
        if (!configFile.is_open()) {
            return false;
        }
        cerr << "Reading configuration from " << path << "..." << endl;
        std::string line;
        while (getline(configFile, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) {
                applySetting(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
            } else {
                cerr << "Warning: Ignoring malformed configuration line: " << line << endl;
            }
        }
        return true;
    }

    // Load configuration: config file first, then command-line key=value
    // arguments on top. "config=<path>" names the file explicitly.
    static AppConfig loadConfiguration(const map<string, string>& startupArguments,
                                       const vector<string>& configPaths = defaultConfigPaths()) {
        AppConfig config;

        auto explicitPath = startupArguments.find(Constants::CONFIG_PATH_ARGUMENT);
        if (explicitPath != startupArguments.end()) {
            if (!loadConfigurationFile(explicitPath->second, config)) {
                throw std::runtime_error("Cannot open configuration file: " + explicitPath->second);
            }
        } else {
            bool config_found = false;
            for (const auto& config_path : configPaths) {
                if (loadConfigurationFile(config_path, config)) {
                    config_found = true;
                    break;
                }
            }
            if (!config_found) {
                cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
            }
        }

        for (const auto& [key, value] : startupArguments) {
            if (key == Constants::CONFIG_PATH_ARGUMENT) {
                continue;
            }
            applySetting(config, key, value);
        }
        return config;
    }
};

#endif // UTILS_HPP
