#include "config/api_config.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace burncalc {
namespace timesheets {

namespace {

std::string trim(const std::string& value) {
    const size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

std::string ApiConfig::to_string() const {
    std::ostringstream oss;
    oss << "ApiConfig{";
    oss << "source=";
    switch (source) {
        case ConfigSource::EXPLICIT: oss << "EXPLICIT"; break;
        case ConfigSource::ENVIRONMENT: oss << "ENVIRONMENT"; break;
        case ConfigSource::CONFIG_FILE: oss << "CONFIG_FILE"; break;
        case ConfigSource::NONE: oss << "NONE"; break;
    }
    oss << ", url=" << api_url;
    oss << ", token=" << Logger::mask_token(api_token);
    oss << "}";
    return oss.str();
}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (var_name.empty()) {
            // Lone '$'; leave as is
            pos = start + 1;
            continue;
        }

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++; // Skip '}'
        }

        // Get environment variable value
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        // Replace in string
        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

void validate_api_config(const ApiConfig& config) {
    if (trim(config.api_url).empty()) {
        throw ConfigError("API_URL is missing or empty");
    }
    if (trim(config.api_token).empty()) {
        throw ConfigError("API_TOKEN is missing or empty");
    }
    if (!starts_with(config.api_url, "http://") && !starts_with(config.api_url, "https://")) {
        throw ConfigError("API_URL must start with http:// or https://: " + config.api_url);
    }
}

ApiConfig parse_api_config_from_string(const std::string& json_string) {
    ApiConfig config;
    config.source = ConfigSource::EXPLICIT;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigError("Config must be a JSON object");
        }
        if (!j.contains("API_URL")) {
            throw ConfigError("Missing required field: API_URL");
        }
        if (!j.contains("API_TOKEN")) {
            throw ConfigError("Missing required field: API_TOKEN");
        }

        config.api_url = trim(expand_environment_variables(j["API_URL"].get<std::string>()));
        config.api_token = trim(expand_environment_variables(j["API_TOKEN"].get<std::string>()));

    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("JSON type error: ") + e.what());
    }

    validate_api_config(config);
    return config;
}

ApiConfig parse_api_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    ApiConfig config;
    try {
        config = parse_api_config_from_string(buffer.str());
    } catch (const ConfigError& e) {
        throw ConfigError(file_path + ": " + e.what());
    }
    config.source = ConfigSource::CONFIG_FILE;
    return config;
}

std::string default_config_path() {
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && *config_home) {
        return std::string(config_home) + "/burncalc/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/burncalc/config.json";
    }
    return "config.json";
}

ApiConfig resolve_api_config(const std::string& config_path) {
    ApiConfig config;

    // Environment first
    const char* api_url = std::getenv("BURNCALC_API_URL");
    const char* api_token = std::getenv("BURNCALC_API_TOKEN");
    if (api_url && api_token) {
        config.api_url = trim(api_url);
        config.api_token = trim(api_token);
        config.source = ConfigSource::ENVIRONMENT;
        validate_api_config(config);
    } else {
        config = parse_api_config_from_file(config_path.empty() ? default_config_path() : config_path);
    }

    Logger::get_instance().log_api_configured(config.api_url, config.api_token);
    return config;
}

} // namespace timesheets
} // namespace burncalc
