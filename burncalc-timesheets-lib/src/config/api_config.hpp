#pragma once

#include "errors.hpp"
#include <string>

namespace burncalc {
namespace timesheets {

/**
 * Remote API configuration is missing or malformed
 */
class ConfigError : public ChartError {
public:
    explicit ConfigError(const std::string& message)
        : ChartError(ChartErrorKind::Configuration, message) {}
};

/**
 * Where the active configuration came from
 */
enum class ConfigSource {
    EXPLICIT,       ///< Built in code or parsed from a string
    ENVIRONMENT,    ///< BURNCALC_API_URL / BURNCALC_API_TOKEN
    CONFIG_FILE,    ///< JSON config file
    NONE
};

/**
 * Timesheet API endpoint and bearer token
 */
struct ApiConfig {
    std::string api_url;
    std::string api_token;
    ConfigSource source;

    ApiConfig() : source(ConfigSource::NONE) {}

    bool is_valid() const { return !api_url.empty() && !api_token.empty(); }

    /**
     * Human-readable summary with the token masked
     */
    std::string to_string() const;
};

/**
 * Expand environment variables in a string
 *
 * Supports ${VAR} and $VAR syntax. Unset variables expand to an empty string.
 * A '$' not followed by a variable name is kept.
 *
 * @param value String possibly containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * Parse {"API_URL": ..., "API_TOKEN": ...}
 *
 * Values go through environment variable expansion before validation.
 *
 * @throws ConfigError on malformed JSON, missing keys or invalid values
 */
ApiConfig parse_api_config_from_string(const std::string& json_string);

/**
 * Parse a JSON config file
 * @throws ConfigError if the file cannot be opened or parsed
 */
ApiConfig parse_api_config_from_file(const std::string& file_path);

/**
 * Resolve configuration in priority order:
 *   1. BURNCALC_API_URL and BURNCALC_API_TOKEN (both set)
 *   2. `config_path` if non-empty, else the default config file
 *
 * @throws ConfigError if no source yields a valid configuration
 */
ApiConfig resolve_api_config(const std::string& config_path = "");

/**
 * Validate configuration
 *
 * Rules:
 * - URL and token are non-blank
 * - URL starts with http:// or https://
 *
 * @throws ConfigError describing the first violation
 */
void validate_api_config(const ApiConfig& config);

/**
 * $XDG_CONFIG_HOME/burncalc/config.json, falling back to ~/.config/burncalc/config.json
 */
std::string default_config_path();

} // namespace timesheets
} // namespace burncalc
