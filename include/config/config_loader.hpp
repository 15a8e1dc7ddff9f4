#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace rsproxy {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads rsproxy.toml
 *
 * String values may reference environment variables as ${VAR}. A top-level
 * `include = "file.toml"` (or an array of files) is merged underneath the
 * including file: the including file wins for scalars, arrays concatenate.
 *
 * backend.max_connections = 0 is not a load error; Proxy::start() rejects it
 * with ZeroMaxConnectionsError.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ProxyConfig config;

        static LoadResult ok(ProxyConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to rsproxy.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (no include support)
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const ProxyConfig& config);

private:
    static ListenerConfig extract_listener(const toml::table& root);
    static BackendConfig extract_backend(const toml::table& root);
    static SessionLimitsConfig extract_sessions(const toml::table& root);
    static ProbeConfig extract_topology(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static AdminConfig extract_admin(const toml::table& root);

    static ProxyConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(ProxyConfig config);
};

} // namespace rsproxy
