#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace rsproxy {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 8;

/**
 * @brief Replace ${NAME} with the value of environment variable NAME.
 *
 * Unset variables expand to nothing. An unterminated ${ is an error.
 */
std::string substitute_env(const std::string& input) {
    std::string out;
    out.reserve(input.size());

    size_t pos = 0;
    while (pos < input.size()) {
        const size_t open = input.find("${", pos);
        if (open == std::string::npos) {
            out.append(input, pos, std::string::npos);
            break;
        }
        out.append(input, pos, open - pos);

        const size_t close = input.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unterminated ${{...}} in config value \"{}\"", input));
        }
        const std::string name = input.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
    return out;
}

void substitute_env_in_node(toml::node& node);

void substitute_env_in_table(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        substitute_env_in_node(val);
    }
}

void substitute_env_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        if (s->get().find("${") != std::string::npos) {
            *s = substitute_env(s->get());
        }
    } else if (auto* t = node.as_table()) {
        substitute_env_in_table(*t);
    } else if (auto* a = node.as_array()) {
        for (auto& elem : *a) substitute_env_in_node(elem);
    }
}

/**
 * @brief Deep-merge overlay into base. Overlay wins for scalars, arrays
 * concatenate (base first).
 */
void overlay_table(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        auto* existing = base.get(key);
        if (existing && existing->is_table() && val.is_table()) {
            overlay_table(*existing->as_table(), *val.as_table());
        } else if (existing && existing->is_array() && val.is_array()) {
            for (const auto& elem : *val.as_array()) {
                existing->as_array()->push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

std::vector<std::string> include_list(const toml::table& root) {
    std::vector<std::string> files;
    const auto node = root["include"];
    if (const auto* single = node.as_string()) {
        files.push_back(single->get());
    } else if (const auto* many = node.as_array()) {
        for (const auto& item : *many) {
            if (const auto* s = item.as_string()) files.push_back(s->get());
        }
    }
    return files;
}

/**
 * @brief Load a file and everything it includes, included files underneath.
 */
toml::table load_with_includes(const std::filesystem::path& path,
                               std::unordered_set<std::string>& chain, int depth) {
    namespace fs = std::filesystem;

    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format("Config includes nested deeper than {} levels",
                                             kMaxIncludeDepth));
    }
    const std::string canonical = fs::canonical(path).string();
    if (!chain.insert(canonical).second) {
        throw std::runtime_error(std::format("Circular config include: {}", canonical));
    }

    toml::table own = toml::parse_file(canonical);
    const auto includes = include_list(own);
    own.erase("include");

    toml::table merged;
    const fs::path dir = fs::path(canonical).parent_path();
    for (const auto& rel : includes) {
        overlay_table(merged, load_with_includes(dir / rel, chain, depth + 1));
    }
    overlay_table(merged, own);

    chain.erase(canonical);
    return merged;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> out;
    if (const auto* arr = tbl[key].as_array()) {
        out.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) out.emplace_back(s->get());
        }
    }
    return out;
}

// Negative counts collapse to 0 and are then rejected by validation
size_t count_or(const toml::table& tbl, std::string_view key, size_t fallback) {
    const int64_t v = tbl[key].value_or(static_cast<int64_t>(fallback));
    return v < 0 ? 0 : static_cast<size_t>(v);
}

std::chrono::milliseconds millis_or(const toml::table& tbl, std::string_view key,
                                    std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(tbl[key].value_or(static_cast<int64_t>(fallback.count())));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ListenerConfig ConfigLoader::extract_listener(const toml::table& root) {
    ListenerConfig cfg;
    const auto* listener = root["listener"].as_table();
    if (!listener) return cfg;
    const auto& l = *listener;

    cfg.host = l["host"].value_or(cfg.host);
    cfg.port = static_cast<int>(l["port"].value_or(int64_t{cfg.port}));
    cfg.max_client_connections = count_or(l, "max_client_connections", cfg.max_client_connections);
    return cfg;
}

BackendConfig ConfigLoader::extract_backend(const toml::table& root) {
    BackendConfig cfg;
    const auto* backend = root["backend"].as_table();
    if (!backend) return cfg;
    const auto& b = *backend;

    cfg.seeds = string_array(b, "seeds");
    cfg.max_connections = count_or(b, "max_connections", cfg.max_connections);
    cfg.pool_capacity = count_or(b, "pool_capacity", cfg.pool_capacity);
    cfg.min_idle_connections = count_or(b, "min_idle_connections", cfg.min_idle_connections);
    cfg.acquire_timeout = millis_or(b, "acquire_timeout_ms", cfg.acquire_timeout);
    cfg.connect_timeout = millis_or(b, "connect_timeout_ms", cfg.connect_timeout);
    cfg.message_timeout = millis_or(b, "message_timeout_ms", cfg.message_timeout);
    cfg.server_idle_timeout = millis_or(b, "server_idle_timeout_ms", cfg.server_idle_timeout);
    cfg.max_message_bytes = count_or(b, "max_message_bytes", cfg.max_message_bytes);
    return cfg;
}

SessionLimitsConfig ConfigLoader::extract_sessions(const toml::table& root) {
    SessionLimitsConfig cfg;
    const auto* sessions = root["sessions"].as_table();
    if (!sessions) return cfg;

    cfg.idle_timeout = millis_or(*sessions, "idle_timeout_ms", cfg.idle_timeout);
    cfg.write_timeout = millis_or(*sessions, "write_timeout_ms", cfg.write_timeout);
    return cfg;
}

ProbeConfig ConfigLoader::extract_topology(const toml::table& root) {
    ProbeConfig cfg;
    const auto* topology = root["topology"].as_table();
    if (!topology) return cfg;
    const auto& t = *topology;

    cfg.probe_interval = millis_or(t, "probe_interval_ms", cfg.probe_interval);
    cfg.probe_timeout = millis_or(t, "probe_timeout_ms", cfg.probe_timeout);
    cfg.unreachable_grace_cycles = static_cast<uint32_t>(
        count_or(t, "unreachable_grace_cycles", cfg.unreachable_grace_cycles));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

AdminConfig ConfigLoader::extract_admin(const toml::table& root) {
    AdminConfig cfg;
    const auto* admin = root["admin"].as_table();
    if (!admin) return cfg;
    const auto& a = *admin;

    cfg.enabled = a["enabled"].value_or(false);
    cfg.host = a["host"].value_or("127.0.0.1"s);
    cfg.port = static_cast<int>(a["port"].value_or(int64_t{cfg.port}));
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

ProxyConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ProxyConfig config;
    config.listener = extract_listener(tbl);
    config.backend = extract_backend(tbl);
    config.sessions = extract_sessions(tbl);
    config.topology = extract_topology(tbl);
    config.logging = extract_logging(tbl);
    config.admin = extract_admin(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ProxyConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        std::unordered_set<std::string> chain;
        auto tbl = load_with_includes(config_path, chain, 0);
        substitute_env_in_table(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        substitute_env_in_table(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ProxyConfig& config) {
    std::vector<std::string> errors;

    if (config.listener.port < 0 || config.listener.port > 65535) {
        errors.push_back(std::format("listener.port must be 0-65535, got {}", config.listener.port));
    }
    if (config.listener.max_client_connections == 0) {
        errors.push_back("listener.max_client_connections must be > 0");
    }

    const auto& backend = config.backend;
    if (backend.seeds.empty()) {
        errors.push_back("backend.seeds must list at least one member");
    }
    for (size_t i = 0; i < backend.seeds.size(); ++i) {
        if (!utils::split_host_port(backend.seeds[i])) {
            errors.push_back(std::format("backend.seeds[{}] \"{}\" is not host:port",
                                         i, backend.seeds[i]));
        }
    }
    if (backend.pool_capacity == 0) {
        errors.push_back("backend.pool_capacity must be > 0");
    }
    if (backend.min_idle_connections > backend.pool_capacity) {
        errors.push_back(std::format("backend.min_idle_connections ({}) > pool_capacity ({})",
                                     backend.min_idle_connections, backend.pool_capacity));
    }
    if (backend.max_message_bytes < wire::HEADER_SIZE) {
        errors.push_back(std::format("backend.max_message_bytes must be >= {}", wire::HEADER_SIZE));
    }

    const std::pair<const char*, std::chrono::milliseconds> timeouts[] = {
        {"backend.acquire_timeout_ms", backend.acquire_timeout},
        {"backend.connect_timeout_ms", backend.connect_timeout},
        {"backend.message_timeout_ms", backend.message_timeout},
        {"backend.server_idle_timeout_ms", backend.server_idle_timeout},
        {"sessions.idle_timeout_ms", config.sessions.idle_timeout},
        {"sessions.write_timeout_ms", config.sessions.write_timeout},
        {"topology.probe_interval_ms", config.topology.probe_interval},
        {"topology.probe_timeout_ms", config.topology.probe_timeout},
    };
    for (const auto& [name, value] : timeouts) {
        if (value.count() <= 0) {
            errors.push_back(std::format("{} must be > 0, got {}", name, value.count()));
        }
    }

    if (config.topology.unreachable_grace_cycles == 0) {
        errors.push_back("topology.unreachable_grace_cycles must be >= 1");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level \"{}\" is not one of debug, info, warn, error",
                                     config.logging.level));
    }

    if (config.admin.enabled && (config.admin.port < 0 || config.admin.port > 65535)) {
        errors.push_back(std::format("admin.port must be 0-65535, got {}", config.admin.port));
    }

    return errors;
}

} // namespace rsproxy
