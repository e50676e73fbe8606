#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/sql_statement.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <algorithm>
#include <utility>

namespace ledgerstore {

// ============================================================================
// TOML Parsing Helpers (env expansion, durations)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

/// Duration key: string ("5s", "250ms") or integer milliseconds
std::chrono::milliseconds toml_duration(const toml::table& tbl, std::string_view key,
                                        std::chrono::milliseconds fallback) {
    const auto node = tbl[key];
    if (const auto* s = node.as_string()) {
        const auto parsed = ConfigLoader::parse_duration(s->get());
        if (!parsed) {
            throw std::runtime_error(std::format("invalid duration for '{}': \"{}\"", key, s->get()));
        }
        return *parsed;
    }
    if (const auto* i = node.as_integer()) {
        return std::chrono::milliseconds{i->get()};
    }
    return fallback;
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

bool parse_bool(const std::string& text, bool& out) {
    const auto lower = utils::to_lower(utils::trim(text));
    if (lower == "true" || lower == "1" || lower == "yes") { out = true; return true; }
    if (lower == "false" || lower == "0" || lower == "no") { out = false; return true; }
    return false;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::optional<std::chrono::milliseconds> ConfigLoader::parse_duration(const std::string& text) {
    const std::string s = utils::trim(text);
    if (s.empty()) return std::nullopt;

    size_t digits = 0;
    while (digits < s.size() && s[digits] >= '0' && s[digits] <= '9') ++digits;
    if (digits == 0) return std::nullopt;

    const auto value = utils::try_parse_int<int64_t>(std::string_view(s).substr(0, digits));
    if (!value) return std::nullopt;

    const std::string unit = s.substr(digits);
    if (unit.empty() || unit == "s") return std::chrono::seconds{*value};
    if (unit == "ms") return std::chrono::milliseconds{*value};
    if (unit == "m") return std::chrono::minutes{*value};
    if (unit == "h") return std::chrono::hours{*value};
    return std::nullopt;
}

ServiceConfig ConfigLoader::extract_service(const toml::table& root) {
    ServiceConfig cfg;
    const auto* s = root["service"].as_table();
    if (!s) return cfg;
    cfg.name = (*s)["name"].value_or(cfg.name);
    cfg.environment = (*s)["environment"].value_or(cfg.environment);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* l = root["logging"].as_table();
    if (!l) return cfg;
    cfg.level = (*l)["level"].value_or(cfg.level);
    return cfg;
}

StoreConfig ConfigLoader::extract_store(const toml::table& root) {
    StoreConfig cfg;
    const auto* sec = root["store"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = static_cast<uint32_t>(s["port"].value_or(static_cast<int64_t>(cfg.port)));
    cfg.database = s["database"].value_or(cfg.database);
    cfg.username = s["username"].value_or(cfg.username);
    cfg.password = s["password"].value_or(cfg.password);
    cfg.sslmode = s["sslmode"].value_or(cfg.sslmode);

    cfg.min_connections = s["min_connections"].value_or(cfg.min_connections);
    cfg.max_connections = s["max_connections"].value_or(cfg.max_connections);
    cfg.max_connect_attempts = static_cast<int>(s["max_connect_attempts"].value_or(static_cast<int64_t>(cfg.max_connect_attempts)));

    cfg.backoff_base = toml_duration(s, "backoff_base", cfg.backoff_base);
    cfg.connect_timeout = toml_duration(s, "connect_timeout", cfg.connect_timeout);
    cfg.acquire_timeout = toml_duration(s, "acquire_timeout", cfg.acquire_timeout);
    cfg.ping_timeout = toml_duration(s, "ping_timeout", cfg.ping_timeout);
    cfg.reconnect_timeout = toml_duration(s, "reconnect_timeout", cfg.reconnect_timeout);
    cfg.health_check_interval = std::chrono::duration_cast<std::chrono::seconds>(
        toml_duration(s, "health_check_interval", cfg.health_check_interval));
    cfg.verify_transactions = s["verify_transactions"].value_or(cfg.verify_transactions);
    return cfg;
}

MigrationConfig ConfigLoader::extract_migration(const toml::table& root) {
    MigrationConfig cfg;
    const auto* sec = root["migration"].as_table();
    if (!sec) return cfg;
    const auto& m = *sec;

    cfg.migrations_path = m["path"].value_or(cfg.migrations_path);
    cfg.run_on_boot = m["run_on_boot"].value_or(cfg.run_on_boot);
    cfg.dry_run = m["dry_run"].value_or(cfg.dry_run);
    cfg.timeout = toml_duration(m, "timeout", cfg.timeout);
    cfg.table_name = m["table"].value_or(cfg.table_name);
    cfg.service_name = m["service"].value_or(cfg.service_name);
    cfg.applied_by = m["applied_by"].value_or(cfg.applied_by);
    cfg.use_transactions = m["use_transactions"].value_or(cfg.use_transactions);
    cfg.verify_index_tables_empty = m["verify_index_tables_empty"].value_or(cfg.verify_index_tables_empty);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

LedgerConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    LedgerConfig config;
    config.service = extract_service(root);
    config.logging = extract_logging(root);
    config.store = extract_store(root);
    config.migration = extract_migration(root);
    return config;
}

std::vector<std::string> ConfigLoader::apply_env_overrides(LedgerConfig& config) {
    std::vector<std::string> errors;
    auto& store = config.store;
    auto& migration = config.migration;

    if (const char* v = env("IMMUDB_HOST")) store.host = v;
    if (const char* v = env("IMMUDB_PORT")) {
        if (const auto port = utils::try_parse_int<uint32_t>(v)) {
            store.port = *port;
        } else {
            errors.push_back(std::format("IMMUDB_PORT is not a number: \"{}\"", v));
        }
    }
    if (const char* v = env("IMMUDB_DATABASE")) store.database = v;
    if (const char* v = env("IMMUDB_USERNAME")) store.username = v;
    if (const char* v = env("IMMUDB_PASSWORD")) store.password = v;
    if (const char* v = env("IMMUDB_MAX_CONNECTIONS")) {
        if (const auto n = utils::try_parse_int<int64_t>(v)) {
            store.max_connections = *n;
        } else {
            errors.push_back(std::format("IMMUDB_MAX_CONNECTIONS is not a number: \"{}\"", v));
        }
    }
    if (const char* v = env("IMMUDB_VERIFY_TRANSACTIONS")) {
        if (!parse_bool(v, store.verify_transactions)) {
            errors.push_back(std::format("IMMUDB_VERIFY_TRANSACTIONS is not a boolean: \"{}\"", v));
        }
    }
    if (const char* v = env("IMMUDB_PING_TIMEOUT")) {
        if (const auto d = parse_duration(v)) {
            store.ping_timeout = *d;
        } else {
            errors.push_back(std::format("IMMUDB_PING_TIMEOUT is not a duration: \"{}\"", v));
        }
    }

    if (const char* v = env("LEDGER_MIGRATION_PATH")) migration.migrations_path = v;
    if (const char* v = env("LEDGER_MIGRATION_RUN_ON_BOOT")) {
        if (!parse_bool(v, migration.run_on_boot)) {
            errors.push_back(std::format("LEDGER_MIGRATION_RUN_ON_BOOT is not a boolean: \"{}\"", v));
        }
    }
    if (const char* v = env("LEDGER_MIGRATION_TIMEOUT")) {
        if (const auto d = parse_duration(v)) {
            migration.timeout = *d;
        } else {
            errors.push_back(std::format("LEDGER_MIGRATION_TIMEOUT is not a duration: \"{}\"", v));
        }
    }
    if (const char* v = env("LEDGER_MIGRATION_TABLE")) migration.table_name = v;
    if (const char* v = env("LOG_LEVEL")) config.logging.level = v;

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::finish(LedgerConfig config) {
    auto errors = apply_env_overrides(config);
    const auto validation = validate_config(config);
    errors.insert(errors.end(), validation.begin(), validation.end());

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
        const auto tbl = parse_toml_file(config_path);
        return finish(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error in {}: {}", config_path, e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return finish(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_env() {
    return finish(LedgerConfig{});
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const LedgerConfig& config) {
    std::vector<std::string> errors;

    const auto& env_name = config.service.environment;
    if (env_name != "dev" && env_name != "staging" && env_name != "prod" && env_name != "local") {
        errors.push_back(std::format(
            "service.environment must be one of dev, staging, prod, local, got \"{}\"", env_name));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got \"{}\"", config.logging.level));
    }

    const auto& store = config.store;
    if (store.host.empty()) {
        errors.push_back("store.host must not be empty");
    }
    if (store.port < 1 || store.port > 65535) {
        errors.push_back(std::format("store.port must be 1-65535, got {}", store.port));
    }
    if (store.database.empty()) {
        errors.push_back("store.database must not be empty");
    }
    if (store.username.empty()) {
        errors.push_back("store.username must not be empty");
    }
    if (store.max_connections < 1) {
        errors.push_back(std::format("store.max_connections must be >= 1, got {}", store.max_connections));
    }
    if (store.min_connections < 0) {
        errors.push_back(std::format("store.min_connections must be >= 0, got {}", store.min_connections));
    } else if (store.min_connections > store.max_connections) {
        errors.push_back(std::format("store.min_connections ({}) > max_connections ({})",
            store.min_connections, store.max_connections));
    }
    if (store.max_connect_attempts < 1) {
        errors.push_back("store.max_connect_attempts must be >= 1");
    }
    const std::pair<const char*, std::chrono::milliseconds> durations[] = {
        {"store.backoff_base", store.backoff_base},
        {"store.connect_timeout", store.connect_timeout},
        {"store.acquire_timeout", store.acquire_timeout},
        {"store.ping_timeout", store.ping_timeout},
        {"store.reconnect_timeout", store.reconnect_timeout},
        {"store.health_check_interval", store.health_check_interval},
    };
    for (const auto& [name, value] : durations) {
        if (value.count() <= 0) {
            errors.push_back(std::format("{} must be > 0, got {}ms", name, value.count()));
        }
    }

    const auto& migration = config.migration;
    if (migration.migrations_path.empty()) {
        errors.push_back("migration.path must not be empty");
    }
    if (migration.timeout.count() <= 0) {
        errors.push_back(std::format("migration.timeout must be > 0, got {}ms", migration.timeout.count()));
    }
    if (migration.service_name.empty()) {
        errors.push_back("migration.service must not be empty");
    }
    if (safe_identifier(migration.ledger_table()).empty()) {
        errors.push_back(std::format(
            "migration.table must contain only letters, digits and '_', got \"{}\"",
            migration.ledger_table()));
    }

    return errors;
}

} // namespace ledgerstore
