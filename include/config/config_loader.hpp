#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ledgerstore {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        LedgerConfig config;

        static LoadResult ok(LedgerConfig cfg) {
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
     * @param config_path Path to ledger.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Defaults + environment overrides, no file
     */
    [[nodiscard]] static LoadResult load_from_env();

    /**
     * @brief Apply IMMUDB_* / LEDGER_MIGRATION_* / LOG_LEVEL variables
     * @return One message per unparseable variable
     */
    static std::vector<std::string> apply_env_overrides(LedgerConfig& config);

    [[nodiscard]] static std::vector<std::string> validate_config(const LedgerConfig& config);

    /**
     * @brief Parse "250ms", "5s", "2m", "1h"; a bare number is seconds
     */
    [[nodiscard]] static std::optional<std::chrono::milliseconds> parse_duration(const std::string& text);

private:
    static ServiceConfig extract_service(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static StoreConfig extract_store(const toml::table& root);
    static MigrationConfig extract_migration(const toml::table& root);

    static LedgerConfig extract_all_sections(const toml::table& root);
    static LoadResult finish(LedgerConfig config);
};

} // namespace ledgerstore
