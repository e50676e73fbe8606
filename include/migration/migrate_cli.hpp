#pragma once

#include "config/config_types.hpp"
#include "core/context.hpp"
#include "core/error.hpp"
#include "db/iconnection_factory.hpp"

#include <chrono>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ledgerstore {

/**
 * @brief Parsed ledger_migrate command line
 *
 * Flags left unset do not touch the loaded configuration.
 */
struct MigrateOptions {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> config_file;
    std::optional<std::string> migrations_path;
    std::optional<std::string> service_name;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<bool> dry_run;
    bool verbose = false;
};

/**
 * @brief Parse arguments (program name excluded)
 *
 * Accepts "--flag value" and "--flag=value".
 * @return INVALID_ARGUMENT for a missing command, unknown flag or bad value
 */
[[nodiscard]] Result<MigrateOptions> parse_migrate_args(const std::vector<std::string>& args);

/// Overlay the flags that were given onto the loaded configuration
void apply_migrate_options(const MigrateOptions& opts, LedgerConfig& config);

[[nodiscard]] bool is_migrate_command(const std::string& command);

void print_migrate_usage(std::ostream& out);

/**
 * @brief Run one ledger_migrate invocation
 *
 * validate and create never touch the store; up and status connect
 * through `factory`. Cancelling `root` aborts a running command.
 *
 * @return Process exit code: 0 on success, 1 on any failure
 */
int run_migrate(const std::vector<std::string>& args, const Context& root,
                std::shared_ptr<IConnectionFactory> factory,
                std::ostream& out, std::ostream& err);

} // namespace ledgerstore
