#include "core/build_info.hpp"
#include "core/context.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "service/ledger_service.hpp"

#include <csignal>
#include <filesystem>
#include <format>
#include <memory>

using namespace ledgerstore;

// Cancelled by SIGINT/SIGTERM; every blocking call below observes it
Context g_root;

void signal_handler(int /*signal*/) {
    g_root.cancel();
}

int main(int argc, char* argv[]) {
    try {
        const BuildInfo build = BuildInfo::current();
        utils::log::info(std::format("Ledger Service starting... {}", build.summary()));

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/ledger.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/{}] Loading configuration from {}",
            LedgerService::kBootSteps, config_file));

        ConfigLoader::LoadResult loaded;
        if (std::filesystem::exists(config_file)) {
            loaded = ConfigLoader::load_from_file(config_file);
        } else {
            utils::log::warn(std::format("{} not found - using defaults and environment", config_file));
            loaded = ConfigLoader::load_from_env();
        }
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return 1;
        }
        const LedgerConfig config = loaded.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        utils::log::info(std::format("Service: {} ({})", config.service.name, config.service.environment));

        LedgerService service(config, build, std::make_shared<PgConnectionFactory>());

        auto started = service.start(g_root);
        if (started.is_error()) {
            utils::log::error(std::format("Fatal: {}", started.error_message()));
            return 1;
        }

        utils::log::info(std::format("Ledger Service ready (storage {}, health every {}s)",
            service.storage_available() ? "available" : "DEGRADED",
            config.store.health_check_interval.count()));

        service.log_health(g_root.with_timeout(config.store.ping_timeout + config.store.reconnect_timeout));
        while (g_root.sleep_for(config.store.health_check_interval)) {
            service.log_health(g_root.with_timeout(config.store.ping_timeout + config.store.reconnect_timeout));
        }

        utils::log::info("Shutdown signal received, stopping...");
        service.shutdown(Context::background().with_timeout(std::chrono::seconds(5)));
        utils::log::info("Ledger Service stopped");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
