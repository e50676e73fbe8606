#include "core/context.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "migration/migrate_cli.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace ledgerstore;

namespace {

Context g_root;

void signal_handler(int /*signal*/) {
    g_root.cancel();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::vector<std::string> args(argv + 1, argv + argc);
    return run_migrate(args, g_root, std::make_shared<PgConnectionFactory>(), std::cout, std::cerr);
}
