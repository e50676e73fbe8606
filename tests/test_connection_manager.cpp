#include <catch2/catch_test_macros.hpp>
#include "db/connection_manager.hpp"
#include "mocks/fake_store.hpp"

#include <thread>

using namespace ledgerstore;
using namespace ledgerstore::testing;
using namespace std::chrono_literals;

namespace {

StoreConfig fast_config() {
    StoreConfig config;
    config.host = "localhost";
    config.max_connect_attempts = 3;
    config.backoff_base = 5ms;
    config.ping_timeout = 500ms;
    config.reconnect_timeout = 500ms;
    config.acquire_timeout = 200ms;
    return config;
}

struct Fixture {
    std::shared_ptr<FakeStore> store = std::make_shared<FakeStore>();
    ConnectionManager manager{fast_config(), std::make_shared<FakeConnectionFactory>(store)};
};

} // anonymous namespace

TEST_CASE("ConnectionManager: connect installs a session", "[connection_manager]") {
    Fixture f;
    CHECK(f.manager.state() == ConnectionState::DISCONNECTED);
    CHECK(f.manager.session() == nullptr);

    REQUIRE(f.manager.connect(Context::background()).is_ok());
    CHECK(f.manager.state() == ConnectionState::CONNECTED);
    CHECK(f.manager.session() != nullptr);
    CHECK(f.manager.is_healthy());
    CHECK(f.manager.connected_at().has_value());
    CHECK(f.manager.get_stats().error_count == 0);
}

TEST_CASE("ConnectionManager: connect retries then gives up", "[connection_manager]") {
    Fixture f;
    f.store->refuse_connections(true);

    auto result = f.manager.connect(Context::background());
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::UNAVAILABLE);
    CHECK(result.error_message().find("after 3 attempts") != std::string::npos);
    CHECK(f.store->connect_attempts() == 3);
    CHECK(f.manager.state() == ConnectionState::DISCONNECTED);
    CHECK(f.manager.session() == nullptr);

    const auto stats = f.manager.get_stats();
    CHECK(stats.error_count == 3);
    CHECK(stats.last_error.find("connection refused") != std::string::npos);
    CHECK(stats.last_error_time.has_value());
}

TEST_CASE("ConnectionManager: cancelled connect keeps the old session", "[connection_manager]") {
    Fixture f;
    REQUIRE(f.manager.connect(Context::background()).is_ok());
    const auto original = f.manager.session();

    f.store->refuse_connections(true);
    const auto ctx = Context::background();
    ctx.cancel();
    auto result = f.manager.connect(ctx);

    REQUIRE(result.is_error());
    CHECK(f.manager.session() == original);
    CHECK(f.manager.state() == ConnectionState::CONNECTED);
}

TEST_CASE("ConnectionManager: disconnect is idempotent", "[connection_manager]") {
    Fixture f;
    CHECK(f.manager.disconnect(Context::background()).is_ok());

    REQUIRE(f.manager.connect(Context::background()).is_ok());
    CHECK(f.manager.disconnect(Context::background()).is_ok());
    CHECK(f.manager.disconnect(Context::background()).is_ok());
    CHECK(f.manager.state() == ConnectionState::DISCONNECTED);
    CHECK(f.manager.session() == nullptr);
}

TEST_CASE("ConnectionManager: health when never connected", "[connection_manager][health]") {
    Fixture f;
    const auto health = f.manager.check_health(Context::background());

    CHECK(health.status == HealthStatus::UNHEALTHY);
    CHECK(health.message == "ImmuDB not connected");
    CHECK_FALSE(health.error.empty());
    CHECK(health.is_critical);
    CHECK(f.store->connect_attempts() == 0);
}

TEST_CASE("ConnectionManager: healthy session reports pool info", "[connection_manager][health]") {
    Fixture f;
    REQUIRE(f.manager.connect(Context::background()).is_ok());

    const auto health = f.manager.check_health(Context::background());
    CHECK(health.status == HealthStatus::HEALTHY);
    CHECK(health.name == ConnectionManager::kDependencyName);
    CHECK(health.type == DependencyType::DATABASE);
    CHECK(health.config.hostname == "localhost");
    REQUIRE(health.config.pool_info.has_value());
    CHECK(health.config.pool_info->max_connections == 25);
    CHECK_FALSE(health.last_success.empty());
    CHECK_FALSE(health.last_check.empty());
    CHECK(f.manager.last_health_check().has_value());
}

TEST_CASE("ConnectionManager: killed session reconnects once and recovers", "[connection_manager][health]") {
    Fixture f;
    REQUIRE(f.manager.connect(Context::background()).is_ok());
    const auto before = f.manager.session();
    const auto connects_before = f.store->connect_count();

    f.store->kill_sessions();
    const auto health = f.manager.check_health(Context::background());

    CHECK(health.status == HealthStatus::HEALTHY);
    CHECK(health.error.empty());
    CHECK(f.manager.state() == ConnectionState::CONNECTED);
    CHECK(f.manager.session() != before);
    CHECK(f.store->connect_count() == connects_before + 1);
}

TEST_CASE("ConnectionManager: failed reconnect reports unhealthy", "[connection_manager][health]") {
    Fixture f;
    REQUIRE(f.manager.connect(Context::background()).is_ok());

    f.store->kill_sessions();
    f.store->refuse_connections(true);
    const auto attempts_before = f.store->connect_attempts();

    const auto health = f.manager.check_health(Context::background());
    CHECK(health.status == HealthStatus::UNHEALTHY);
    CHECK(health.message == "ImmuDB health check failed");
    CHECK(health.error.find("reconnection failed") != std::string::npos);
    CHECK(f.store->connect_attempts() == attempts_before + 1);
    CHECK(f.manager.state() == ConnectionState::DISCONNECTED);
    CHECK(f.manager.session() == nullptr);
    CHECK_FALSE(f.manager.is_healthy());

    // Store back: the next check reconnects
    f.store->refuse_connections(false);
    const auto recovered = f.manager.check_health(Context::background());
    CHECK(recovered.status == HealthStatus::HEALTHY);
    CHECK(f.manager.state() == ConnectionState::CONNECTED);
}

TEST_CASE("ConnectionManager: non-session ping failure does not reconnect", "[connection_manager][health]") {
    Fixture f;
    REQUIRE(f.manager.connect(Context::background()).is_ok());
    const auto connects_before = f.store->connect_count();

    f.store->fail_when("SELECT 1", "internal error: disk full");
    const auto health = f.manager.check_health(Context::background());

    CHECK(health.status == HealthStatus::UNHEALTHY);
    CHECK(health.error.find("disk full") != std::string::npos);
    CHECK(f.store->connect_count() == connects_before);
    CHECK(f.manager.state() == ConnectionState::CONNECTED);
}

TEST_CASE("ConnectionManager: health check stays bounded during a slow connect", "[connection_manager][health]") {
    auto store = std::make_shared<FakeStore>();
    auto config = fast_config();
    config.max_connect_attempts = 6;
    config.backoff_base = 200ms;
    config.ping_timeout = 100ms;
    config.reconnect_timeout = 100ms;
    ConnectionManager manager{config, std::make_shared<FakeConnectionFactory>(store)};
    REQUIRE(manager.connect(Context::background()).is_ok());

    store->kill_sessions();
    store->refuse_connections(true);
    const auto attempts_before = store->connect_attempts();

    // Backs off 200ms, 400ms, 800ms, ... while holding the connect lock
    const auto connect_ctx = Context::background();
    std::thread slow_connect([&] { (void)manager.connect(connect_ctx); });
    while (store->connect_attempts() == attempts_before) {
        std::this_thread::sleep_for(1ms);
    }

    const auto start = std::chrono::steady_clock::now();
    const auto health = manager.check_health(Context::background());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    connect_ctx.cancel();
    slow_connect.join();

    CHECK(health.status == HealthStatus::UNHEALTHY);
    CHECK(health.error.find("in-flight connect") != std::string::npos);
    CHECK(elapsed < 1s);
    CHECK(manager.state() == ConnectionState::CONNECTED);
}
