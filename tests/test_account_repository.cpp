#include <catch2/catch_test_macros.hpp>
#include "account/account_repository.hpp"
#include "db/generic_connection_pool.hpp"
#include "mocks/fake_store.hpp"

#include <atomic>
#include <format>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ledgerstore;
using namespace ledgerstore::testing;
using namespace std::chrono_literals;

namespace {

constexpr const char* kAccountsDdl =
    "CREATE TABLE IF NOT EXISTS accounts ("
    " id VARCHAR[36], name VARCHAR[255], external_id VARCHAR[255],"
    " external_group_id VARCHAR[255], currency_code VARCHAR[3], account_type VARCHAR[20],"
    " created_at TIMESTAMP, updated_at TIMESTAMP, version INTEGER,"
    " PRIMARY KEY (id))";

struct RepoFixture {
    std::shared_ptr<FakeStore> store = std::make_shared<FakeStore>();
    std::shared_ptr<GenericConnectionPool> pool;
    AccountRepository repo{[this] { return std::static_pointer_cast<IConnectionPool>(pool); }};

    RepoFixture() {
        PoolConfig config;
        config.min_connections = 1;
        config.max_connections = 16;
        config.acquire_timeout = 2s;
        pool = GenericConnectionPool::create("ledgerdb", config, std::make_shared<FakeConnectionFactory>(store));
        auto conn = pool->acquire(Context::background());
        if (conn.is_error() || !(*conn.value())->execute(SqlStatement{kAccountsDdl}, Context::background()).success) {
            throw std::runtime_error("could not create accounts table");
        }
    }

    Account create(const std::string& external_id, AccountType type = AccountType::ASSET,
                   const std::string& currency = "USD") {
        Account a;
        a.name = "Account " + external_id;
        a.external_id = external_id;
        a.currency_code = currency;
        a.account_type = type;
        auto created = repo.create(Context::background(), a);
        if (created.is_error()) {
            throw std::runtime_error(created.error_message());
        }
        return created.value();
    }
};

} // anonymous namespace

TEST_CASE("AccountRepository: create then get returns version 1", "[account][repository]") {
    RepoFixture f;
    const auto created = f.create("cash-001");

    CHECK_FALSE(created.id.empty());
    CHECK(created.version == 1);
    CHECK(created.created_at == created.updated_at);

    auto fetched = f.repo.get_by_id(Context::background(), created.id);
    REQUIRE(fetched.is_ok());
    CHECK(fetched.value().version == 1);
    CHECK(fetched.value().external_id == "cash-001");
    CHECK(fetched.value().created_at == created.created_at);
    CHECK(fetched.value().created_at.time_since_epoch().count() > 0);
    CHECK_FALSE(fetched.value().external_group_id.has_value());

    auto by_ext = f.repo.get_by_external_id(Context::background(), "cash-001");
    REQUIRE(by_ext.is_ok());
    CHECK(by_ext.value().id == created.id);
}

TEST_CASE("AccountRepository: duplicate external id", "[account][repository]") {
    RepoFixture f;
    f.create("dup-1");

    Account again;
    again.name = "Second";
    again.external_id = "dup-1";
    again.currency_code = "EUR";
    auto result = f.repo.create(Context::background(), again);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::ALREADY_EXISTS);
    CHECK(f.store->row_count("accounts") == 1);
}

TEST_CASE("AccountRepository: duplicate reported by the store", "[account][repository]") {
    RepoFixture f;
    f.store->fail_when("INSERT INTO accounts", "tx already exists: key already exists");

    Account a;
    a.name = "Racer";
    a.external_id = "race-1";
    a.currency_code = "USD";
    auto result = f.repo.create(Context::background(), a);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::ALREADY_EXISTS);
}

TEST_CASE("AccountRepository: create rejects invalid input without a lease", "[account][repository]") {
    RepoFixture f;
    Account a;
    a.name = "Bad";
    a.external_id = "bad-1";
    a.currency_code = "usd";

    const auto writes = f.store->write_count();
    auto result = f.repo.create(Context::background(), a);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(f.store->write_count() == writes);
}

TEST_CASE("AccountRepository: missing rows are NOT_FOUND", "[account][repository]") {
    RepoFixture f;

    auto by_id = f.repo.get_by_id(Context::background(), "6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    REQUIRE(by_id.is_error());
    CHECK(by_id.error_code() == ErrorCode::NOT_FOUND);
    CHECK(by_id.error_message() == "account 6ba7b810-9dad-11d1-80b4-00c04fd430c8 not found");

    auto by_ext = f.repo.get_by_external_id(Context::background(), "nobody");
    REQUIRE(by_ext.is_error());
    CHECK(by_ext.error_message() == "account with external_id nobody not found");

    CHECK(f.repo.get_by_id(Context::background(), "").error_code() == ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE("AccountRepository: no session means UNAVAILABLE", "[account][repository]") {
    AccountRepository repo([] { return std::shared_ptr<IConnectionPool>{}; });

    auto result = repo.get_by_external_id(Context::background(), "cash-001");
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::UNAVAILABLE);
    CHECK(result.error_message() == "storage unavailable: not connected");
}

TEST_CASE("AccountRepository: update advances version by one", "[account][repository]") {
    RepoFixture f;
    const auto created = f.create("rev-1", AccountType::REVENUE);

    auto updated = f.repo.update(Context::background(), created.id,
        {{"name", "Subscription Revenue"}, {"external_group_id", "saas"}}, 1);
    REQUIRE(updated.is_ok());
    CHECK(updated.value().version == 2);
    CHECK(updated.value().name == "Subscription Revenue");
    CHECK(updated.value().external_group_id == std::optional<std::string>("saas"));
    CHECK(updated.value().updated_at > created.updated_at);
    CHECK(updated.value().created_at == created.created_at);

    auto reread = f.repo.get_by_id(Context::background(), created.id);
    REQUIRE(reread.is_ok());
    CHECK(reread.value().version == 2);

    auto retyped = f.repo.update(Context::background(), created.id,
        {{"account_type", "account_type_expense"}, {"external_group_id", std::nullopt}}, 2);
    REQUIRE(retyped.is_ok());
    CHECK(retyped.value().version == 3);
    CHECK(retyped.value().account_type == AccountType::EXPENSE);
    CHECK_FALSE(retyped.value().external_group_id.has_value());
}

TEST_CASE("AccountRepository: stale version is ABORTED", "[account][repository]") {
    RepoFixture f;
    const auto created = f.create("liab-1", AccountType::LIABILITY);
    REQUIRE(f.repo.update(Context::background(), created.id, {{"name", "First"}}, 1).is_ok());

    auto stale = f.repo.update(Context::background(), created.id, {{"name", "Second"}}, 1);
    REQUIRE(stale.is_error());
    CHECK(stale.error_code() == ErrorCode::ABORTED);
    CHECK(stale.error_message().find("modified concurrently") != std::string::npos);

    auto current = f.repo.get_by_id(Context::background(), created.id);
    REQUIRE(current.is_ok());
    CHECK(current.value().name == "First");
    CHECK(current.value().version == 2);
}

TEST_CASE("AccountRepository: update of missing row is NOT_FOUND", "[account][repository]") {
    RepoFixture f;
    auto result = f.repo.update(Context::background(), "6ba7b810-9dad-11d1-80b4-00c04fd430c8",
        {{"name", "Ghost"}}, 1);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::NOT_FOUND);
}

TEST_CASE("AccountRepository: store version conflict error", "[account][repository]") {
    RepoFixture f;
    const auto created = f.create("eq-1", AccountType::EQUITY);
    f.store->fail_when("UPDATE accounts", "version mismatch");

    auto result = f.repo.update(Context::background(), created.id, {{"name", "Owner Equity"}}, 1);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::ABORTED);
}

TEST_CASE("AccountRepository: one winner per version under concurrency", "[account][repository][concurrency]") {
    RepoFixture f;
    const auto created = f.create("hot-1");

    constexpr int kWriters = 8;
    std::atomic<int> wins{0};
    std::atomic<int> aborted{0};
    std::atomic<int> other{0};
    std::vector<std::thread> writers;
    for (int i = 0; i < kWriters; ++i) {
        writers.emplace_back([&, i] {
            auto result = f.repo.update(Context::background(), created.id,
                {{"name", "Writer " + std::to_string(i)}}, 1);
            if (result.is_ok()) {
                wins.fetch_add(1);
            } else if (result.error_code() == ErrorCode::ABORTED) {
                aborted.fetch_add(1);
            } else {
                other.fetch_add(1);
            }
        });
    }
    for (auto& t : writers) t.join();

    CHECK(wins.load() == 1);
    CHECK(aborted.load() == kWriters - 1);
    CHECK(other.load() == 0);

    auto final_row = f.repo.get_by_id(Context::background(), created.id);
    REQUIRE(final_row.is_ok());
    CHECK(final_row.value().version == 2);
}

TEST_CASE("AccountRepository: rejected updates issue no writes", "[account][repository]") {
    RepoFixture f;
    const auto created = f.create("imm-1");
    const auto writes = f.store->write_count();

    SECTION("immutable external id") {
        auto r = f.repo.update(Context::background(), created.id, {{"external_id", "other"}}, 1);
        REQUIRE(r.is_error());
        CHECK(r.error_code() == ErrorCode::INVALID_ARGUMENT);
        CHECK(r.error_message() == "field external_id is immutable");
    }
    SECTION("immutable currency after a valid field") {
        auto r = f.repo.update(Context::background(), created.id,
            {{"name", "Fine"}, {"currency_code", "EUR"}}, 1);
        CHECK(r.error_code() == ErrorCode::INVALID_ARGUMENT);
    }
    SECTION("version is not caller-settable") {
        CHECK(f.repo.update(Context::background(), created.id, {{"version", "9"}}, 1).error_code()
              == ErrorCode::INVALID_ARGUMENT);
    }
    SECTION("unknown field") {
        CHECK(f.repo.update(Context::background(), created.id, {{"balance", "10"}}, 1).error_message()
              == "unknown field balance");
    }
    SECTION("invalid value") {
        CHECK(f.repo.update(Context::background(), created.id, {{"account_type", "CONTRA"}}, 1).error_code()
              == ErrorCode::INVALID_ARGUMENT);
    }
    SECTION("expected version below one") {
        CHECK(f.repo.update(Context::background(), created.id, {{"name", "x"}}, 0).error_code()
              == ErrorCode::INVALID_ARGUMENT);
    }
    SECTION("nothing to update") {
        CHECK(f.repo.update(Context::background(), created.id, {}, 1).error_code()
              == ErrorCode::INVALID_ARGUMENT);
    }

    CHECK(f.store->write_count() == writes);
    CHECK(f.store->statements_containing("UPDATE") == 0);
}

TEST_CASE("AccountRepository: list pages through every row once", "[account][repository][list]") {
    RepoFixture f;
    for (int i = 0; i < 25; ++i) {
        f.create(std::format("acct-{:02d}", i));
    }

    ListFilter filter;
    filter.page_size = 10;
    auto first = f.repo.list(Context::background(), filter);
    REQUIRE(first.is_ok());
    CHECK(first.value().accounts.size() == 10);
    CHECK(first.value().total_count == 25);
    CHECK_FALSE(first.value().next_page_token.empty());
    // Newest first
    CHECK(first.value().accounts.front().external_id == "acct-24");

    std::set<std::string> seen;
    size_t pages = 0;
    std::string token;
    do {
        filter.page_token = token;
        auto page = f.repo.list(Context::background(), filter);
        REQUIRE(page.is_ok());
        for (const auto& a : page.value().accounts) {
            CHECK(seen.insert(a.id).second);
        }
        token = page.value().next_page_token;
        ++pages;
    } while (!token.empty() && pages < 10);

    CHECK(pages == 3);
    CHECK(seen.size() == 25);
}

TEST_CASE("AccountRepository: list filters", "[account][repository][list]") {
    RepoFixture f;
    f.create("cash-usd", AccountType::ASSET, "USD");
    f.create("cash-eur", AccountType::ASSET, "EUR");
    f.create("loan-usd", AccountType::LIABILITY, "USD");

    ListFilter by_type;
    by_type.account_type = AccountType::ASSET;
    auto assets = f.repo.list(Context::background(), by_type);
    REQUIRE(assets.is_ok());
    CHECK(assets.value().total_count == 2);
    CHECK(assets.value().next_page_token.empty());

    ListFilter by_currency;
    by_currency.currency_code = "USD";
    by_currency.account_type = AccountType::LIABILITY;
    auto loans = f.repo.list(Context::background(), by_currency);
    REQUIRE(loans.is_ok());
    REQUIRE(loans.value().accounts.size() == 1);
    CHECK(loans.value().accounts[0].external_id == "loan-usd");

    ListFilter by_name;
    by_name.name_search = "CASH";
    auto cash = f.repo.list(Context::background(), by_name);
    REQUIRE(cash.is_ok());
    CHECK(cash.value().total_count == 2);

    ListFilter none;
    none.external_group_id = "missing";
    auto empty = f.repo.list(Context::background(), none);
    REQUIRE(empty.is_ok());
    CHECK(empty.value().accounts.empty());
    CHECK(empty.value().total_count == 0);
}

TEST_CASE("AccountRepository: list argument errors", "[account][repository][list]") {
    RepoFixture f;

    ListFilter negative;
    negative.page_size = -1;
    CHECK(f.repo.list(Context::background(), negative).error_code() == ErrorCode::INVALID_ARGUMENT);

    ListFilter bad_token;
    bad_token.page_token = "abc";
    CHECK(f.repo.list(Context::background(), bad_token).error_code() == ErrorCode::INVALID_ARGUMENT);

    ListFilter negative_token;
    negative_token.page_token = "-5";
    CHECK(f.repo.list(Context::background(), negative_token).error_code() == ErrorCode::INVALID_ARGUMENT);

    ListFilter huge;
    huge.page_size = 10000;
    auto capped = f.repo.list(Context::background(), huge);
    REQUIRE(capped.is_ok());
    CHECK(f.store->statements_containing("LIMIT 200 OFFSET 0") == 1);
}

TEST_CASE("AccountRepository: lost session is UNAVAILABLE", "[account][repository]") {
    RepoFixture f;
    const auto created = f.create("sess-1");
    f.store->kill_sessions();

    auto result = f.repo.get_by_id(Context::background(), created.id);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::UNAVAILABLE);

    // The dead lease was discarded; a fresh connection works
    auto again = f.repo.get_by_id(Context::background(), created.id);
    REQUIRE(again.is_ok());
}

TEST_CASE("AccountRepository: confirmed writes are reported", "[account][repository][verify]") {
    RepoFixture f;
    std::atomic<int> verified{0};
    AccountRepository repo{[&f] { return std::static_pointer_cast<IConnectionPool>(f.pool); },
                           "accounts", [&verified] { verified.fetch_add(1); }};

    Account a;
    a.name = "Verified cash";
    a.external_id = "ver-1";
    a.currency_code = "EUR";
    a.account_type = AccountType::ASSET;

    const auto reads_before = f.store->statements_containing("WHERE id =");
    auto created = repo.create(Context::background(), a);
    REQUIRE(created.is_ok());
    CHECK(verified.load() == 1);
    CHECK(f.store->statements_containing("WHERE id =") == reads_before + 1);

    auto updated = repo.update(Context::background(), created.value().id,
                               {{"name", std::string("Verified cash 2")}}, 1);
    REQUIRE(updated.is_ok());
    CHECK(verified.load() == 2);

    // A lost race is not a confirmed write
    auto stale = repo.update(Context::background(), created.value().id,
                             {{"name", std::string("Too late")}}, 1);
    CHECK(stale.error_code() == ErrorCode::ABORTED);
    CHECK(verified.load() == 2);
}

TEST_CASE("AccountRepository: create without a hook skips the read-back", "[account][repository][verify]") {
    RepoFixture f;
    const auto reads_before = f.store->statements_containing("WHERE id =");
    f.create("plain-1");
    CHECK(f.store->statements_containing("WHERE id =") == reads_before);
}

TEST_CASE("AccountRepository: unreadable insert fails verification", "[account][repository][verify]") {
    RepoFixture f;
    int verified = 0;
    AccountRepository repo{[&f] { return std::static_pointer_cast<IConnectionPool>(f.pool); },
                           "accounts", [&verified] { ++verified; }};

    Account a;
    a.name = "Lost write";
    a.external_id = "ver-2";
    a.currency_code = "USD";
    a.account_type = AccountType::EXPENSE;

    f.store->fail_when("WHERE id =", "tx not found");
    auto created = repo.create(Context::background(), a);
    REQUIRE(created.is_error());
    CHECK(created.error_message().find("not readable after insert") != std::string::npos);
    CHECK(verified == 0);
}
