#pragma once

#include "account/account.hpp"
#include "account/account_validator.hpp"
#include "core/context.hpp"
#include "core/error.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace ledgerstore {

/**
 * @brief Account storage contract consumed by the transport layer
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    [[nodiscard]] virtual Result<Account> create(const Context& ctx, Account account) = 0;

    [[nodiscard]] virtual Result<Account> get_by_id(const Context& ctx, const std::string& id) = 0;

    [[nodiscard]] virtual Result<Account> get_by_external_id(const Context& ctx,
                                                             const std::string& external_id) = 0;

    [[nodiscard]] virtual Result<Account> update(const Context& ctx, const std::string& id,
                                                 const FieldUpdates& updates,
                                                 int64_t expected_version) = 0;

    [[nodiscard]] virtual Result<AccountPage> list(const Context& ctx, const ListFilter& filter) = 0;
};

/// Called once per write confirmed by reading it back
using WriteVerifiedHook = std::function<void()>;

/**
 * @brief Versioned accounts on the append-only store
 *
 * The store cannot report affected rows or enforce uniqueness beyond the
 * primary key, so:
 * - create() looks up external_id before inserting and also classifies the
 *   insert's error text;
 * - update() writes with WHERE id = ? AND version = ?, then re-reads the
 *   row and requires both the new version and this write's updated_at
 *   stamp. Stamps are unique per process, so a lost race is always seen.
 *
 * With a WriteVerifiedHook, create() also reads its row back and every
 * confirmed write is reported to the hook.
 *
 * Every call leases its own connection; instances are thread-safe.
 */
class AccountRepository : public IAccountRepository {
public:
    explicit AccountRepository(SessionProvider session, std::string table = "accounts",
                               WriteVerifiedHook on_verified = {});

    [[nodiscard]] Result<Account> create(const Context& ctx, Account account) override;

    [[nodiscard]] Result<Account> get_by_id(const Context& ctx, const std::string& id) override;

    [[nodiscard]] Result<Account> get_by_external_id(const Context& ctx,
                                                     const std::string& external_id) override;

    /**
     * @brief Conditional update of mutable fields
     *
     * Mutable: name, external_group_id, account_type. Identity and
     * bookkeeping fields, unknown fields and expected_version < 1 fail
     * INVALID_ARGUMENT before anything reaches the store.
     *
     * @return Row at expected_version + 1, ABORTED if another writer won,
     *         NOT_FOUND if the row does not exist
     */
    [[nodiscard]] Result<Account> update(const Context& ctx, const std::string& id,
                                         const FieldUpdates& updates,
                                         int64_t expected_version) override;

    /**
     * @brief Filtered page ordered by created_at DESC, id ASC
     *
     * page_size 0 means 50 and is capped at 200. The page token is the
     * decimal offset of the next row.
     */
    [[nodiscard]] Result<AccountPage> list(const Context& ctx, const ListFilter& filter) override;

    static constexpr int32_t kDefaultPageSize = 50;
    static constexpr int32_t kMaxPageSize = 200;

private:
    Result<std::unique_ptr<PooledConnection>> lease(const Context& ctx) const;

    /// Single row where column = key; NOT_FOUND when absent
    Result<Account> fetch_one(PooledConnection& conn, std::string_view column,
                              const std::string& key, const Context& ctx) const;

    /// Map a failed statement to a Result error, invalidating dead sessions
    VoidResult store_failure(PooledConnection& conn, const DbResultSet& rs,
                             std::string_view action) const;

    SessionProvider session_;
    std::string table_;
    WriteVerifiedHook on_verified_;
    AccountValidator validator_;
};

} // namespace ledgerstore
