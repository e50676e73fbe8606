#pragma once

#include "core/utils.hpp"
#include "db/sql_statement.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ledgerstore {

enum class AccountType {
    ASSET,
    LIABILITY,
    EQUITY,
    REVENUE,
    EXPENSE
};

[[nodiscard]] std::string_view account_type_to_string(AccountType type);

/// Case-insensitive; also accepts the "ACCOUNT_TYPE_" prefixed form
[[nodiscard]] std::optional<AccountType> parse_account_type(std::string_view name);

/**
 * @brief One ledger account row
 *
 * id, external_id, currency_code and created_at never change after create.
 * version starts at 1 and advances by exactly one per successful update.
 */
struct Account {
    std::string id;
    std::string name;
    std::string external_id;
    std::optional<std::string> external_group_id;
    std::string currency_code;              // ISO 4217
    AccountType account_type = AccountType::ASSET;
    utils::Timestamp created_at{};
    utils::Timestamp updated_at{};
    int64_t version = 0;
};

/// (column, new value); std::nullopt clears a nullable column
using FieldUpdate = std::pair<std::string, SqlValue>;
using FieldUpdates = std::vector<FieldUpdate>;

struct ListFilter {
    std::optional<AccountType> account_type;
    std::string currency_code;
    std::string external_group_id;
    std::string name_search;                // case-insensitive substring
    int32_t page_size = 0;                  // 0 = default
    std::string page_token;                 // decimal offset, "" = first page
};

struct AccountPage {
    std::vector<Account> accounts;
    std::string next_page_token;            // "" when exhausted
    int64_t total_count = 0;
};

} // namespace ledgerstore
