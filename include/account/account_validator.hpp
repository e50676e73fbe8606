#pragma once

#include "account/account.hpp"
#include "core/error.hpp"

#include <string>
#include <string_view>
#include <unordered_set>

namespace ledgerstore {

/**
 * @brief Field-level checks for account input
 *
 * Every failure is INVALID_ARGUMENT with a message naming the field.
 * Stateless apart from the currency list; safe to share across threads.
 */
class AccountValidator {
public:
    AccountValidator();

    /// All fields of a new account (id, if set, must be a UUID)
    [[nodiscard]] VoidResult validate_new_account(const Account& account) const;

    [[nodiscard]] VoidResult validate_name(std::string_view name) const;
    [[nodiscard]] VoidResult validate_external_id(std::string_view external_id) const;
    [[nodiscard]] VoidResult validate_external_group_id(std::string_view group_id) const;
    [[nodiscard]] VoidResult validate_currency_code(std::string_view code) const;
    [[nodiscard]] VoidResult validate_account_type(std::string_view type) const;
    [[nodiscard]] VoidResult validate_account_id(std::string_view id) const;

    static constexpr size_t kMaxFieldLength = 255;

private:
    std::unordered_set<std::string> currencies_;
};

} // namespace ledgerstore
