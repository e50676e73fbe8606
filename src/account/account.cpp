#include "account/account.hpp"

namespace ledgerstore {

std::string_view account_type_to_string(AccountType type) {
    switch (type) {
        case AccountType::ASSET:     return "ASSET";
        case AccountType::LIABILITY: return "LIABILITY";
        case AccountType::EQUITY:    return "EQUITY";
        case AccountType::REVENUE:   return "REVENUE";
        case AccountType::EXPENSE:   return "EXPENSE";
    }
    return "ASSET";
}

std::optional<AccountType> parse_account_type(std::string_view name) {
    std::string upper = utils::to_upper(std::string(name));
    static constexpr std::string_view prefix = "ACCOUNT_TYPE_";
    if (upper.starts_with(prefix)) {
        upper.erase(0, prefix.size());
    }

    if (upper == "ASSET")     return AccountType::ASSET;
    if (upper == "LIABILITY") return AccountType::LIABILITY;
    if (upper == "EQUITY")    return AccountType::EQUITY;
    if (upper == "REVENUE")   return AccountType::REVENUE;
    if (upper == "EXPENSE")   return AccountType::EXPENSE;
    return std::nullopt;
}

} // namespace ledgerstore
