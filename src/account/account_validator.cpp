#include "account/account_validator.hpp"

#include <format>
#include <regex>

namespace ledgerstore {

namespace {

const std::regex& name_regex() {
    static const std::regex re(R"(^[a-zA-Z0-9\s\-_.,&()]+$)");
    return re;
}

const std::regex& external_id_regex() {
    static const std::regex re(R"(^[a-zA-Z0-9\-_]+$)");
    return re;
}

const std::regex& uuid_regex() {
    static const std::regex re(R"(^[a-f0-9]{8}-[a-f0-9]{4}-[a-f0-9]{4}-[a-f0-9]{4}-[a-f0-9]{12}$)");
    return re;
}

VoidResult invalid(std::string message) {
    return VoidResult::error(ErrorCode::INVALID_ARGUMENT, std::move(message));
}

} // anonymous namespace

AccountValidator::AccountValidator()
    : currencies_{
        "USD", "EUR", "GBP", "JPY", "CHF", "CAD", "AUD", "NZD",
        "CNY", "INR", "KRW", "SGD", "HKD", "NOK", "SEK", "DKK",
        "PLN", "THB", "IDR", "HUF", "CZK", "ILS", "CLP", "PHP",
        "AED", "COP", "SAR", "MYR", "RON", "BRL", "MXN", "ZAR"} {}

VoidResult AccountValidator::validate_new_account(const Account& account) const {
    if (!account.id.empty()) {
        if (auto r = validate_account_id(account.id); r.is_error()) return r;
    }
    if (auto r = validate_name(account.name); r.is_error()) return r;
    if (auto r = validate_external_id(account.external_id); r.is_error()) return r;
    if (account.external_group_id && !account.external_group_id->empty()) {
        if (auto r = validate_external_group_id(*account.external_group_id); r.is_error()) return r;
    }
    return validate_currency_code(account.currency_code);
}

VoidResult AccountValidator::validate_name(std::string_view name) const {
    if (name.empty()) {
        return invalid("field name is required");
    }
    if (name.size() > kMaxFieldLength) {
        return invalid("name must be 255 characters or less");
    }
    if (!std::regex_match(name.begin(), name.end(), name_regex())) {
        return invalid("name contains invalid characters");
    }
    return VoidResult::ok();
}

VoidResult AccountValidator::validate_external_id(std::string_view external_id) const {
    if (external_id.empty()) {
        return invalid("field external_id is required");
    }
    if (external_id.size() > kMaxFieldLength) {
        return invalid("external_id must be 255 characters or less");
    }
    if (!std::regex_match(external_id.begin(), external_id.end(), external_id_regex())) {
        return invalid("external_id contains invalid characters");
    }
    return VoidResult::ok();
}

VoidResult AccountValidator::validate_external_group_id(std::string_view group_id) const {
    if (group_id.size() > kMaxFieldLength) {
        return invalid("external_group_id must be 255 characters or less");
    }
    if (!std::regex_match(group_id.begin(), group_id.end(), external_id_regex())) {
        return invalid("external_group_id contains invalid characters");
    }
    return VoidResult::ok();
}

VoidResult AccountValidator::validate_currency_code(std::string_view code) const {
    if (code.empty()) {
        return invalid("field currency_code is required");
    }
    if (code.size() != 3) {
        return invalid("currency_code must be exactly 3 characters");
    }
    const std::string value(code);
    if (value != utils::to_upper(value)) {
        return invalid("currency_code must be uppercase");
    }
    if (!currencies_.contains(value)) {
        return invalid(std::format("invalid currency code: {}", value));
    }
    return VoidResult::ok();
}

VoidResult AccountValidator::validate_account_type(std::string_view type) const {
    if (type.empty()) {
        return invalid("field account_type is required");
    }
    if (!parse_account_type(type)) {
        return invalid(std::format("invalid account type: {}", type));
    }
    return VoidResult::ok();
}

VoidResult AccountValidator::validate_account_id(std::string_view id) const {
    if (id.empty()) {
        return invalid("account_id is required");
    }
    const auto lower = utils::to_lower(std::string(id));
    if (!std::regex_match(lower, uuid_regex())) {
        return invalid("invalid account_id format");
    }
    return VoidResult::ok();
}

} // namespace ledgerstore
