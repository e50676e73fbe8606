#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledgerstore {

/// Text-format parameter; std::nullopt binds SQL NULL
using SqlValue = std::optional<std::string>;

/**
 * @brief SQL text with positional ($1, $2, ...) parameters
 *
 * Values travel out-of-band (libpq text format), never spliced into the SQL.
 */
struct SqlStatement {
    std::string sql;
    std::vector<SqlValue> params;

    SqlStatement() = default;
    explicit SqlStatement(std::string text) : sql(std::move(text)) {}

    /// Append a parameter and return its placeholder ("$N")
    std::string bind(SqlValue value) {
        params.emplace_back(std::move(value));
        return "$" + std::to_string(params.size());
    }

    std::string bind(int64_t value) {
        return bind(SqlValue{std::to_string(value)});
    }
};

/**
 * @brief Quote an identifier for interpolation (table names from configuration)
 * Only [A-Za-z0-9_] are accepted; returns empty on anything else.
 */
[[nodiscard]] std::string safe_identifier(const std::string& name);

} // namespace ledgerstore
