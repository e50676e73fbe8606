#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ledgerstore {

/**
 * @brief Split a migration script into executable statements
 *
 * Splits on ';' outside single/double quotes. Line comments ("-- ...")
 * outside quotes are dropped, each statement is trimmed and empty
 * statements are omitted.
 */
[[nodiscard]] std::vector<std::string> split_sql_statements(std::string_view content);

/// Upper-cased first word of a statement ("" if none)
[[nodiscard]] std::string leading_keyword(std::string_view statement);

/**
 * @brief Basic syntax sanity for one statement
 * @return Problem description, or nullopt when the statement looks sane
 *
 * Checks balanced quotes and parentheses and a recognised leading keyword.
 */
[[nodiscard]] std::optional<std::string> check_statement_syntax(std::string_view statement);

/**
 * @brief Detect statements the append-only store cannot undo
 * @return e.g. "DROP TABLE", "ALTER TABLE ... DROP COLUMN"; nullopt if safe
 */
[[nodiscard]] std::optional<std::string> find_destructive_operation(std::string_view statement);

/**
 * @brief Target table of a CREATE [UNIQUE] INDEX statement
 *
 * Accepts both named ("CREATE INDEX idx ON t(c)") and anonymous
 * ("CREATE INDEX IF NOT EXISTS ON t(c)") forms.
 */
[[nodiscard]] std::optional<std::string> create_index_target(std::string_view statement);

/// SHA-256 of the content, lower-case hex
[[nodiscard]] std::string sha256_hex(std::string_view content);

} // namespace ledgerstore
