#include <catch2/catch_test_macros.hpp>
#include "migration/sql_script.hpp"

using namespace ledgerstore;

TEST_CASE("SqlScript: splits on semicolons outside quotes", "[sql_script]") {
    const auto stmts = split_sql_statements(
        "CREATE TABLE t (a VARCHAR);\n"
        "INSERT INTO t (a) VALUES ('x;y');\n"
        "  ;  \n");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0] == "CREATE TABLE t (a VARCHAR)");
    CHECK(stmts[1] == "INSERT INTO t (a) VALUES ('x;y')");
}

TEST_CASE("SqlScript: comments are stripped, statements after them kept", "[sql_script]") {
    const auto stmts = split_sql_statements(
        "-- Migration: 001_x\n"
        "-- leading comment\n"
        "CREATE TABLE a (id INTEGER, PRIMARY KEY (id)); -- trailing\n"
        "/* block\n comment; with semicolon */\n"
        "CREATE TABLE b (id INTEGER, PRIMARY KEY (id));\n"
        "-- only a comment;\n");
    REQUIRE(stmts.size() == 2);
    CHECK(leading_keyword(stmts[0]) == "CREATE");
    CHECK(stmts[1].find("CREATE TABLE b") == 0);
}

TEST_CASE("SqlScript: comment markers inside strings are data", "[sql_script]") {
    const auto stmts = split_sql_statements("INSERT INTO t (a) VALUES ('--not a comment');");
    REQUIRE(stmts.size() == 1);
    CHECK(stmts[0].find("--not a comment") != std::string::npos);
}

TEST_CASE("SqlScript: syntax sanity", "[sql_script]") {
    CHECK_FALSE(check_statement_syntax("CREATE TABLE t (a INTEGER, PRIMARY KEY (a))").has_value());
    CHECK(check_statement_syntax("CREATE TABLE t (a INTEGER").value() == "unbalanced parentheses");
    CHECK(check_statement_syntax("INSERT INTO t VALUES ('abc)").value() == "unterminated string literal");
    CHECK(check_statement_syntax("FROBNICATE t").value().find("FROBNICATE") != std::string::npos);
    CHECK_FALSE(check_statement_syntax("upsert into t (a) values (1)").has_value());
}

TEST_CASE("SqlScript: destructive statements detected", "[sql_script]") {
    CHECK(find_destructive_operation("DROP TABLE accounts").value() == "DROP TABLE");
    CHECK(find_destructive_operation("drop index idx").value() == "DROP INDEX");
    CHECK(find_destructive_operation("DELETE FROM accounts WHERE id = 1").value() == "DELETE");
    CHECK(find_destructive_operation("TRUNCATE accounts").value() == "TRUNCATE");
    CHECK(find_destructive_operation("ALTER TABLE a DROP COLUMN b").value() == "ALTER TABLE ... DROP COLUMN");
    CHECK(find_destructive_operation("ALTER TABLE a RENAME TO b").value() == "ALTER TABLE ... RENAME");
}

TEST_CASE("SqlScript: additive statements are not destructive", "[sql_script]") {
    CHECK_FALSE(find_destructive_operation("ALTER TABLE a ADD COLUMN c VARCHAR").has_value());
    CHECK_FALSE(find_destructive_operation("CREATE TABLE IF NOT EXISTS t (a INTEGER)").has_value());
    CHECK_FALSE(find_destructive_operation("INSERT INTO notes (text) VALUES ('drop table x')").has_value());
}

TEST_CASE("SqlScript: CREATE INDEX target table", "[sql_script]") {
    CHECK(create_index_target("CREATE INDEX IF NOT EXISTS ON accounts(external_id)").value() == "accounts");
    CHECK(create_index_target("CREATE UNIQUE INDEX idx_a ON ledger (a, b)").value() == "ledger");
    CHECK_FALSE(create_index_target("CREATE TABLE t (a INTEGER)").has_value());
}

TEST_CASE("SqlScript: sha256 hex digest", "[sql_script]") {
    CHECK(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
