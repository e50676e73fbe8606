#include "migration/sql_script.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <format>

namespace ledgerstore {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// Identifier-like tokens outside quotes, original case
std::vector<std::string> tokenize_words(std::string_view sql) {
    std::vector<std::string> words;
    std::string current;
    char quote = 0;

    for (const char c : sql) {
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') {
            if (!current.empty()) words.push_back(std::move(current));
            current.clear();
            quote = c;
            continue;
        }
        if (is_word_char(c)) {
            current += c;
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

bool word_is(const std::string& word, std::string_view keyword) {
    return utils::to_upper(word) == keyword;
}

} // anonymous namespace

std::vector<std::string> split_sql_statements(std::string_view content) {
    std::vector<std::string> statements;
    std::string current;
    char quote = 0;

    auto flush = [&] {
        auto trimmed = utils::trim(current);
        if (!trimmed.empty()) statements.push_back(std::move(trimmed));
        current.clear();
    };

    for (size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];

        if (quote) {
            current += c;
            if (c == quote) quote = 0;
            continue;
        }

        // Line comment
        if (c == '-' && i + 1 < content.size() && content[i + 1] == '-') {
            while (i < content.size() && content[i] != '\n') ++i;
            current += '\n';
            continue;
        }
        // Block comment
        if (c == '/' && i + 1 < content.size() && content[i + 1] == '*') {
            const auto end = content.find("*/", i + 2);
            i = (end == std::string_view::npos) ? content.size() : end + 1;
            current += ' ';
            continue;
        }

        if (c == '\'' || c == '"') {
            quote = c;
            current += c;
        } else if (c == ';') {
            flush();
        } else {
            current += c;
        }
    }
    flush();
    return statements;
}

std::string leading_keyword(std::string_view statement) {
    const auto words = tokenize_words(statement);
    return words.empty() ? std::string() : utils::to_upper(words.front());
}

std::optional<std::string> check_statement_syntax(std::string_view statement) {
    static constexpr std::array<std::string_view, 15> known_keywords = {
        "CREATE", "INSERT", "UPSERT", "SELECT", "ALTER", "UPDATE", "BEGIN",
        "COMMIT", "ROLLBACK", "DROP", "DELETE", "TRUNCATE", "SET", "USE", "WITH"
    };

    char quote = 0;
    int depth = 0;
    for (const char c : statement) {
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth < 0) return "unbalanced parentheses";
        }
    }
    if (quote) return "unterminated string literal";
    if (depth != 0) return "unbalanced parentheses";

    const auto keyword = leading_keyword(statement);
    if (keyword.empty()) return "statement has no leading keyword";
    for (const auto k : known_keywords) {
        if (keyword == k) return std::nullopt;
    }
    return std::format("unrecognised leading keyword '{}'", keyword);
}

std::optional<std::string> find_destructive_operation(std::string_view statement) {
    const auto words = tokenize_words(statement);
    if (words.empty()) return std::nullopt;

    const auto first = utils::to_upper(words[0]);
    if (first == "DROP") {
        return words.size() > 1 ? "DROP " + utils::to_upper(words[1]) : std::string("DROP");
    }
    if (first == "DELETE") return "DELETE";
    if (first == "TRUNCATE") return "TRUNCATE";

    if (first == "ALTER") {
        for (size_t i = 1; i < words.size(); ++i) {
            if (word_is(words[i], "DROP")) return "ALTER TABLE ... DROP COLUMN";
            if (word_is(words[i], "RENAME")) return "ALTER TABLE ... RENAME";
        }
    }
    return std::nullopt;
}

std::optional<std::string> create_index_target(std::string_view statement) {
    const auto words = tokenize_words(statement);
    if (words.size() < 4 || !word_is(words[0], "CREATE")) return std::nullopt;

    size_t i = 1;
    if (word_is(words[i], "UNIQUE")) ++i;
    if (i >= words.size() || !word_is(words[i], "INDEX")) return std::nullopt;

    for (++i; i + 1 < words.size(); ++i) {
        if (word_is(words[i], "ON")) return words[i + 1];
    }
    return std::nullopt;
}

std::string sha256_hex(std::string_view content) {
    // SHA-256 via OpenSSL EVP
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, content.data(), content.size());
    EVP_DigestFinal_ex(ctx, hash, &hash_len);
    EVP_MD_CTX_free(ctx);

    // Convert to hex string
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

} // namespace ledgerstore
