#include "db/sql_statement.hpp"

#include <cctype>

namespace ledgerstore {

std::string safe_identifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
        return "";
    }
    for (const char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return "";
        }
    }
    return name;
}

} // namespace ledgerstore
