#include "server_memory.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace plantop {

const char* const kServerMemoryQuery = "show status like 'Total_server_memory'";

double parse_memory_status(const std::string& value) {
    std::string token = value.substr(0, value.find(' '));
    if (token.empty()) {
        throw MalformedStatusRow("memory status has no numeric value: '" + value + "'");
    }

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(token.c_str(), &end);
    if (errno != 0 || end == token.c_str() || *end != '\0' || !std::isfinite(v)) {
        throw MalformedStatusRow("memory status is not a number: '" + value + "'");
    }
    return v;
}

double fetch_server_memory(DbConnector& db) {
    Row row = db.get(kServerMemoryQuery);
    if (!row.has("Value") || row.is_null("Value")) {
        throw MalformedStatusRow("memory status row has no Value");
    }
    return parse_memory_status(row.str("Value"));
}

} // namespace plantop
