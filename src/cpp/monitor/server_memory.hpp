#pragma once
// Server memory usage, read from "show status like 'Total_server_memory'".
// Sampled on the connected node only; not a cluster-wide maximum.
#include <stdexcept>
#include <string>

#include "../connectors/db_connector.hpp"

namespace plantop {

// The status row is missing its Value or the value has no leading number
class MalformedStatusRow : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

extern const char* const kServerMemoryQuery;

// "2048.5 MB" -> 2048.5. The unit token is ignored.
// Throws MalformedStatusRow.
double parse_memory_status(const std::string& value);

// Runs kServerMemoryQuery and parses its Value column.
// Throws QueryError (lookup failed) or MalformedStatusRow.
double fetch_server_memory(DbConnector& db);

} // namespace plantop
