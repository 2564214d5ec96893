#pragma once
// Abstract interface for the monitored data source.
//
// The poller only needs two capabilities from a connection:
//   - query(sql): run a read query, get every row with named fields
//   - get(sql):   run a lookup that must return exactly one row
// Both throw QueryError on any connection or query failure. Lifecycle calls
// (connect/reconnect) report failure through their bool result and the log.
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../config.hpp"
#include "../utils/logger.hpp"

namespace plantop {

// Data source unreachable, query rejected, or a row that does not have the
// shape the caller asked for.
class QueryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One result row. Field values are kept as text exactly as the server sent
// them; SQL NULL is an empty optional.
class Row {
public:
    void set(std::string name, std::optional<std::string> value) {
        fields_[std::move(name)] = std::move(value);
    }

    [[nodiscard]] bool has(const std::string& name) const {
        return fields_.count(name) > 0;
    }

    [[nodiscard]] size_t size() const { return fields_.size(); }

    [[nodiscard]] bool is_null(const std::string& name) const {
        return !field(name).has_value();
    }

    // Non-null text value; throws QueryError for a NULL or missing field.
    [[nodiscard]] const std::string& str(const std::string& name) const {
        const auto& v = field(name);
        if (!v) throw QueryError("column '" + name + "' is NULL");
        return *v;
    }

    // Integer value with NULL coerced to zero. Non-numeric text throws.
    [[nodiscard]] int64_t int64_or_zero(const std::string& name) const {
        const auto& v = field(name);
        if (!v || v->empty()) return 0;
        errno = 0;
        char* end = nullptr;
        long long n = std::strtoll(v->c_str(), &end, 10);
        if (errno != 0 || end == v->c_str() || *end != '\0') {
            throw QueryError("column '" + name + "' is not an integer: '" + *v + "'");
        }
        return static_cast<int64_t>(n);
    }

private:
    const std::optional<std::string>& field(const std::string& name) const {
        auto it = fields_.find(name);
        if (it == fields_.end()) throw QueryError("missing column '" + name + "'");
        return it->second;
    }

    std::unordered_map<std::string, std::optional<std::string>> fields_;
};

class DbConnector {
public:
    virtual ~DbConnector() = default;

    virtual bool connect(const DbConnection& conn) = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;

    // Read query returning all rows. Throws QueryError.
    virtual std::vector<Row> query(const std::string& sql) = 0;

    // Single-row lookup (e.g. "show status like ..."). Throws QueryError if
    // the query fails or does not return exactly one row.
    virtual Row get(const std::string& sql) {
        auto rows = query(sql);
        if (rows.size() != 1) {
            throw QueryError("expected 1 row, got " + std::to_string(rows.size()) +
                " for: " + sql);
        }
        return std::move(rows.front());
    }

    [[nodiscard]] virtual const char* system_name() const = 0;

    // Connection resilience: reconnect after connection loss.
    // Default: disconnect + connect.
    virtual bool reconnect(const DbConnection& conn) {
        disconnect();
        return connect(conn);
    }

    // Ensure connection is alive, retry with exponential backoff if lost.
    // Returns true if connected (either already was or successfully reconnected).
    // Backoff: base_delay_ms * 2^(attempt-1), capped at 30s.
    bool ensure_connected(const DbConnection& conn,
                          int max_retries = 5, int base_delay_ms = 1000) {
        if (is_connected()) return true;
        if (reconnect(conn)) return true;

        LOG_WRN("[%s] Not connected, retrying (max %d retries)...",
            system_name(), max_retries);

        for (int attempt = 1; attempt <= max_retries; ++attempt) {
            int shift = attempt - 1 < 15 ? attempt - 1 : 15;
            long long delay = static_cast<long long>(base_delay_ms) << shift;
            if (delay > 30000) delay = 30000;  // cap at 30s

            LOG_WRN("[%s] Reconnect attempt %d/%d (backoff: %lld ms)...",
                system_name(), attempt, max_retries, delay);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));

            if (reconnect(conn)) {
                LOG_INF("[%s] Connected on attempt %d", system_name(), attempt);
                return true;
            }
            LOG_ERR("[%s] Reconnect attempt %d failed", system_name(), attempt);
        }

        LOG_ERR("[%s] All %d reconnection attempts FAILED", system_name(), max_retries);
        return false;
    }
};

} // namespace plantop
