// MemSQL connector -- libmysqlclient (or MariaDB Connector/C, same API)
// Read-only: every statement issued here is a SELECT or SHOW.

#include "memsql_connector.hpp"
#include "../utils/logger.hpp"

#include <mysql/mysql.h>
#include <mysql/errmsg.h>

namespace plantop {

// Drain any further result sets -- prevents "Commands out of sync"
static void mysql_consume_results(MYSQL* mysql) {
    while (mysql_next_result(mysql) == 0) {
        MYSQL_RES* r = mysql_store_result(mysql);
        if (r) mysql_free_result(r);
    }
}

static bool is_connection_lost(unsigned int err) {
    return err == CR_SERVER_GONE_ERROR || err == CR_SERVER_LOST ||
           err == CR_CONNECTION_ERROR || err == CR_CONN_HOST_ERROR;
}

bool MemSQLConnector::connect(const DbConnection& conn) {
    params_ = conn;
    have_params_ = true;

    if (conn_) disconnect();

    MYSQL* mysql = mysql_init(nullptr);
    if (!mysql) {
        LOG_ERR("[memsql] mysql_init failed");
        return false;
    }

    unsigned int connect_timeout = conn.connect_timeout_s;
    unsigned int io_timeout = conn.read_timeout_s;
    mysql_options(mysql, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout);
    mysql_options(mysql, MYSQL_OPT_READ_TIMEOUT, &io_timeout);
    mysql_options(mysql, MYSQL_OPT_WRITE_TIMEOUT, &io_timeout);

    const char* db = conn.database.empty() ? nullptr : conn.database.c_str();
    if (!mysql_real_connect(mysql, conn.host.c_str(), conn.user.c_str(),
                            conn.password.c_str(), db, conn.port, nullptr, 0)) {
        LOG_ERR("[memsql] Connection to %s:%u failed: %s",
            conn.host.c_str(), conn.port, mysql_error(mysql));
        mysql_close(mysql);
        return false;
    }

    conn_ = mysql;
    connected_ = true;
    LOG_INF("[memsql] Connected to %s:%u/%s (server: %s)",
        conn.host.c_str(), conn.port, conn.database.c_str(),
        mysql_get_server_info(mysql));
    return true;
}

void MemSQLConnector::disconnect() {
    if (conn_) {
        mysql_close(static_cast<MYSQL*>(conn_));
        conn_ = nullptr;
    }
    connected_ = false;
}

bool MemSQLConnector::is_connected() const { return connected_; }

std::vector<Row> MemSQLConnector::query(const std::string& sql) {
    if (!connected_) {
        if (!have_params_) throw QueryError("[memsql] not connected");
        LOG_WRN("[memsql] Connection lost, reconnecting to %s:%u",
            params_.host.c_str(), params_.port);
        if (!reconnect(params_)) {
            throw QueryError("[memsql] reconnect to " + params_.host + " failed");
        }
    }

    auto* mysql = static_cast<MYSQL*>(conn_);
    if (mysql_real_query(mysql, sql.c_str(), sql.size()) != 0) {
        unsigned int err = mysql_errno(mysql);
        std::string msg = "[memsql] query failed (" + std::to_string(err) + "): " +
            mysql_error(mysql);
        if (is_connection_lost(err)) disconnect();
        throw QueryError(msg);
    }

    MYSQL_RES* res = mysql_store_result(mysql);
    if (!res) {
        if (mysql_field_count(mysql) == 0) {
            mysql_consume_results(mysql);
            return {};
        }
        unsigned int err = mysql_errno(mysql);
        std::string msg = std::string("[memsql] reading result failed: ") + mysql_error(mysql);
        if (is_connection_lost(err)) disconnect();
        throw QueryError(msg);
    }

    unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);

    std::vector<Row> rows;
    rows.reserve(static_cast<size_t>(mysql_num_rows(res)));

    MYSQL_ROW r;
    while ((r = mysql_fetch_row(res))) {
        unsigned long* lengths = mysql_fetch_lengths(res);
        Row row;
        for (unsigned int i = 0; i < num_fields; i++) {
            if (r[i]) {
                row.set(fields[i].name, std::string(r[i], lengths[i]));
            } else {
                row.set(fields[i].name, std::nullopt);
            }
        }
        rows.push_back(std::move(row));
    }

    mysql_free_result(res);
    mysql_consume_results(mysql);
    return rows;
}

} // namespace plantop
