#pragma once
// MemSQL / SingleStore connector -- MySQL wire protocol (libmysqlclient).
// Used read-only: plan cache summary and "show status" lookups.
#include "db_connector.hpp"

namespace plantop {

class MemSQLConnector : public DbConnector {
public:
    MemSQLConnector() = default;
    ~MemSQLConnector() override { disconnect(); }

    MemSQLConnector(const MemSQLConnector&) = delete;
    MemSQLConnector& operator=(const MemSQLConnector&) = delete;

    bool connect(const DbConnection& conn) override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;

    std::vector<Row> query(const std::string& sql) override;

    [[nodiscard]] const char* system_name() const override { return "memsql"; }

private:
    void* conn_ = nullptr;  // MYSQL* handle
    DbConnection params_;
    bool have_params_ = false;
    bool connected_ = false;
};

} // namespace plantop
