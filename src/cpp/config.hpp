#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace plantop {

// Connection info for the monitored cluster node (MySQL wire protocol)
struct DbConnection {
    std::string host = "127.0.0.1";
    uint16_t port = 3306;
    std::string user = "root";
    std::string password;
    std::string database = "information_schema";
    unsigned int connect_timeout_s = 10;
    unsigned int read_timeout_s = 10;   // also used as write timeout
};

inline bool port_in_range(int64_t v) { return v >= 1 && v <= 65535; }

// Decimal TCP port in 1..65535; out is untouched on failure
inline bool parse_port(const std::string& s, uint16_t& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || !port_in_range(v)) return false;
    out = static_cast<uint16_t>(v);
    return true;
}

// How poll results are rendered
enum class OutputMode { TABLE, JSON };

inline const char* output_mode_str(OutputMode m) {
    switch (m) {
        case OutputMode::TABLE: return "table";
        case OutputMode::JSON:  return "json";
    }
    return "??";
}

inline bool parse_output_mode(const std::string& s, OutputMode& out) {
    if (s == "table") { out = OutputMode::TABLE; return true; }
    if (s == "json")  { out = OutputMode::JSON;  return true; }
    return false;
}

// Prometheus Pushgateway endpoint (empty url = disabled)
struct PushgatewayConfig {
    std::string url;
    std::string job = "plantop";
};

// Full monitor configuration
struct MonitorConfig {
    DbConnection connection;

    // Polling
    double update_interval_s = 3.0;
    bool measure_interval = false;   // rate denominator from wall clock
    int iterations = 0;              // 0 = until interrupted
    int max_connect_retries = 5;

    // Presentation
    std::string sort_column = "CpuUtil";
    bool sort_descending = true;
    int max_rows = 20;
    OutputMode output = OutputMode::TABLE;
    std::string json_path;           // empty = stdout

    PushgatewayConfig pushgateway;

    // Logging
    std::string log_level = "info";
    std::string log_file;            // empty = stderr

    static MonitorConfig from_json(const std::string& path);
};

// Missing file: defaults. Malformed JSON or wrong value types throw
// nlohmann::json exceptions (derived from std::exception).
inline MonitorConfig MonitorConfig::from_json(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return MonitorConfig{};
    }

    nlohmann::json j;
    f >> j;

    MonitorConfig cfg;
    if (j.contains("connection")) {
        const auto& c = j["connection"];
        cfg.connection.host = c.value("host", cfg.connection.host);
        int64_t port = c.value("port", static_cast<int64_t>(cfg.connection.port));
        if (!port_in_range(port)) {
            throw std::invalid_argument("port out of range: " + std::to_string(port));
        }
        cfg.connection.port = static_cast<uint16_t>(port);
        cfg.connection.user = c.value("user", cfg.connection.user);
        cfg.connection.password = c.value("password", cfg.connection.password);
        cfg.connection.database = c.value("database", cfg.connection.database);
        cfg.connection.connect_timeout_s =
            c.value("connect_timeout_s", cfg.connection.connect_timeout_s);
        cfg.connection.read_timeout_s =
            c.value("read_timeout_s", cfg.connection.read_timeout_s);
    }

    cfg.update_interval_s = j.value("update_interval_s", cfg.update_interval_s);
    cfg.measure_interval = j.value("measure_interval", cfg.measure_interval);
    cfg.iterations = j.value("iterations", cfg.iterations);
    cfg.max_connect_retries = j.value("max_connect_retries", cfg.max_connect_retries);

    cfg.sort_column = j.value("sort_column", cfg.sort_column);
    cfg.sort_descending = j.value("sort_descending", cfg.sort_descending);
    cfg.max_rows = j.value("max_rows", cfg.max_rows);
    if (j.contains("output")) {
        std::string mode = j["output"].get<std::string>();
        if (!parse_output_mode(mode, cfg.output)) {
            throw std::invalid_argument("unknown output mode: " + mode);
        }
    }
    cfg.json_path = j.value("json_path", cfg.json_path);

    if (j.contains("pushgateway")) {
        cfg.pushgateway.url = j["pushgateway"].value("url", cfg.pushgateway.url);
        cfg.pushgateway.job = j["pushgateway"].value("job", cfg.pushgateway.job);
    }

    cfg.log_level = j.value("log_level", cfg.log_level);
    cfg.log_file = j.value("log_file", cfg.log_file);

    return cfg;
}

} // namespace plantop
