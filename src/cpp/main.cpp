// =============================================================================
// plantop -- live plan cache monitor for MemSQL / SingleStore clusters
//
// Samples information_schema.distributed_plancache_summary and the server's
// Total_server_memory status every interval and reports per-plan rates
// (executions/sec, rows/sec, CPU utilization, per-query averages).
//
// Read-only: plantop never writes to the monitored cluster.
// =============================================================================

#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "config.hpp"
#include "utils/logger.hpp"
#include "connectors/memsql_connector.hpp"
#include "monitor/columns.hpp"
#include "monitor/database_poller.hpp"
#include "monitor/event_loop.hpp"
#include "sinks/console_sink.hpp"
#include "sinks/json_sink.hpp"
#include "sinks/pushgateway_sink.hpp"

static plantop::EventLoop* g_loop = nullptr;

static void handle_stop_signal(int) {
    if (g_loop) g_loop->stop();
}

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  --config PATH        JSON config file (default: built-in defaults)\n"
        "  --host HOST          Aggregator host (default: 127.0.0.1)\n"
        "  --port N             Port (default: 3306)\n"
        "  --user USER          User (default: root)\n"
        "  --password PASS      Password (default: empty)\n"
        "  --database DB        Default database (default: information_schema)\n"
        "  --interval SECONDS   Update interval (default: 3)\n"
        "  --measure-interval   Use measured time between polls for rates\n"
        "  --iterations N       Stop after N polls (default: 0 = run until Ctrl-C)\n"
        "  --sort COLUMN        Sort column (default: CpuUtil)\n"
        "                       Valid: Database, Query, Executions/sec, RowCount/sec,\n"
        "                              CpuUtil, ExecutionTime/query, Memory/query,\n"
        "                              QueuedTime/query (or snake_case aliases)\n"
        "  --ascending          Sort ascending instead of descending\n"
        "  --max-rows N         Rows shown per refresh in table mode (default: 20)\n"
        "  --output MODE        table | json (default: table)\n"
        "  --json-path PATH     JSON Lines output file (default: stdout)\n"
        "  --pushgateway URL    Push cluster gauges to a Prometheus Pushgateway\n"
        "  --max-retries N      Connection attempts at startup (default: 5)\n"
        "  --log-file PATH      Write logs to PATH instead of stderr\n"
        "  --log-level LEVEL    debug | info | warn | error (default: info)\n"
        "  --verbose            Same as --log-level debug\n"
        "  --help               Show this help\n",
        prog);
}

int main(int argc, char* argv[]) {
    // --config first, so that the remaining flags override the file
    std::string config_path;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[i + 1];
        }
    }

    plantop::MonitorConfig cfg;
    if (!config_path.empty()) {
        try {
            cfg = plantop::MonitorConfig::from_json(config_path);
        } catch (const std::exception& e) {
            LOG_ERR("Invalid config file %s: %s", config_path.c_str(), e.what());
            return 1;
        }
    }

    try {
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                ++i;  // already loaded
            } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
                cfg.connection.host = argv[++i];
            } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
                std::string port = argv[++i];
                if (!plantop::parse_port(port, cfg.connection.port)) {
                    LOG_ERR("Invalid port: %s (expected 1-65535)", port.c_str());
                    return 1;
                }
            } else if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
                cfg.connection.user = argv[++i];
            } else if (std::strcmp(argv[i], "--password") == 0 && i + 1 < argc) {
                cfg.connection.password = argv[++i];
            } else if (std::strcmp(argv[i], "--database") == 0 && i + 1 < argc) {
                cfg.connection.database = argv[++i];
            } else if (std::strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
                cfg.update_interval_s = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--measure-interval") == 0) {
                cfg.measure_interval = true;
            } else if (std::strcmp(argv[i], "--iterations") == 0 && i + 1 < argc) {
                cfg.iterations = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--sort") == 0 && i + 1 < argc) {
                cfg.sort_column = argv[++i];
            } else if (std::strcmp(argv[i], "--ascending") == 0) {
                cfg.sort_descending = false;
            } else if (std::strcmp(argv[i], "--max-rows") == 0 && i + 1 < argc) {
                cfg.max_rows = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
                std::string mode = argv[++i];
                if (!plantop::parse_output_mode(mode, cfg.output)) {
                    std::fprintf(stderr, "Unknown output mode: %s\n", mode.c_str());
                    return 1;
                }
            } else if (std::strcmp(argv[i], "--json-path") == 0 && i + 1 < argc) {
                cfg.json_path = argv[++i];
            } else if (std::strcmp(argv[i], "--pushgateway") == 0 && i + 1 < argc) {
                cfg.pushgateway.url = argv[++i];
            } else if (std::strcmp(argv[i], "--max-retries") == 0 && i + 1 < argc) {
                cfg.max_connect_retries = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
                cfg.log_file = argv[++i];
            } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
                cfg.log_level = argv[++i];
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                cfg.log_level = "debug";
            } else {
                std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        // std::stoi / std::stod on a non-numeric argument
        std::fprintf(stderr, "Invalid numeric argument: %s\n", e.what());
        return 1;
    }

    if (!plantop::parse_log_level(cfg.log_level, plantop::g_log_level)) {
        std::fprintf(stderr, "Unknown log level: %s\n", cfg.log_level.c_str());
        return 1;
    }
    if (!cfg.log_file.empty() && !plantop::set_log_file(cfg.log_file)) {
        std::fprintf(stderr, "Cannot open log file %s\n", cfg.log_file.c_str());
        return 1;
    }

    if (!(cfg.update_interval_s > 0.0) || !std::isfinite(cfg.update_interval_s)) {
        LOG_ERR("Update interval must be finite and > 0 (got %g)", cfg.update_interval_s);
        return 1;
    }
    plantop::Column sort_column;
    if (!plantop::parse_column(cfg.sort_column, sort_column)) {
        LOG_ERR("Unknown sort column: %s", cfg.sort_column.c_str());
        return 1;
    }
    if (cfg.iterations < 0) {
        LOG_ERR("Iterations must be >= 0 (got %d)", cfg.iterations);
        return 1;
    }

    LOG_INF("=== plantop ===");
    LOG_INF("Target %s:%u, interval %.2f s, output %s",
        cfg.connection.host.c_str(), cfg.connection.port, cfg.update_interval_s,
        plantop::output_mode_str(cfg.output));

    plantop::MemSQLConnector db;
    if (!db.ensure_connected(cfg.connection, cfg.max_connect_retries)) {
        LOG_ERR("Cannot connect to %s:%u. Exiting.",
            cfg.connection.host.c_str(), cfg.connection.port);
        return 1;
    }

    plantop::EventLoop loop;
    std::unique_ptr<plantop::DatabasePoller> poller;
    try {
        poller = std::make_unique<plantop::DatabasePoller>(
            db, loop, cfg.update_interval_s, cfg.measure_interval);
    } catch (const plantop::QueryError& e) {
        LOG_ERR("Initial plan cache fetch failed: %s", e.what());
        db.disconnect();
        return 1;
    }
    poller->set_max_polls(cfg.iterations);

    // Sinks
    std::vector<std::unique_ptr<plantop::CycleSink>> sinks;
    std::ofstream json_file;
    if (cfg.output == plantop::OutputMode::JSON) {
        std::ostream* json_out = &std::cout;
        if (!cfg.json_path.empty()) {
            json_file.open(cfg.json_path, std::ios::app);
            if (!json_file.is_open()) {
                LOG_ERR("Cannot open JSON output %s", cfg.json_path.c_str());
                return 1;
            }
            json_out = &json_file;
        }
        sinks.push_back(std::make_unique<plantop::JsonSink>(
            *json_out, sort_column, cfg.sort_descending));
    } else {
        sinks.push_back(std::make_unique<plantop::ConsoleSink>(
            sort_column, cfg.sort_descending, cfg.max_rows));
    }

    const bool push = !cfg.pushgateway.url.empty();
    if (push) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        std::string instance = cfg.connection.host + ":" + std::to_string(cfg.connection.port);
        sinks.push_back(std::make_unique<plantop::PushgatewaySink>(cfg.pushgateway, instance));
        LOG_INF("Pushing gauges to %s", cfg.pushgateway.url.c_str());
    }

    for (auto& sink : sinks) {
        sink->attach(*poller);
    }

    g_loop = &loop;
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    poller->start();
    loop.run();

    g_loop = nullptr;
    for (auto& sink : sinks) {
        sink->finish();
    }

    LOG_INF("=== plantop stopped after %lld polls (%lld fetch failures, %lld memory failures, "
        "%lld failed callbacks) ===",
        static_cast<long long>(poller->polls()),
        static_cast<long long>(poller->fetch_failures()),
        static_cast<long long>(poller->memory_failures()),
        static_cast<long long>(loop.alarm_failures()));

    poller.reset();
    db.disconnect();
    if (push) curl_global_cleanup();
    plantop::close_log_file();
    return 0;
}
