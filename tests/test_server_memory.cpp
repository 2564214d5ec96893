#include <catch2/catch.hpp>

#include "fake_data_source.hpp"
#include "monitor/server_memory.hpp"

using namespace plantop;           // NOLINT
using namespace plantop::testing;  // NOLINT

TEST_CASE("ParseMemoryStatus", "[server_memory]") {
    CHECK(parse_memory_status("2048 MB") == Approx(2048.0));
    CHECK(parse_memory_status("153.625 MB") == Approx(153.625));
    CHECK(parse_memory_status("0 MB") == Approx(0.0));
    CHECK(parse_memory_status("512") == Approx(512.0));

    CHECK_THROWS_AS(parse_memory_status(""), MalformedStatusRow);
    CHECK_THROWS_AS(parse_memory_status(" MB"), MalformedStatusRow);
    CHECK_THROWS_AS(parse_memory_status("lots MB"), MalformedStatusRow);
    CHECK_THROWS_AS(parse_memory_status("2048MB"), MalformedStatusRow);
    CHECK_THROWS_AS(parse_memory_status("inf MB"), MalformedStatusRow);
}

TEST_CASE("FetchServerMemory", "[server_memory]") {
    FakeConnector db;

    SECTION("Reads the Value column") {
        db.push_memory("2048 MB");
        CHECK(fetch_server_memory(db) == Approx(2048.0));
        REQUIRE(db.executed.size() == 1);
        CHECK(db.executed[0] == kServerMemoryQuery);
    }

    SECTION("Unparsable value") {
        db.push_memory("unknown");
        CHECK_THROWS_AS(fetch_server_memory(db), MalformedStatusRow);
    }

    SECTION("NULL value") {
        Row r;
        r.set("Variable_name", std::string("Total_server_memory"));
        r.set("Value", std::nullopt);
        db.push_rows(kServerMemoryQuery, {r});
        CHECK_THROWS_AS(fetch_server_memory(db), MalformedStatusRow);
    }

    SECTION("Status variable missing") {
        db.push_rows(kServerMemoryQuery, {});
        CHECK_THROWS_AS(fetch_server_memory(db), QueryError);
    }

    SECTION("Lookup failure") {
        db.push_error(kServerMemoryQuery, "MySQL server has gone away");
        CHECK_THROWS_AS(fetch_server_memory(db), QueryError);
    }
}
