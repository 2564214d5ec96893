#pragma once
// Plain-text table of the busiest plans, one block per poll cycle
#include <cstdio>
#include <string>

#include "../monitor/columns.hpp"
#include "cycle_sink.hpp"

namespace plantop {

class ConsoleSink : public CycleSink {
public:
    ConsoleSink(Column sort_column, bool descending, int max_rows,
                std::FILE* out = stdout)
        : sort_column_(sort_column), descending_(descending),
          max_rows_(max_rows), out_(out) {}

    // Collapse whitespace runs to single spaces and cut to `width` columns
    static std::string shorten_query(const std::string& query, size_t width);

protected:
    void write_cycle(const CycleReport& report) override;

private:
    Column sort_column_;
    bool descending_;
    int max_rows_;
    std::FILE* out_;
};

} // namespace plantop
