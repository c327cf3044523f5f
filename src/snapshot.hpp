#pragma once
#include <cstddef>
#include <ostream>

// Read-only view of the model handed to renderers and stats once per tick.
struct Snapshot
{
    double growth_factor = 0.0;
    std::size_t capacity = 0;
    std::size_t size = 0;
    std::size_t old_generation_size = 0;
    std::size_t migrated = 0;
    std::size_t resize_count = 0;
    std::size_t migration_op_count = 0;
    double efficiency = 0.0;
};

void write_csv_header(std::ostream &os);
void write_csv_row(std::ostream &os, std::size_t tick, const Snapshot &s);
