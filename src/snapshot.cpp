#include "snapshot.hpp"

void write_csv_header(std::ostream &os)
{
    os << "tick,growth,capacity,size,old_gen,migrated,resizes,migrations,efficiency\n";
}

void write_csv_row(std::ostream &os, std::size_t tick, const Snapshot &s)
{
    os << tick << "," << s.growth_factor << "," << s.capacity << "," << s.size << ","
       << s.old_generation_size << "," << s.migrated << "," << s.resize_count << ","
       << s.migration_op_count << "," << s.efficiency << "\n";
}
