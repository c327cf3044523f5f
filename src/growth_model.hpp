#pragma once
#include <cstddef>
#include <optional>

#include "snapshot.hpp"

// Synthetic growable array: tracks capacity, admitted elements and the
// old generation still waiting to be migrated after the last expansion.
// Nothing is allocated; every operation is O(1).
//
// Preconditions (not checked): growth_factor > 1, hard_limit >= 1.
class GrowthModel
{
public:
    explicit GrowthModel(double growth_factor, std::optional<std::size_t> hard_limit = std::nullopt);

    // Admit one element. Returns the new size, or nullopt when capacity is exhausted.
    std::optional<std::size_t> try_grow();

    // Current contents become the old generation; capacity is multiplied by the
    // growth factor (rounded up) and clamped to the hard limit.
    // Only meaningful right after try_grow() failed.
    void expand();

    // Count one old-generation element as migrated. Returns the new migrated
    // count, or nullopt once the old generation is fully migrated.
    std::optional<std::size_t> migrate_one();

    // Settled share of capacity: new elements plus migrated old ones.
    double efficiency() const;

    double growth_factor() const { return growth_; }
    std::size_t capacity() const { return cap_; }
    std::size_t size() const { return size_; }
    std::size_t old_generation_size() const { return old_gen_; }
    std::size_t migrated() const { return migrated_; }
    std::optional<std::size_t> hard_limit() const { return hard_limit_; }
    std::size_t resize_count() const { return resizes_; }
    std::size_t migration_op_count() const { return migration_ops_; }

    bool migration_pending() const { return migrated_ < old_gen_; }
    bool at_hard_limit() const { return hard_limit_ && cap_ >= *hard_limit_; }

    Snapshot snapshot() const;

private:
    double growth_;
    std::size_t cap_;
    std::size_t size_;
    std::size_t old_gen_;
    std::size_t migrated_;
    std::optional<std::size_t> hard_limit_;
    std::size_t resizes_;
    std::size_t migration_ops_;
};
