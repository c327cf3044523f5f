#include "growth_model.hpp"
#include <cmath>
#include <limits>

GrowthModel::GrowthModel(double growth_factor, std::optional<std::size_t> hard_limit)
    : growth_(growth_factor), cap_(1), size_(0), old_gen_(0), migrated_(0),
      hard_limit_(hard_limit), resizes_(0), migration_ops_(0)
{
}

std::optional<std::size_t> GrowthModel::try_grow()
{
    if (size_ + 1 > cap_)
        return std::nullopt;
    return ++size_;
}

void GrowthModel::expand()
{
    old_gen_ = size_;
    // clamp while still a double; the product can exceed size_t
    const double want = std::ceil(static_cast<double>(cap_) * growth_);
    const std::size_t ceiling = hard_limit_ ? *hard_limit_ : std::numeric_limits<std::size_t>::max();
    std::size_t ncap;
    if (!(want > static_cast<double>(cap_)))
        ncap = cap_; // growth <= 1 never enlarges, but capacity must not shrink either
    else if (want >= static_cast<double>(ceiling))
        ncap = ceiling;
    else
        ncap = static_cast<std::size_t>(want);
    if (ncap < cap_)
        ncap = cap_;
    cap_ = ncap;
    migrated_ = 0;
    ++resizes_;
}

std::optional<std::size_t> GrowthModel::migrate_one()
{
    if (migrated_ >= old_gen_)
        return std::nullopt;
    ++migration_ops_;
    return ++migrated_;
}

double GrowthModel::efficiency() const
{
    return static_cast<double>(size_ - old_gen_ + migrated_) / static_cast<double>(cap_);
}

Snapshot GrowthModel::snapshot() const
{
    Snapshot s;
    s.growth_factor = growth_;
    s.capacity = cap_;
    s.size = size_;
    s.old_generation_size = old_gen_;
    s.migrated = migrated_;
    s.resize_count = resizes_;
    s.migration_op_count = migration_ops_;
    s.efficiency = efficiency();
    return s;
}
