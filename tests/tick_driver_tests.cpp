#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cmath>
#include <string>
#include <vector>
#include "../src/tick_driver.hpp"

using Clock = TickDriver::Clock;

static Clock::time_point at_ms(long ms) {
  return Clock::time_point(std::chrono::milliseconds(ms));
}

TEST_CASE("first tick admits into the initial slot") {
  GrowthModel m(2.0);
  TickDriver d;
  TickReport r = d.tick(m, at_ms(0));
  REQUIRE(r.tick == 1);
  REQUIRE(r.outcome == TickOutcome::Admitted);
  REQUIRE(r.admitted);
  REQUIRE_FALSE(r.expanded);
  REQUIRE_FALSE(r.migrated);
  REQUIRE(r.operations == 1);
  REQUIRE(r.snapshot.size == 1);
  REQUIRE(r.snapshot.capacity == 1);
}

TEST_CASE("blocked growth with nothing pending expands and retries") {
  GrowthModel m(2.0);
  TickDriver d;
  d.tick(m, at_ms(0));
  TickReport r = d.tick(m, at_ms(1));
  REQUIRE(r.outcome == TickOutcome::AdmittedAfterExpand);
  REQUIRE(r.expanded);
  REQUIRE(r.admitted);
  REQUIRE(r.migrated); // migration of the single old element starts the same tick
  REQUIRE(r.operations == 3);
  REQUIRE(r.snapshot.capacity == 2);
  REQUIRE(r.snapshot.size == 2);
  REQUIRE(r.snapshot.old_generation_size == 1);
  REQUIRE(r.snapshot.migrated == 1);
}

TEST_CASE("unbounded growth follows powers of the growth factor") {
  GrowthModel m(2.0);
  TickDriver d;
  std::vector<std::size_t> caps;
  for (int i = 0; i < 5000; ++i) {
    TickReport r = d.tick(m, at_ms(i));
    REQUIRE(r.outcome != TickOutcome::Stalled);
    REQUIRE(r.outcome != TickOutcome::LimitReached);
    if (r.expanded)
      caps.push_back(r.snapshot.capacity);
  }
  REQUIRE(caps.size() == m.resize_count());
  for (std::size_t k = 0; k < caps.size(); ++k) {
    REQUIRE(caps[k] == static_cast<std::size_t>(std::ceil(std::pow(2.0, double(k + 1)))));
  }
  REQUIRE_FALSE(d.limit_reached());
}

TEST_CASE("bounded growth reaches the limit exactly once") {
  GrowthModel m(2.0, std::size_t(4));
  TickDriver d;
  int entries = 0;
  std::size_t resizes_at_limit = 0;
  for (int i = 0; i < 50; ++i) {
    TickReport r = d.tick(m, at_ms(i * 10));
    if (r.outcome == TickOutcome::LimitReached) {
      ++entries;
      resizes_at_limit = r.snapshot.resize_count;
      REQUIRE(r.snapshot.capacity == 4);
      REQUIRE(r.snapshot.size == 4);
      REQUIRE(d.limit_tick() == r.tick);
    }
    if (d.limit_reached() && r.outcome != TickOutcome::LimitReached) {
      REQUIRE(r.outcome == TickOutcome::Frozen);
      REQUIRE(r.operations == 0);
      REQUIRE(r.snapshot.resize_count == resizes_at_limit);
    }
  }
  REQUIRE(entries == 1);
  REQUIRE(d.limit_tick() == std::size_t(5));
  REQUIRE(d.limit_time() == at_ms(40));
  REQUIRE(m.capacity() == 4);
  REQUIRE(m.resize_count() == 3);
}

TEST_CASE("frozen ticks do not touch the model") {
  GrowthModel m(2.0, std::size_t(2));
  TickDriver d;
  while (!d.limit_reached())
    d.tick(m, at_ms(0));
  Snapshot before = m.snapshot();
  for (int i = 0; i < 10; ++i) {
    TickReport r = d.tick(m, at_ms(1));
    REQUIRE(r.outcome == TickOutcome::Frozen);
    REQUIRE_FALSE(r.admitted);
    REQUIRE_FALSE(r.migrated);
  }
  Snapshot after = m.snapshot();
  REQUIRE(after.capacity == before.capacity);
  REQUIRE(after.size == before.size);
  REQUIRE(after.migrated == before.migrated);
  REQUIRE(after.migration_op_count == before.migration_op_count);
}

TEST_CASE("hard limit of one stops at the first blocked growth") {
  GrowthModel m(2.0, std::size_t(1));
  TickDriver d;
  REQUIRE(d.tick(m, at_ms(0)).outcome == TickOutcome::Admitted);
  TickReport r = d.tick(m, at_ms(5));
  REQUIRE(r.outcome == TickOutcome::LimitReached);
  REQUIRE(r.snapshot.capacity == 1);
  REQUIRE(d.limit_tick() == std::size_t(2));
}

TEST_CASE("expansion waits for migration of the previous generation") {
  // below factor 2 the new space fills before the old generation is migrated
  GrowthModel m(1.5);
  TickDriver d;
  bool saw_deferred = false;
  for (int i = 0; i < 200; ++i) {
    std::size_t cap_before = m.capacity();
    std::size_t migrated_before = m.migrated();
    bool pending_before = m.migration_pending();
    TickReport r = d.tick(m, at_ms(i));
    if (r.outcome == TickOutcome::Deferred) {
      saw_deferred = true;
      REQUIRE(pending_before);
      REQUIRE_FALSE(r.expanded);
      REQUIRE_FALSE(r.admitted);
      REQUIRE(r.snapshot.capacity == cap_before);
      REQUIRE(r.migrated);
      REQUIRE(r.snapshot.migrated == migrated_before + 1);
    }
    if (r.expanded) {
      REQUIRE_FALSE(pending_before);
    }
  }
  REQUIRE(saw_deferred);
}

TEST_CASE("migration finishes within old generation size ticks of an expansion") {
  GrowthModel m(1.5);
  TickDriver d;
  std::size_t expand_tick = 0, old_gen = 0;
  bool done = true;
  int completions = 0;
  for (int i = 0; i < 3000; ++i) {
    TickReport r = d.tick(m, at_ms(i));
    if (r.expanded) {
      expand_tick = r.tick;
      old_gen = r.snapshot.old_generation_size;
      done = false;
    }
    if (!done && r.snapshot.migrated == old_gen) {
      done = true;
      ++completions;
      REQUIRE(r.tick - expand_tick + 1 == old_gen);
    }
  }
  REQUIRE(completions > 5);
}

TEST_CASE("growth factor of one stalls without progress") {
  GrowthModel m(1.0);
  TickDriver d;
  d.tick(m, at_ms(0));
  for (int i = 1; i < 20; ++i) {
    TickReport r = d.tick(m, at_ms(i));
    REQUIRE((r.outcome == TickOutcome::Stalled || r.outcome == TickOutcome::Deferred));
    REQUIRE(r.snapshot.capacity == 1);
    REQUIRE(r.snapshot.size == 1);
  }
  REQUIRE_FALSE(d.limit_reached());
}

TEST_CASE("counters match the reported work") {
  GrowthModel m(1.7, std::size_t(1000));
  TickDriver d;
  std::size_t expands = 0, migrations = 0;
  for (int i = 0; i < 5000; ++i) {
    TickReport r = d.tick(m, at_ms(i));
    expands += r.expanded ? 1 : 0;
    migrations += r.migrated ? 1 : 0;
    REQUIRE(r.snapshot.size <= r.snapshot.capacity);
    REQUIRE(r.snapshot.migrated <= r.snapshot.old_generation_size);
    REQUIRE(r.snapshot.old_generation_size <= r.snapshot.size);
    REQUIRE(r.snapshot.capacity <= 1000);
  }
  REQUIRE(m.resize_count() == expands);
  REQUIRE(m.migration_op_count() == migrations);
  REQUIRE(d.limit_reached());
}

TEST_CASE("grace period is measured from the first limit tick") {
  GrowthModel m(2.0, std::size_t(1));
  TickDriver d;
  REQUIRE_FALSE(d.grace_elapsed(at_ms(0), std::chrono::seconds(0)));
  d.tick(m, at_ms(0));
  d.tick(m, at_ms(1000));
  REQUIRE(d.limit_reached());
  d.tick(m, at_ms(2000));
  REQUIRE(d.limit_time() == at_ms(1000));
  REQUIRE_FALSE(d.grace_elapsed(at_ms(3999), std::chrono::seconds(3)));
  REQUIRE(d.grace_elapsed(at_ms(4000), std::chrono::seconds(3)));
}

TEST_CASE("outcomes have printable names") {
  REQUIRE(std::string(to_string(TickOutcome::Deferred)) == "deferred");
  REQUIRE(std::string(to_string(TickOutcome::LimitReached)) == "limit_reached");
}

TEST_CASE("a huge growth factor jumps straight to the limit") {
  GrowthModel m(1e20, std::size_t(512) * 512);
  TickDriver d;
  d.tick(m, at_ms(0));
  TickReport r = d.tick(m, at_ms(1));
  REQUIRE(r.outcome == TickOutcome::AdmittedAfterExpand);
  REQUIRE(r.snapshot.capacity == 512u * 512u);
}
