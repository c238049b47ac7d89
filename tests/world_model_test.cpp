// File: tests/world_model_test.cpp
#include <gtest/gtest.h>

#include "ps/adapters/sim/simulated_distance_source.hpp"
#include "ps/core/config.hpp"
#include "ps/core/model/distance_sensor.hpp"
#include "ps/core/model/world_model.hpp"
#include "ps/core/util/rng.hpp"

namespace {

using ps::TimestampNs;

TEST(WorldModel, DwellWithinBandsForUnitActivity) {
  const ps::WorldConfig cfg;
  ps::Rng rng(2024);

  for (int i = 0; i < 2000; ++i) {
    const double occ_s = ps::ns_to_seconds(ps::draw_dwell_ns(true, 1.0, cfg, rng));
    EXPECT_GE(occ_s, 45.0);
    EXPECT_LE(occ_s, 180.0);

    const double free_s = ps::ns_to_seconds(ps::draw_dwell_ns(false, 1.0, cfg, rng));
    EXPECT_GE(free_s, 30.0);
    EXPECT_LE(free_s, 150.0);
  }
}

TEST(WorldModel, ActivityScalesDwellDown) {
  const ps::WorldConfig cfg;
  ps::Rng slow_rng(77);
  ps::Rng fast_rng(77);

  // Same base draws, divided by different activity factors.
  for (int i = 0; i < 100; ++i) {
    const auto slow = ps::draw_dwell_ns(true, 0.6, cfg, slow_rng);
    const auto fast = ps::draw_dwell_ns(true, 1.6, cfg, fast_rng);
    EXPECT_GT(slow, fast);
  }
}

TEST(WorldModel, NewSpotStartsFreeAndArmed) {
  const ps::WorldConfig cfg;
  ps::Rng rng(1);
  const TimestampNs start{ps::seconds_to_ns(10.0)};

  const ps::WorldState w = ps::make_world_state(start, cfg, rng);
  EXPECT_FALSE(w.occupied);
  EXPECT_TRUE(cfg.activity.contains(w.activity));
  EXPECT_GT(w.next_transition, start);

  // Free dwell bounds scaled by the activity factor.
  const double dwell_s = ps::ns_to_seconds(w.next_transition.ns - start.ns);
  EXPECT_GE(dwell_s, cfg.free_dwell_s.lo / w.activity - 1e-6);
  EXPECT_LE(dwell_s, cfg.free_dwell_s.hi / w.activity + 1e-6);
}

TEST(WorldModel, NoFlipBeforeNextTransition) {
  const ps::WorldConfig cfg;
  ps::Rng rng(1);

  ps::WorldState w;
  w.occupied = false;
  w.activity = 1.0;
  w.next_transition = TimestampNs{ps::seconds_to_ns(100.0)};

  const ps::WorldState after = ps::advance(w, TimestampNs{ps::seconds_to_ns(99.999)}, cfg, rng);
  EXPECT_FALSE(after.occupied);
  EXPECT_EQ(after.next_transition, w.next_transition);
}

TEST(WorldModel, FlipsAtNextTransitionAndRearms) {
  const ps::WorldConfig cfg;
  ps::Rng rng(1);

  ps::WorldState w;
  w.occupied = false;
  w.activity = 1.0;
  w.next_transition = TimestampNs{ps::seconds_to_ns(100.0)};

  const TimestampNs now = w.next_transition;  // >= is inclusive
  const ps::WorldState after = ps::advance(w, now, cfg, rng);
  EXPECT_TRUE(after.occupied);
  EXPECT_DOUBLE_EQ(after.activity, 1.0);

  // Now occupied, so the new dwell comes from the occupied band.
  const double dwell_s = ps::ns_to_seconds(after.next_transition.ns - now.ns);
  EXPECT_GE(dwell_s, 45.0);
  EXPECT_LE(dwell_s, 180.0);
}

TEST(WorldModel, FlipsAtMostOncePerAdvance) {
  const ps::WorldConfig cfg;
  ps::Rng rng(1);

  ps::WorldState w;
  w.activity = 1.0;
  w.next_transition = TimestampNs{0};

  // Far in the future: still exactly one flip, re-armed relative to `now`.
  const TimestampNs now{ps::seconds_to_ns(10'000.0)};
  const ps::WorldState after = ps::advance(w, now, cfg, rng);
  EXPECT_TRUE(after.occupied);
  EXPECT_GT(after.next_transition, now);
}

TEST(WorldModel, AlternatesOverTime) {
  ps::WorldConfig cfg;
  cfg.occupied_dwell_s = {2.0, 2.0};
  cfg.free_dwell_s = {3.0, 3.0};
  ps::Rng rng(1);

  ps::WorldState w;
  w.activity = 1.0;
  w.next_transition = TimestampNs{ps::seconds_to_ns(1.0)};

  int flips = 0;
  bool prev = w.occupied;
  for (int t = 0; t <= 20; ++t) {
    w = ps::advance(w, TimestampNs{ps::seconds_to_ns(static_cast<double>(t))}, cfg, rng);
    if (w.occupied != prev) ++flips;
    prev = w.occupied;
  }
  // Flips at t = 1 (occ), 3 (free), 6 (occ), 8, 11, 13, 16, 18.
  EXPECT_EQ(flips, 8);
}

TEST(SimulatedDistanceSource, ReadingsFollowGroundTruth) {
  ps::SimSourceConfig sc;
  sc.spot_count = 3;
  sc.world.occupied_dwell_s = {5.0, 5.0};
  sc.world.free_dwell_s = {5.0, 5.0};
  sc.world.activity = {1.0, 1.0};

  ps::SimulatedDistanceSource src(sc, ps::Rng(99), TimestampNs{0});
  ASSERT_EQ(src.spot_count(), 3u);

  const ps::DetectionConfig det;
  for (int t = 0; t < 30; ++t) {
    const TimestampNs now{ps::seconds_to_ns(static_cast<double>(t))};
    for (std::size_t i = 0; i < src.spot_count(); ++i) {
      const double d = src.read_cm(i, now);
      EXPECT_EQ(ps::detect_occupied(d, det.threshold_cm), src.world(i).occupied)
          << "spot " << i << " t=" << t;
    }
  }
}

TEST(SimulatedDistanceSource, SameSeedSameSequence) {
  ps::SimSourceConfig sc;
  sc.spot_count = 4;
  ps::SimulatedDistanceSource a(sc, ps::Rng(5), TimestampNs{0});
  ps::SimulatedDistanceSource b(sc, ps::Rng(5), TimestampNs{0});

  for (int t = 0; t < 500; ++t) {
    const TimestampNs now{ps::seconds_to_ns(static_cast<double>(t))};
    for (std::size_t i = 0; i < sc.spot_count; ++i) {
      EXPECT_DOUBLE_EQ(a.read_cm(i, now), b.read_cm(i, now));
    }
  }
}

}  // namespace
