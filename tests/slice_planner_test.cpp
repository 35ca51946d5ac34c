// =============================================================================
// slice_planner_test.cpp
// =============================================================================
// Unit tests for the pure slice planners in oms::algo.
//
// Validates:
//   - TWAP slice count from the window, explicit slice counts, remainder
//   - VWAP curve weighting and normalization
//   - Iceberg display slicing
//   - Plans above the per-order slice limit are rejected
//   - POV child quantity clamping
//   - Property: every plan sums exactly to the requested quantity
// =============================================================================

#include "oms/algo/slice_planner.hpp"
#include "oms/core/error.hpp"

#include <gtest/gtest.h>

#include <random>
#include <vector>

using oms::algo::SliceWindow;
using oms::domain::OrderSlice;
using oms::domain::Quantity;

namespace {

constexpr std::int64_t kStart = 1'700'000'000'000;
constexpr std::int64_t kMinute = 60'000;

Quantity total(const std::vector<OrderSlice>& slices) {
  Quantity sum = 0;
  for (const auto& s : slices) {
    sum += s.quantity;
  }
  return sum;
}

SliceWindow window(std::int64_t minutes, std::int64_t interval_minutes) {
  return SliceWindow{9, kStart, kStart + minutes * kMinute,
                     interval_minutes * kMinute};
}

}  // namespace

// =============================================================================
// TWAP
// =============================================================================

TEST(SlicePlannerTest, TwapEvenSlicesAcrossWindow) {
  const auto slices = oms::algo::planTwap(10'000, window(25, 5));

  ASSERT_EQ(slices.size(), 5u);
  for (std::size_t i = 0; i < slices.size(); ++i) {
    EXPECT_EQ(slices[i].quantity, 2000);
    EXPECT_EQ(slices[i].scheduled_time_ms,
              kStart + static_cast<std::int64_t>(i) * 5 * kMinute);
    EXPECT_EQ(slices[i].slice_id, i + 1);
    EXPECT_EQ(slices[i].parent_order_id, 9u);
    EXPECT_EQ(slices[i].status, oms::domain::SliceStatus::Pending);
  }
}

TEST(SlicePlannerTest, TwapSliceCountRoundsUp) {
  EXPECT_EQ(oms::algo::twapSliceCount(0, 25 * kMinute, 5 * kMinute), 5);
  EXPECT_EQ(oms::algo::twapSliceCount(0, 26 * kMinute, 5 * kMinute), 6);
  EXPECT_EQ(oms::algo::twapSliceCount(0, kMinute, 5 * kMinute), 1);
  EXPECT_EQ(oms::algo::twapSliceCount(0, 0, 5 * kMinute), 1);
  EXPECT_EQ(oms::algo::twapSliceCount(0, kMinute, 0), 1);
}

TEST(SlicePlannerTest, TwapLastSliceAbsorbsRemainder) {
  const auto slices = oms::algo::planTwap(1000, window(70, 10));
  ASSERT_EQ(slices.size(), 7u);
  for (std::size_t i = 0; i + 1 < slices.size(); ++i) {
    EXPECT_EQ(slices[i].quantity, 142);
  }
  EXPECT_EQ(slices.back().quantity, 148);
}

TEST(SlicePlannerTest, TwapExplicitSliceCountOverridesInterval) {
  const auto slices = oms::algo::planTwap(900, window(30, 5), 3);
  ASSERT_EQ(slices.size(), 3u);
  EXPECT_EQ(slices[1].scheduled_time_ms, kStart + 10 * kMinute);
  EXPECT_EQ(slices[2].scheduled_time_ms, kStart + 20 * kMinute);
  EXPECT_EQ(total(slices), 900);
}

TEST(SlicePlannerTest, TinyQuantityLeavesLeadingEmptySlices) {
  const auto slices = oms::algo::planTwap(3, window(25, 5));
  ASSERT_EQ(slices.size(), 5u);
  EXPECT_EQ(slices[0].quantity, 0);
  EXPECT_EQ(slices.back().quantity, 3);
}

TEST(SlicePlannerTest, NonPositiveQuantityRejected) {
  EXPECT_THROW(oms::algo::planTwap(0, window(25, 5)), oms::ValidationError);
  EXPECT_THROW(oms::algo::planVwap(-1, window(25, 5), {1.0}),
               oms::ValidationError);
  EXPECT_THROW(oms::algo::planIceberg(0, 10, window(25, 5)),
               oms::ValidationError);
}

TEST(SlicePlannerTest, OversizedPlansRejectedBeforeAllocating) {
  EXPECT_THROW(oms::algo::planTwap(100, window(25, 5), 2'000'000'000),
               oms::ValidationError);
  EXPECT_THROW(oms::algo::twapSliceCount(kStart, kStart + 60 * kMinute, 1),
               oms::ValidationError);
  EXPECT_THROW(oms::algo::planVwap(100, window(30, 0),
                                   std::vector<double>(10'001, 1.0)),
               oms::ValidationError);
  EXPECT_THROW(oms::algo::planIceberg(1'000'000'000, 1, window(60, 1)),
               oms::ValidationError);

  const auto at_limit =
      oms::algo::planTwap(10'000, window(25, 5), oms::domain::kMaxAlgorithmSlices);
  EXPECT_EQ(at_limit.size(), 10'000u);
}

// =============================================================================
// VWAP
// =============================================================================

TEST(SlicePlannerTest, VwapFollowsCurve) {
  const auto slices = oms::algo::planVwap(1000, window(30, 0), {1.0, 2.0, 1.0});
  ASSERT_EQ(slices.size(), 3u);
  EXPECT_EQ(slices[0].quantity, 250);
  EXPECT_EQ(slices[1].quantity, 500);
  EXPECT_EQ(slices[2].quantity, 250);
  EXPECT_EQ(slices[1].scheduled_time_ms, kStart + 10 * kMinute);
}

TEST(SlicePlannerTest, VwapRemainderGoesToLastBucket) {
  const auto slices = oms::algo::planVwap(1000, window(30, 0), {1.0, 1.0, 1.0});
  ASSERT_EQ(slices.size(), 3u);
  EXPECT_EQ(slices[0].quantity, 333);
  EXPECT_EQ(slices[1].quantity, 333);
  EXPECT_EQ(slices[2].quantity, 334);
}

TEST(SlicePlannerTest, NormalizeCurve) {
  const auto clipped = oms::algo::normalizeCurve({-1.0, 3.0}, 2);
  EXPECT_DOUBLE_EQ(clipped[0], 0.0);
  EXPECT_DOUBLE_EQ(clipped[1], 1.0);

  const auto uniform = oms::algo::normalizeCurve({}, 4);
  ASSERT_EQ(uniform.size(), 4u);
  for (double w : uniform) {
    EXPECT_DOUBLE_EQ(w, 0.25);
  }

  const auto padded = oms::algo::normalizeCurve({2.0}, 3);
  EXPECT_DOUBLE_EQ(padded[0], 1.0);
  EXPECT_DOUBLE_EQ(padded[1], 0.0);

  EXPECT_TRUE(oms::algo::normalizeCurve({1.0}, 0).empty());
}

// =============================================================================
// Iceberg
// =============================================================================

TEST(SlicePlannerTest, IcebergShowsDisplayQuantityPerInterval) {
  const auto slices = oms::algo::planIceberg(2500, 1000, window(60, 1));
  ASSERT_EQ(slices.size(), 3u);
  EXPECT_EQ(slices[0].quantity, 1000);
  EXPECT_EQ(slices[1].quantity, 1000);
  EXPECT_EQ(slices[2].quantity, 500);
  EXPECT_EQ(slices[2].scheduled_time_ms, kStart + 2 * kMinute);

  EXPECT_THROW(oms::algo::planIceberg(2500, 0, window(60, 1)),
               oms::ValidationError);
}

// =============================================================================
// POV
// =============================================================================

TEST(SlicePlannerTest, PovChildQuantityTracksTargetRate) {
  EXPECT_EQ(oms::algo::povChildQuantity(10'000, 0, 5'000, 0.10, 0.05, 0.20),
            1000);
  EXPECT_EQ(oms::algo::povChildQuantity(10'000, 600, 5'000, 0.10, 0.05, 0.20),
            400);
}

TEST(SlicePlannerTest, PovChildQuantityClamps) {
  // Ahead of target: nothing to send.
  EXPECT_EQ(oms::algo::povChildQuantity(10'000, 1'200, 5'000, 0.10, 0.05, 0.20),
            0);
  // Never more than the parent has left.
  EXPECT_EQ(oms::algo::povChildQuantity(10'000, 0, 300, 0.10, 0.05, 0.20), 300);
  // Target above max participation is capped.
  EXPECT_EQ(oms::algo::povChildQuantity(10'000, 0, 5'000, 0.50, 0.05, 0.20),
            2000);
  // Target below min participation is raised.
  EXPECT_EQ(oms::algo::povChildQuantity(10'000, 0, 5'000, 0.10, 0.30, 0.50),
            3000);
  EXPECT_EQ(oms::algo::povChildQuantity(0, 0, 5'000, 0.10, 0.05, 0.20), 0);
}

// =============================================================================
// Property: plans always sum to the requested quantity
// =============================================================================

TEST(SlicePlannerTest, PlansSumToRequestedQuantity) {
  std::mt19937 rng(99);
  std::uniform_int_distribution<Quantity> qty(1, 1'000'000);
  std::uniform_int_distribution<int> minutes(1, 400);
  std::uniform_int_distribution<int> interval(1, 30);
  std::uniform_real_distribution<double> weight(0.0, 5.0);

  for (int trial = 0; trial < 300; ++trial) {
    const Quantity q = qty(rng);
    const SliceWindow w = window(minutes(rng), interval(rng));

    EXPECT_EQ(total(oms::algo::planTwap(q, w)), q);

    std::vector<double> curve(static_cast<std::size_t>(1 + trial % 13));
    for (auto& c : curve) {
      c = weight(rng);
    }
    const auto vwap = oms::algo::planVwap(q, w, curve);
    EXPECT_EQ(total(vwap), q);
    for (const auto& s : vwap) {
      EXPECT_GE(s.quantity, 0);
    }

    EXPECT_EQ(total(oms::algo::planIceberg(q, 1 + q / 7, w)), q);
  }
}
