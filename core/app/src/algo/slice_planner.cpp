#include "oms/algo/slice_planner.hpp"
#include "oms/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace oms {
namespace algo {

namespace {

// Absorbs representation error in q * weight before flooring.
constexpr double kFloorEpsilon = 1e-9;

domain::OrderSlice makeSlice(const SliceWindow& window, std::size_t index,
                             domain::Quantity quantity,
                             std::int64_t scheduled_ms) {
  domain::OrderSlice slice;
  slice.slice_id = static_cast<domain::SliceId>(index + 1);
  slice.parent_order_id = window.parent_order_id;
  slice.quantity = quantity;
  slice.scheduled_time_ms = scheduled_ms;
  slice.status = domain::SliceStatus::Pending;
  return slice;
}

void requirePositive(domain::Quantity quantity) {
  if (quantity <= 0) {
    throw ValidationError("slice plan quantity must be > 0");
  }
}

void requireSliceCount(std::int64_t count) {
  if (count > domain::kMaxAlgorithmSlices) {
    throw ValidationError("slice plan needs " + std::to_string(count) +
                          " slices, limit is " +
                          std::to_string(domain::kMaxAlgorithmSlices));
  }
}

}  // namespace

int twapSliceCount(std::int64_t start_ms, std::int64_t end_ms,
                   std::int64_t interval_ms) {
  const std::int64_t duration = end_ms - start_ms;
  if (duration <= 0 || interval_ms <= 0) {
    return 1;
  }
  const std::int64_t count = (duration + interval_ms - 1) / interval_ms;
  requireSliceCount(count);
  return static_cast<int>(std::max<std::int64_t>(1, count));
}

// -----------------------------------------------------------------------------
// planTwap
// -----------------------------------------------------------------------------
std::vector<domain::OrderSlice> planTwap(domain::Quantity quantity,
                                         const SliceWindow& window,
                                         int num_slices) {
  requirePositive(quantity);

  std::int64_t interval = window.interval_ms;
  int count = 0;
  if (num_slices > 0) {
    requireSliceCount(num_slices);
    count = num_slices;
    interval = std::max<std::int64_t>(
        0, (window.end_ms - window.start_ms) / num_slices);
  } else {
    count = twapSliceCount(window.start_ms, window.end_ms, interval);
  }

  const domain::Quantity base = quantity / count;
  std::vector<domain::OrderSlice> slices;
  slices.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    const bool last = i == count - 1;
    const domain::Quantity q = last ? quantity - base * (count - 1) : base;
    slices.push_back(makeSlice(window, static_cast<std::size_t>(i), q,
                               window.start_ms + interval * i));
  }
  return slices;
}

// -----------------------------------------------------------------------------
// normalizeCurve / planVwap
// -----------------------------------------------------------------------------
std::vector<double> normalizeCurve(const std::vector<double>& curve,
                                   std::size_t size) {
  std::vector<double> out(size, 0.0);
  if (size == 0) {
    return out;
  }

  double sum = 0.0;
  for (std::size_t i = 0; i < size && i < curve.size(); ++i) {
    out[i] = std::max(0.0, curve[i]);
    sum += out[i];
  }

  if (sum <= 0.0) {
    std::fill(out.begin(), out.end(), 1.0 / static_cast<double>(size));
    return out;
  }
  for (auto& weight : out) {
    weight /= sum;
  }
  return out;
}

std::vector<domain::OrderSlice> planVwap(domain::Quantity quantity,
                                         const SliceWindow& window,
                                         const std::vector<double>& curve) {
  requirePositive(quantity);

  const std::size_t buckets = std::max<std::size_t>(1, curve.size());
  requireSliceCount(static_cast<std::int64_t>(buckets));
  const std::vector<double> weights = normalizeCurve(curve, buckets);
  const std::int64_t width =
      (window.end_ms - window.start_ms) / static_cast<std::int64_t>(buckets);

  std::vector<domain::OrderSlice> slices;
  slices.reserve(buckets);
  domain::Quantity allocated = 0;
  for (std::size_t i = 0; i < buckets; ++i) {
    domain::Quantity q = 0;
    if (i + 1 == buckets) {
      q = quantity - allocated;
    } else {
      q = static_cast<domain::Quantity>(std::floor(
          static_cast<double>(quantity) * weights[i] + kFloorEpsilon));
      q = std::min(q, quantity - allocated);
    }
    allocated += q;
    slices.push_back(makeSlice(window, i, q,
                               window.start_ms +
                                   width * static_cast<std::int64_t>(i)));
  }
  return slices;
}

// -----------------------------------------------------------------------------
// planIceberg
// -----------------------------------------------------------------------------
std::vector<domain::OrderSlice> planIceberg(domain::Quantity quantity,
                                            domain::Quantity display_quantity,
                                            const SliceWindow& window) {
  requirePositive(quantity);
  if (display_quantity <= 0) {
    throw ValidationError("iceberg display quantity must be > 0");
  }
  requireSliceCount((quantity + display_quantity - 1) / display_quantity);

  std::vector<domain::OrderSlice> slices;
  domain::Quantity left = quantity;
  std::size_t index = 0;
  while (left > 0) {
    const domain::Quantity q = std::min(display_quantity, left);
    slices.push_back(makeSlice(
        window, index, q,
        window.start_ms + window.interval_ms * static_cast<std::int64_t>(index)));
    left -= q;
    ++index;
  }
  return slices;
}

// -----------------------------------------------------------------------------
// povChildQuantity
// -----------------------------------------------------------------------------
domain::Quantity povChildQuantity(domain::Quantity market_volume,
                                  domain::Quantity executed,
                                  domain::Quantity remaining,
                                  double target_rate, double min_rate,
                                  double max_rate) {
  if (market_volume <= 0 || remaining <= 0) {
    return 0;
  }
  const double volume = static_cast<double>(market_volume);

  const auto floor_at = [&](double rate) {
    return static_cast<domain::Quantity>(
        std::floor(volume * rate + kFloorEpsilon));
  };
  const domain::Quantity lower = static_cast<domain::Quantity>(
      std::ceil(volume * min_rate - kFloorEpsilon));
  const domain::Quantity upper = floor_at(max_rate);
  const domain::Quantity target =
      std::clamp(floor_at(target_rate), std::min(lower, upper), upper);

  return std::clamp<domain::Quantity>(target - executed, 0, remaining);
}

}  // namespace algo
}  // namespace oms
