#include "core/series_utils.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace dynamix {

double mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  double sum = std::accumulate(values.begin(), values.end(), 0.0);
  return sum / static_cast<double>(values.size());
}

double populationStddev(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  double m = mean(values);
  double acc = 0.0;
  for (double v : values) {
    acc += (v - m) * (v - m);
  }
  return std::sqrt(acc / static_cast<double>(values.size()));
}

double percentile(std::vector<double> values, double pct) {
  if (values.empty()) return 0.0;
  std::sort(values.begin(), values.end());
  pct = std::clamp(pct, 0.0, 100.0);
  double rank = pct / 100.0 * static_cast<double>(values.size() - 1);
  size_t lower = static_cast<size_t>(std::floor(rank));
  size_t upper = std::min(lower + 1, values.size() - 1);
  double frac = rank - static_cast<double>(lower);
  return values[lower] + (values[upper] - values[lower]) * frac;
}

std::vector<double> valuesInSpan(const std::vector<TimedValue>& series, Seconds start,
                                 Seconds end) {
  std::vector<double> result;
  for (const auto& sample : series) {
    if (sample.time >= start && sample.time <= end) {
      result.push_back(sample.value);
    }
  }
  return result;
}

std::vector<double> seriesValues(const std::vector<TimedValue>& series) {
  std::vector<double> result;
  result.reserve(series.size());
  for (const auto& sample : series) {
    result.push_back(sample.value);
  }
  return result;
}

std::vector<double> centeredMovingAverage(const std::vector<double>& values, size_t window) {
  if (window <= 1) return values;

  const size_t n = values.size();
  const size_t before = window / 2;
  const size_t after = (window - 1) / 2;

  // Prefix sums for O(n) windows
  std::vector<double> prefix(n + 1, 0.0);
  for (size_t i = 0; i < n; ++i) {
    prefix[i + 1] = prefix[i] + values[i];
  }

  std::vector<double> result(n, 0.0);
  for (size_t i = 0; i < n; ++i) {
    size_t lo = (i >= before) ? i - before : 0;
    size_t hi = std::min(i + after, n - 1);
    result[i] = (prefix[hi + 1] - prefix[lo]) / static_cast<double>(window);
  }
  return result;
}

bool isStrictlyIncreasing(const std::vector<TimedValue>& series) {
  for (size_t i = 1; i < series.size(); ++i) {
    if (!(series[i].time > series[i - 1].time)) return false;
  }
  return true;
}

bool isTimeOrdered(const std::vector<TimedValue>& series) {
  for (size_t i = 1; i < series.size(); ++i) {
    if (series[i].time < series[i - 1].time) return false;
  }
  return true;
}

bool timesWithin(const std::vector<TimedValue>& series, double lo, double hi) {
  for (const auto& s : series) {
    if (!(s.time >= lo && s.time <= hi)) return false;
  }
  return true;
}

}  // namespace dynamix
