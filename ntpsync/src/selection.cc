// Copyright (c) 2025 The NTP Sample Authors
/**
 * @file selection.cc
 * @brief Marzullo-style intersection over correctness intervals.
 */
#include "ntpsync/selection.hpp"

#include <algorithm>
#include <tuple>
#include <vector>

namespace ntpsync {

namespace {

struct Edge {
  double value;
  int type;  // -1 lower, +1 upper
  SourceId id;
};

bool EdgeLess(const Edge& a, const Edge& b) {
  return std::tie(a.value, a.type, a.id) < std::tie(b.value, b.type, b.id);
}

}  // namespace

SelectionResult SelectTruechimers(const std::vector<Candidate>& candidates) {
  SelectionResult result;
  const int n = static_cast<int>(candidates.size());
  if (n == 0) return result;

  std::vector<Edge> edges;
  edges.reserve(candidates.size() * 2);
  for (const auto& c : candidates) {
    edges.push_back({c.stat.offset - c.stat.dispersion, -1, c.id});
    edges.push_back({c.stat.offset + c.stat.dispersion, +1, c.id});
  }
  std::sort(edges.begin(), edges.end(), EdgeLess);

  for (int m = n; m > n / 2; --m) {
    double low = 0.0;
    double high = 0.0;
    bool have_low = false;
    bool have_high = false;

    int count = 0;
    for (const auto& e : edges) {
      count -= e.type;
      if (count >= m) {
        low = e.value;
        have_low = true;
        break;
      }
    }

    count = 0;
    for (auto it = edges.rbegin(); it != edges.rend(); ++it) {
      count += it->type;
      if (count >= m) {
        high = it->value;
        have_high = true;
        break;
      }
    }

    if (have_low && have_high && low <= high) {
      result.low = low;
      result.high = high;
      result.found = true;
      break;
    }
  }

  for (const auto& c : candidates) {
    bool overlaps = result.found &&
                    c.stat.offset - c.stat.dispersion <= result.high &&
                    c.stat.offset + c.stat.dispersion >= result.low;
    (overlaps ? result.truechimers : result.falsetickers).push_back(c.id);
  }
  std::sort(result.truechimers.begin(), result.truechimers.end());
  std::sort(result.falsetickers.begin(), result.falsetickers.end());
  return result;
}

}  // namespace ntpsync
