// Copyright (c) 2025 The NTP Sample Authors
#include "ntpsync/combine.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace ntpsync {

double RootDistance(const FilteredStat& stat) {
  return std::max(kMinRootDistance,
                  stat.root_delay / 2.0 + stat.root_dispersion);
}

SystemStat Combine(const std::vector<Candidate>& survivors) {
  SystemStat out;
  if (survivors.empty()) return out;

  std::vector<Candidate> sorted(survivors);
  std::sort(sorted.begin(), sorted.end(),
            [](const Candidate& a, const Candidate& b) { return a.id < b.id; });

  double sum_w = 0.0;
  double sum_wx = 0.0;
  for (const auto& c : sorted) {
    double w = 1.0 / RootDistance(c.stat);
    sum_w += w;
    sum_wx += w * c.stat.offset;
  }
  const double mean = sum_wx / sum_w;

  double sum_wd = 0.0;
  for (const auto& c : sorted) {
    double d = c.stat.offset - mean;
    sum_wd += (1.0 / RootDistance(c.stat)) * d * d;
  }

  // Strict < keeps the lowest id on ties.
  const Candidate* best = &sorted.front();
  for (const auto& c : sorted) {
    if (RootDistance(c.stat) < RootDistance(best->stat)) best = &c;
  }

  out.offset = mean;
  out.jitter = std::sqrt(sum_wd / sum_w);
  out.stratum = best->stat.stratum;
  out.leap = best->stat.leap;
  out.synchronized = true;
  out.root_delay = best->stat.root_delay;
  out.root_dispersion = best->stat.root_dispersion;
  out.peer_jitter = best->stat.jitter;
  out.system_peer = best->id;
  out.survivors = static_cast<int>(sorted.size());
  return out;
}

}  // namespace ntpsync
