// Copyright (c) 2025 The NTP Sample Authors
#include "ntpsync/cluster.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include "ntpsync/combine.hpp"

namespace ntpsync {

namespace {

double WeightedMean(const std::vector<Candidate>& set) {
  double sum_w = 0.0;
  double sum_wx = 0.0;
  for (const auto& c : set) {
    double w = 1.0 / RootDistance(c.stat);
    sum_w += w;
    sum_wx += w * c.stat.offset;
  }
  return sum_wx / sum_w;
}

}  // namespace

double CombinedJitter(const std::vector<Candidate>& set) {
  if (set.empty()) return 0.0;
  const double mean = WeightedMean(set);
  double sum_w = 0.0;
  double sum_c = 0.0;
  for (const auto& c : set) {
    double w = 1.0 / RootDistance(c.stat);
    double d = c.stat.offset - mean;
    sum_w += w;
    sum_c += w * d * d;
  }
  return std::sqrt(sum_c / sum_w);
}

std::vector<Candidate> ClusterSurvivors(std::vector<Candidate> truechimers,
                                        double epsilon, int min_survivors) {
  std::sort(truechimers.begin(), truechimers.end(),
            [](const Candidate& a, const Candidate& b) { return a.id < b.id; });

  const size_t keep = static_cast<size_t>(std::max(1, min_survivors));
  while (truechimers.size() > keep) {
    const double mean = WeightedMean(truechimers);

    size_t worst = 0;
    double worst_c = -1.0;
    for (size_t i = 0; i < truechimers.size(); ++i) {
      const FilteredStat& s = truechimers[i].stat;
      double d = s.offset - mean;
      double c = d * d / RootDistance(s);
      // Ascending ids: >= on equal root distance prefers the larger id.
      bool take = c > worst_c ||
                  (c == worst_c && RootDistance(s) >=
                                       RootDistance(truechimers[worst].stat));
      if (take) {
        worst = i;
        worst_c = c;
      }
    }

    std::vector<Candidate> reduced;
    reduced.reserve(truechimers.size() - 1);
    for (size_t i = 0; i < truechimers.size(); ++i) {
      if (i != worst) reduced.push_back(truechimers[i]);
    }

    const double gain = CombinedJitter(truechimers) - CombinedJitter(reduced);
    if (gain <= epsilon) break;
    truechimers = std::move(reduced);
  }
  return truechimers;
}

}  // namespace ntpsync
