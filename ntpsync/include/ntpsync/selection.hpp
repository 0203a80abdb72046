// Copyright (c) 2025 <Your Name>
/**
 * @file selection.hpp
 * @brief Interval-intersection selection of truechimers.
 */
#pragma once

#include <vector>

#include "ntpsync/types.hpp"

namespace ntpsync {

/** @brief A source's filtered estimate entering a round. */
struct Candidate {
  SourceId id = 0;
  FilteredStat stat;
};

/** @brief Outcome of the intersection procedure. */
struct SelectionResult {
  std::vector<SourceId> truechimers;   ///< Ascending ids
  std::vector<SourceId> falsetickers;  ///< Ascending ids
  double low = 0.0;                    ///< Agreed interval, valid if found
  double high = 0.0;
  bool found = false;
};

/**
 * @brief Partition candidates into truechimers and falsetickers.
 *
 * Each candidate contributes [offset - dispersion, offset + dispersion].
 * For m = n down to floor(n/2) + 1 the endpoints are scanned from below for
 * the first point covered by m intervals and from above for the last such
 * point; the first m for which they do not cross defines the agreed
 * interval. Candidates whose interval touches it are truechimers.
 *
 * Endpoints sort by value, lower endpoints before upper at equal value (so
 * touching intervals overlap), then by id.
 *
 * An empty input, or no majority agreement, yields no truechimers.
 */
SelectionResult SelectTruechimers(const std::vector<Candidate>& candidates);

}  // namespace ntpsync
