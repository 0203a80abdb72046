// Copyright (c) 2025 <Your Name>
/**
 * @file combine.hpp
 * @brief Weighted combination of surviving sources.
 */
#pragma once

#include <vector>

#include "ntpsync/selection.hpp"

namespace ntpsync {

/** @brief Floor applied to root distance before it is used as a divisor. */
constexpr double kMinRootDistance = 1e-6;

/** @brief root_delay / 2 + root_dispersion, floored at kMinRootDistance. */
double RootDistance(const FilteredStat& stat);

/**
 * @brief Combine survivors into one system estimate.
 *
 * offset is the mean weighted by 1 / RootDistance, jitter the weighted RMS
 * spread about it. Stratum, leap, root values and peer jitter come from the
 * survivor with the lowest root distance (ties to the lowest id).
 *
 * Pure: sums run in ascending id order, so identical inputs produce
 * bit-identical output regardless of input order. Empty input yields a
 * default, unsynchronized SystemStat.
 */
SystemStat Combine(const std::vector<Candidate>& survivors);

}  // namespace ntpsync
