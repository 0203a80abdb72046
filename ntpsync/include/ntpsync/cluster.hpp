// Copyright (c) 2025 <Your Name>
/**
 * @file cluster.hpp
 * @brief Outlier pruning among truechimers.
 */
#pragma once

#include <vector>

#include "ntpsync/selection.hpp"

namespace ntpsync {

/** @brief Removals that shrink combined jitter by less than this stop. */
constexpr double kClusterEpsilon = 1e-9;

/** @brief Pruning never leaves fewer members than this (NMIN). */
constexpr int kMinClusterSurvivors = 3;

/**
 * @brief Weighted RMS spread of offsets about their weighted mean.
 *
 * Weights are 1 / RootDistance(stat). Returns 0 for an empty set.
 */
double CombinedJitter(const std::vector<Candidate>& set);

/**
 * @brief Iteratively drop the largest contributor to combined jitter.
 *
 * Contribution is w_i * (offset_i - mean)^2. The largest contributor (ties
 * to the larger root distance, then the larger id) is removed only while
 * more than max(1, min_survivors) members remain and its removal lowers
 * CombinedJitter by more than epsilon.
 *
 * @return Survivors in ascending id order; never empty for non-empty input.
 */
std::vector<Candidate> ClusterSurvivors(std::vector<Candidate> truechimers,
                                        double epsilon = kClusterEpsilon,
                                        int min_survivors = kMinClusterSurvivors);

}  // namespace ntpsync
