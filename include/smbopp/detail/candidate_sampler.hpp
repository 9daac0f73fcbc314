// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_CANDIDATE_SAMPLER_HPP
#define SMBOPP_CANDIDATE_SAMPLER_HPP
#pragma once

#include <string>
#include <Eigen/Dense>
#include "acquisition.hpp"
#include "errors.hpp"
#include "space.hpp"
#include "surrogate.hpp"

namespace smbopp {

    struct AcqCandidate {
        Point candidate;
        Eigen::VectorXd encoded;
        double score;
    };

    namespace detail {

        inline void check_prediction(const Prediction& prediction, const Eigen::Index n_points) {
            if (prediction.mean.size() != n_points || prediction.std.size() != n_points) {
                throw InvalidPredictionError("surrogate returned " + std::to_string(prediction.mean.size()) +
                    " means and " + std::to_string(prediction.std.size()) + " stds for " +
                    std::to_string(n_points) + " candidates");
            }
            if (!prediction.mean.allFinite()) {
                throw InvalidPredictionError("surrogate returned a non-finite mean");
            }
            if (!prediction.std.allFinite() || (prediction.std.array() < 0.0).any()) {
                throw InvalidPredictionError("surrogate returned a negative or non-finite std");
            }
        }

    };

    // Samples n_points candidates from the space, predicts them in a single
    // batch and returns the one with the lowest acquisition score. Ties go
    // to the candidate drawn first.
    template<typename Surrogate, typename URNG>
    [[nodiscard]] AcqCandidate ProposeNextCandidate(const Surrogate& surrogate,
                                                    const ParameterSpace& space,
                                                    const double y_best,
                                                    const size_t n_points,
                                                    URNG& rng,
                                                    const AcquisitionFunction acq,
                                                    const AcquisitionParameters& params) {
        static_assert(is_surrogate_v<Surrogate>, "Surrogate must provide Fit(X, y) and Predict(X) -> Prediction");

        if (n_points == 0) {
            throw ConfigurationError("n_points must be at least 1");
        }

        std::vector<Point> candidates = space.Sample(n_points, rng);
        const Eigen::MatrixXd X = space.transform(candidates);

        const Prediction prediction = surrogate.Predict(X);
        detail::check_prediction(prediction, X.cols());

        const Eigen::VectorXd scores = AcquisitionScores(acq, prediction.mean, prediction.std, y_best, params);

        Eigen::Index best_idx = 0;
        for (Eigen::Index i = 1; i < scores.size(); ++i) {
            if (scores(i) < scores(best_idx)) {
                best_idx = i;
            }
        }

        return {std::move(candidates[static_cast<size_t>(best_idx)]), X.col(best_idx), scores(best_idx)};
    }

    template<typename Surrogate, typename URNG>
    [[nodiscard]] Point ProposeNext(const Surrogate& surrogate,
                                    const ParameterSpace& space,
                                    const double y_best,
                                    const size_t n_points,
                                    URNG& rng,
                                    const AcquisitionFunction acq,
                                    const AcquisitionParameters& params) {
        return ProposeNextCandidate(surrogate, space, y_best, n_points, rng, acq, params).candidate;
    }

};
#endif // SMBOPP_CANDIDATE_SAMPLER_HPP
