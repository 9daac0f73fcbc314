// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_RESULT_HPP
#define SMBOPP_RESULT_HPP
#pragma once

#include <limits>
#include <random>
#include <string>
#include <vector>
#include "options.hpp"
#include "space.hpp"

namespace smbopp {

    enum class Phase {
        Seeding,
        RandomWarmup,
        Guided,
        Done
    };

    [[nodiscard]] inline std::string to_string(const Phase phase) {
        switch (phase) {
            case Phase::Seeding: return "seeding";
            case Phase::RandomWarmup: return "random warm-up";
            case Phase::Guided: return "guided";
            case Phase::Done: return "done";
        }
        return "unknown";
    }

    struct RunInfo {
        size_t n_pre_evaluated = 0; // x0 recorded with their y0, no objective call
        size_t n_seeded = 0;        // x0 evaluated by the objective
        size_t n_random = 0;
        size_t n_guided = 0;
        size_t n_fits = 0;

        // Trace index of the first random and first guided entry
        size_t random_start_index = 0;
        size_t guided_start_index = 0;

        // Generator state after the last proposal, hand it back to Minimize
        // to continue the same random stream.
        std::mt19937 random_state;

        [[nodiscard]] size_t n_evaluations() const { return n_seeded + n_random + n_guided; }
    };

    template<typename Surrogate>
    struct OptimizeResult {
        Point x;
        double fun = std::numeric_limits<double>::infinity();
        size_t best_index = 0;

        // The trace, in evaluation order
        std::vector<Point> x_iters;
        std::vector<double> func_vals;
        std::vector<Phase> phases;

        // Surrogate fitted before each guided evaluation
        std::vector<Surrogate> models;

        ParameterSpace space;
        Options<Surrogate> specs;
        RunInfo info;

        [[nodiscard]] size_t size() const { return func_vals.size(); }

        [[nodiscard]] bool empty() const { return func_vals.empty(); }
    };

    // Options that continue a finished run: the recorded trace becomes a
    // pre-evaluated seed set and n_calls more evaluations are guided.
    template<typename Surrogate>
    [[nodiscard]] Options<Surrogate> MakeResumeOptions(const Options<Surrogate>& options,
                                                       const OptimizeResult<Surrogate>& result,
                                                       const int n_calls) {
        Options<Surrogate> resumed = options;
        resumed.x0 = result.x_iters;
        resumed.y0 = result.func_vals;
        resumed.n_random_starts = 0;
        resumed.n_calls = n_calls;
        return resumed;
    }

};
#endif // SMBOPP_RESULT_HPP
