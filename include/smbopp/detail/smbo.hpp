// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_SMBO_HPP
#define SMBOPP_SMBO_HPP
#pragma once

#include <chrono>
#include <cmath>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include <Eigen/Dense>
#include <spdlog/spdlog.h>
#include "candidate_sampler.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "result.hpp"
#include "space.hpp"
#include "surrogate.hpp"

namespace smbopp {

    // Sequential model-based minimisation: seed points, then random
    // warm-up, then surrogate-guided proposals, one objective call at a time.
    template<typename Surrogate>
    class SmboOptimizer {
        static_assert(is_surrogate_v<Surrogate>, "Surrogate must provide Fit(X, y) and Predict(X) -> Prediction");

    public:
        SmboOptimizer(const ParameterSpace& space, const Surrogate& surrogate, const Options<Surrogate>& options)
        : space_(space),
            surrogate_(surrogate),
            opt_params_(options)
        {
            ValidateOptions(opt_params_, space_);
        }

        template <typename Foo>
        OptimizeResult<Surrogate> Minimize(Foo& func) {
            std::mt19937 generator(opt_params_.random_state ? *opt_params_.random_state : std::random_device{}());
            return Minimize(func, generator);
        }

        // The generator is advanced in place and its final state is also
        // recorded in the result.
        template <typename Foo>
        OptimizeResult<Surrogate> Minimize(Foo& func, std::mt19937& generator) {
            const bool pre_evaluated = opt_params_.has_initial_values();
            const std::vector<double> y0 = opt_params_.initial_values();
            const size_t n_seeds = opt_params_.x0.size();
            const auto n_random = static_cast<size_t>(opt_params_.n_random_starts);
            const size_t n_calls = static_cast<size_t>(opt_params_.n_calls);
            const size_t n_guided = n_calls - n_random - (pre_evaluated ? 0 : n_seeds);
            const size_t trace_size = n_calls + (pre_evaluated ? n_seeds : 0);

            OptimizeResult<Surrogate> result;
            result.space = space_;
            result.specs = opt_params_;
            result.x_iters.reserve(trace_size);
            result.func_vals.reserve(trace_size);
            result.phases.reserve(trace_size);
            result.models.reserve(n_guided);

            Xs_.resize(static_cast<Eigen::Index>(space_.num_encoded_params()), static_cast<Eigen::Index>(trace_size));
            Ys_.resize(static_cast<Eigen::Index>(trace_size));
            eval_points_ = 0;
            iteration_ = 0;

            phase_ = Phase::Seeding;
            if (pre_evaluated) {
                for (size_t i = 0; i < n_seeds; ++i) {
                    record(result, opt_params_.x0[i], y0[i]);
                }
                result.info.n_pre_evaluated = n_seeds;
            }
            else {
                for (const Point& x : opt_params_.x0) {
                    evaluate(func, result, x);
                }
                result.info.n_seeded = n_seeds;
            }

            phase_ = Phase::RandomWarmup;
            result.info.random_start_index = result.size();
            for (size_t i = 0; i < n_random; ++i) {
                Point x = std::move(space_.Sample(1, generator).front());
                evaluate(func, result, x);
            }
            result.info.n_random = n_random;

            phase_ = Phase::Guided;
            result.info.guided_start_index = result.size();
            Surrogate model = surrogate_;
            for (size_t i = 0; i < n_guided; ++i) {
                // Refit on the whole trace so far
                model.Fit(Xs_.leftCols(eval_points_), Ys_.head(eval_points_));
                result.info.n_fits++;
                result.models.push_back(model);

                if (opt_params_.verbose) {
                    spdlog::info("Iteration No: {} started. Searching for the next optimal point.", iteration_ + 1);
                }
                const Point x = ProposeNext(model, space_, result.fun, static_cast<size_t>(opt_params_.n_points),
                                            generator, opt_params_.acq_func, opt_params_.acquisition_parameters());
                evaluate(func, result, x);
                result.info.n_guided++;
            }

            phase_ = Phase::Done;
            result.info.random_state = generator;
            return result;
        }

        [[nodiscard]] Phase phase() const { return phase_; }

        [[nodiscard]] const ParameterSpace& space() const { return space_; }

        [[nodiscard]] const Options<Surrogate>& options() const { return opt_params_; }

    private:

        template <typename Foo>
        void evaluate(Foo& func, OptimizeResult<Surrogate>& result, const Point& x) {
            ++iteration_;
            if (opt_params_.verbose && phase_ != Phase::Guided) {
                spdlog::info("Iteration No: {} started. Evaluating function at {} point.", iteration_,
                             phase_ == Phase::Seeding ? "provided" : "random");
            }

            const auto t_start = std::chrono::steady_clock::now();
            const double y = func(x);
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t_start;

            if (!std::isfinite(y)) {
                throw InvalidObjectiveValueError("objective returned a non-finite value at iteration " +
                    std::to_string(iteration_));
            }

            record(result, x, y);

            if (opt_params_.verbose) {
                spdlog::info("Iteration No: {} ended. Time taken: {:.4f}s, function value obtained: {:.4f}, current minimum: {:.4f}",
                             iteration_, elapsed.count(), y, result.fun);
            }

            if (opt_params_.callback) {
                opt_params_.callback(result);
            }
        }

        // Appends one observation and keeps the incumbent; ties keep the earliest.
        void record(OptimizeResult<Surrogate>& result, const Point& x, const double y) {
            Xs_.col(eval_points_) = space_.transform(x);
            Ys_(eval_points_) = y;
            eval_points_++;

            result.x_iters.push_back(x);
            result.func_vals.push_back(y);
            result.phases.push_back(phase_);

            if (y < result.fun) {
                result.fun = y;
                result.x = x;
                result.best_index = result.size() - 1;
            }
        }

        const ParameterSpace space_;
        const Surrogate surrogate_;
        Options<Surrogate> opt_params_;
        Eigen::MatrixXd Xs_;
        Eigen::VectorXd Ys_;
        Eigen::Index eval_points_ = 0;
        size_t iteration_ = 0;
        Phase phase_ = Phase::Seeding;
    };

    template <typename Surrogate, typename Foo>
    OptimizeResult<Surrogate> Minimize(Foo& func,
                                       const ParameterSpace& space,
                                       const Surrogate& surrogate,
                                       const Options<Surrogate>& options) {
        SmboOptimizer<Surrogate> optimizer(space, surrogate, options);
        return optimizer.Minimize(func);
    }

    template <typename Surrogate, typename Foo>
    OptimizeResult<Surrogate> Minimize(Foo& func,
                                       const ParameterSpace& space,
                                       const Surrogate& surrogate,
                                       const Options<Surrogate>& options,
                                       std::mt19937& generator) {
        SmboOptimizer<Surrogate> optimizer(space, surrogate, options);
        return optimizer.Minimize(func, generator);
    }

};
#endif // SMBOPP_SMBO_HPP
