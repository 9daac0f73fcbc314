// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_OPTIONS_HPP
#define SMBOPP_OPTIONS_HPP
#pragma once

#include <cmath>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "acquisition.hpp"
#include "errors.hpp"
#include "space.hpp"

namespace smbopp {

    template<typename Surrogate>
    struct OptimizeResult;

    // Only candidate sampling is supported, Auto resolves to it.
    enum class AcquisitionOptimizer {
        Auto,
        Sampling
    };

    [[nodiscard]] inline AcquisitionOptimizer ParseAcquisitionOptimizer(const std::string& name) {
        if (name == "auto") return AcquisitionOptimizer::Auto;
        if (name == "sampling") return AcquisitionOptimizer::Sampling;
        throw ConfigurationError("unsupported acquisition optimizer '" + name + "', expected auto or sampling");
    }

    [[nodiscard]] inline AcquisitionOptimizer Resolve(const AcquisitionOptimizer optimizer) {
        return optimizer == AcquisitionOptimizer::Auto ? AcquisitionOptimizer::Sampling : optimizer;
    }

    // Objective values of x0: absent (evaluate x0), one value for a single
    // seed point, or one value per seed point.
    using InitialValues = std::variant<std::monostate, double, std::vector<double>>;

    template<typename Surrogate>
    struct Options {
        int n_calls = 100;
        int n_random_starts = 10;
        AcquisitionFunction acq_func = AcquisitionFunction::EI;
        AcquisitionOptimizer acq_optimizer = AcquisitionOptimizer::Auto;
        int n_points = 10000;
        double xi = 0.01;
        double kappa = 1.96;
        // Seed of the generator when none is handed to Minimize, drawn from
        // std::random_device when empty.
        std::optional<std::uint32_t> random_state;
        bool verbose = false;
        std::function<void(const OptimizeResult<Surrogate>&)> callback;
        std::vector<Point> x0;
        InitialValues y0;

        [[nodiscard]] AcquisitionParameters acquisition_parameters() const { return {xi, kappa}; }

        [[nodiscard]] bool has_initial_values() const { return !std::holds_alternative<std::monostate>(y0); }

        // y0 as one value per x0 point, empty when absent
        [[nodiscard]] std::vector<double> initial_values() const {
            if (const double* scalar = std::get_if<double>(&y0)) {
                return {*scalar};
            }
            if (const auto* values = std::get_if<std::vector<double>>(&y0)) {
                return *values;
            }
            return {};
        }
    };

    // Throws ConfigurationError (or InvalidPointError for seed points outside
    // the space) without evaluating anything.
    template<typename Surrogate>
    void ValidateOptions(const Options<Surrogate>& options, const ParameterSpace& space) {
        if (space.num_parameters() == 0) {
            throw ConfigurationError("the search space has no dimensions");
        }
        if (options.n_calls < 1) {
            throw ConfigurationError("n_calls must be at least 1, got " + std::to_string(options.n_calls));
        }
        if (options.n_random_starts < 0) {
            throw ConfigurationError("n_random_starts must be non-negative, got " + std::to_string(options.n_random_starts));
        }
        if (options.n_points < 1) {
            throw ConfigurationError("n_points must be at least 1, got " + std::to_string(options.n_points));
        }
        if (!std::isfinite(options.xi) || !std::isfinite(options.kappa)) {
            throw ConfigurationError("xi and kappa must be finite");
        }
        if (Resolve(options.acq_optimizer) != AcquisitionOptimizer::Sampling) {
            throw ConfigurationError("only the sampling acquisition optimizer is supported");
        }

        const auto n_seeds = static_cast<int>(options.x0.size());

        if (options.has_initial_values()) {
            if (options.x0.empty()) {
                throw ConfigurationError("y0 given without x0");
            }
            if (std::holds_alternative<double>(options.y0) && n_seeds != 1) {
                throw ConfigurationError("a scalar y0 needs exactly one x0 point, got " + std::to_string(n_seeds));
            }
            const std::vector<double> y0 = options.initial_values();
            if (static_cast<int>(y0.size()) != n_seeds) {
                throw ConfigurationError("x0 has " + std::to_string(n_seeds) + " points but y0 has " +
                    std::to_string(y0.size()) + " values");
            }
            for (const double y : y0) {
                if (!std::isfinite(y)) {
                    throw ConfigurationError("y0 contains a non-finite value");
                }
            }
            if (options.n_calls < options.n_random_starts) {
                throw ConfigurationError("expected n_calls >= n_random_starts, got " +
                    std::to_string(options.n_calls) + " < " + std::to_string(options.n_random_starts));
            }
        }
        else if (options.n_calls < n_seeds + options.n_random_starts) {
            throw ConfigurationError("expected n_calls >= len(x0) + n_random_starts, got " +
                std::to_string(options.n_calls) + " < " + std::to_string(n_seeds + options.n_random_starts));
        }

        if (n_seeds == 0 && options.n_random_starts == 0) {
            throw ConfigurationError("the surrogate needs at least one observation, give x0 or n_random_starts > 0");
        }

        for (size_t i = 0; i < options.x0.size(); ++i) {
            if (!space.contains(options.x0[i])) {
                throw InvalidPointError("x0[" + std::to_string(i) + "] is not a point of the search space");
            }
        }
    }

};
#endif // SMBOPP_OPTIONS_HPP
