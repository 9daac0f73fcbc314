// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_ACQUISITION_HPP
#define SMBOPP_ACQUISITION_HPP
#pragma once

#include <cmath>
#include <string>
#include <Eigen/Dense>
#include "errors.hpp"

namespace smbopp {

    // Every variant is minimised: lower score = more promising candidate.
    enum class AcquisitionFunction {
        LCB, // mean - kappa * std
        EI,  // negative expected improvement
        PI   // negative probability of improvement
    };

    struct AcquisitionParameters {
        double xi = 0.01;
        double kappa = 1.96;
    };

    [[nodiscard]] inline std::string to_string(const AcquisitionFunction acq) {
        switch (acq) {
            case AcquisitionFunction::LCB: return "LCB";
            case AcquisitionFunction::EI: return "EI";
            case AcquisitionFunction::PI: return "PI";
        }
        return "unknown";
    }

    [[nodiscard]] inline AcquisitionFunction ParseAcquisitionFunction(const std::string& name) {
        if (name == "LCB") return AcquisitionFunction::LCB;
        if (name == "EI") return AcquisitionFunction::EI;
        if (name == "PI") return AcquisitionFunction::PI;
        throw ConfigurationError("unknown acquisition function '" + name + "', expected LCB, EI or PI");
    }

    namespace detail {

        inline double norm_pdf(const double x) {
            static constexpr double oneOvSqrt2pi = 0.39894228040143267794;
            return oneOvSqrt2pi * std::exp(-0.5 * x * x);
        }

        inline double norm_cdf(const double x) {
            static constexpr double oneOvSqrt2 = 0.70710678118654752440;
            return 0.5 * std::erfc(-x * oneOvSqrt2);
        }

    };

    // Score of a single candidate. A sigma of zero carries no exploration
    // signal: EI and PI are then zero rather than 0/0.
    [[nodiscard]] inline double AcquisitionScore(const AcquisitionFunction acq,
                                                 const double mean,
                                                 const double sigma,
                                                 const double y_best,
                                                 const AcquisitionParameters& params) {
        switch (acq) {
            case AcquisitionFunction::LCB:
                return mean - params.kappa * sigma;

            case AcquisitionFunction::EI: {
                if (!(sigma > 0.0)) {
                    return 0.0;
                }
                const double improvement = y_best - params.xi - mean;
                const double Z = improvement / sigma;
                return -(improvement * detail::norm_cdf(Z) + sigma * detail::norm_pdf(Z));
            }

            case AcquisitionFunction::PI: {
                if (!(sigma > 0.0)) {
                    return 0.0;
                }
                const double Z = (y_best - params.xi - mean) / sigma;
                return -detail::norm_cdf(Z);
            }
        }
        return 0.0;
    }

    [[nodiscard]] inline Eigen::VectorXd AcquisitionScores(const AcquisitionFunction acq,
                                                           const Eigen::VectorXd& mean,
                                                           const Eigen::VectorXd& sigma,
                                                           const double y_best,
                                                           const AcquisitionParameters& params) {
        Eigen::VectorXd scores(mean.size());
        for (Eigen::Index i = 0; i < mean.size(); ++i) {
            scores(i) = AcquisitionScore(acq, mean(i), sigma(i), y_best, params);
        }
        return scores;
    }

};
#endif // SMBOPP_ACQUISITION_HPP
