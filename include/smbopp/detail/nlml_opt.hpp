// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_NLML_OPT_HPP
#define SMBOPP_NLML_OPT_HPP
#pragma once

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>
#include <LBFGSpp/LBFGSB.h>
#include <spdlog/spdlog.h>
#include "matern52.hpp"

namespace smbopp::detail {

    // Negative log marginal likelihood of a zero-mean GP with a Matern 5/2
    // kernel, parametrised by {log(sigma), log(l)}.
    class GPObjective {
    public:
        GPObjective(const Eigen::MatrixXd& X_in, const Eigen::VectorXd& y_in, const double jitter_in = 1e-6)
            : X(X_in), y(y_in), jitter(jitter_in) {}

        double operator()(const Eigen::VectorXd& params, Eigen::VectorXd& grad) const {
            const Eigen::Index n = X.cols();

            // Exponentiate to enforce strict positivity
            const double sigma = std::exp(params[0]);
            const double l = std::exp(params[1]);

            const Matern52Kernel kern(sigma * sigma, l * l);

            Eigen::MatrixXd SqDist(n, n);
            Eigen::MatrixXd K = kern.Covariance(X, X, SqDist);
            K.diagonal().array() += jitter;

            const Eigen::LLT<Eigen::MatrixXd> llt(K);
            if (llt.info() != Eigen::Success) {
                // High penalty to push the optimizer away
                grad.setZero(params.size());
                return std::numeric_limits<double>::infinity();
            }

            const Eigen::VectorXd alpha = llt.solve(y);

            double log_det = 0.0;
            for (Eigen::Index i = 0; i < n; ++i) {
                log_det += 2.0 * std::log(llt.matrixL()(i, i));
            }

            const double data_fit = 0.5 * y.dot(alpha);
            const double complexity_penalty = 0.5 * log_det;
            const double constant = 0.5 * static_cast<double>(n) * std::log(6.283185307179586476925286766559); // 0.5*n*log(2*pi)

            const double nlml = data_fit + complexity_penalty + constant;

            // W = alpha * alpha^T - K^{-1}
            const Eigen::MatrixXd K_inv = llt.solve(Eigen::MatrixXd::Identity(n, n));
            const Eigen::MatrixXd W = alpha * alpha.transpose() - K_inv;

            // w.r.t log(sigma)
            grad[0] = static_cast<double>(n) - y.dot(alpha) + jitter * W.trace();

            // w.r.t log(l)
            double grad_l_sum = 0.0;
            for (Eigen::Index i = 0; i < n; ++i) {
                for (Eigen::Index j = 0; j < n; ++j) {
                    grad_l_sum += -0.5 * W(i, j) * kern.LGradientWeight(SqDist(i, j));
                }
            }
            grad[1] = grad_l_sum;

            return nlml;
        }

    private:
        Eigen::MatrixXd X;
        Eigen::VectorXd y;
        double jitter;
    };

    struct KernelSearchBounds {
        // sigma in [exp(-3), exp(2)], l in [0.01, 10]
        Eigen::VectorXd lower = Eigen::Vector2d(-3.0, -4.6);
        Eigen::VectorXd upper = Eigen::Vector2d(2.0, 2.3);
    };

    inline const Eigen::Vector2d& DefaultKernelGuess() {
        // sigma = 1, l = 0.5
        static const Eigen::Vector2d guess{0.0, -0.693};
        return guess;
    }

    [[nodiscard]] inline Matern52Kernel ComputeOptimalKernel(const Eigen::MatrixXd& X, const Eigen::VectorXd& y, const double jitter = 1e-6) {
        LBFGSpp::LBFGSBParam<double> param_opt;
        param_opt.epsilon = 1e-4;
        param_opt.max_iterations = 100;

        LBFGSpp::LBFGSBSolver<double> solver(param_opt);
        GPObjective obj(X, y, jitter);
        const KernelSearchBounds bounds;
        Eigen::VectorXd param = DefaultKernelGuess();

        try {
            double nlml;
            solver.minimize(obj, param, nlml, bounds.lower, bounds.upper);
        }
        catch (const std::exception& e) {
            spdlog::warn("NLML OPT: {}, keeping the default kernel", e.what());
            param = DefaultKernelGuess();
        }

        return {std::exp(2.0 * param[0]), std::exp(2.0 * param[1])};
    }

    [[nodiscard]] inline Matern52Kernel ComputeOptimalKernelMultiStart(const Eigen::MatrixXd& X, const Eigen::VectorXd& y, const double jitter = 1e-6) {
        LBFGSpp::LBFGSBParam<double> param_opt;
        param_opt.epsilon = 1e-4;
        param_opt.max_iterations = 100;

        LBFGSpp::LBFGSBSolver<double> solver(param_opt);
        GPObjective obj(X, y, jitter);
        const KernelSearchBounds bounds;

        // {log_sigma, log_l}
        const std::vector<Eigen::Vector2d> initial_guesses = {
            DefaultKernelGuess(),
            Eigen::Vector2d(-1.0, 0.0),  // low variance, long length scale
            Eigen::Vector2d(1.0, -2.0),  // high variance, short length scale
            Eigen::Vector2d(0.0, 1.0),   // very long length scale
            Eigen::Vector2d(-2.0, -3.0)  // low variance, very short length scale
        };

        double best_nlml = std::numeric_limits<double>::infinity();
        Eigen::VectorXd best_param = DefaultKernelGuess();

        for (const auto& guess : initial_guesses) {
            Eigen::VectorXd current_param = guess;
            try {
                double nlml;
                solver.minimize(obj, current_param, nlml, bounds.lower, bounds.upper);

                if (nlml < best_nlml) {
                    best_nlml = nlml;
                    best_param = current_param;
                }
            } catch (const std::exception& e) {
                spdlog::debug("NLML OPT start ({}, {}) failed: {}", guess[0], guess[1], e.what());
            }
        }

        if (std::isinf(best_nlml)) {
            spdlog::warn("NLML OPT: every start failed, keeping the default kernel");
        }

        return {std::exp(2.0 * best_param[0]), std::exp(2.0 * best_param[1])};
    }

};
#endif // SMBOPP_NLML_OPT_HPP
