// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_GP_SURROGATE_HPP
#define SMBOPP_GP_SURROGATE_HPP
#pragma once

#include <cmath>
#include <string>
#include <Eigen/Dense>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "matern52.hpp"
#include "nlml_opt.hpp"
#include "surrogate.hpp"

namespace smbopp {

    struct GaussianProcessParameters {
        double jitter = 1e-6;
        bool enable_kernel_multistart = false;
    };

    // Zero-mean GP on standardised targets with a Matern 5/2 kernel whose
    // hyperparameters maximise the marginal likelihood. Works best on a
    // space with Encoding::Normalize.
    class GaussianProcessSurrogate {
    public:
        GaussianProcessSurrogate() = default;

        explicit GaussianProcessSurrogate(const GaussianProcessParameters& params) : params_(params) {}

        void Fit(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) {
            if (X.cols() == 0) {
                throw InvalidPointError("GaussianProcessSurrogate::Fit needs at least one observation");
            }
            if (X.cols() != y.size()) {
                throw InvalidPointError("GaussianProcessSurrogate::Fit got " + std::to_string(X.cols()) +
                    " points and " + std::to_string(y.size()) + " targets");
            }

            y_mean_ = y.mean();
            y_scale_ = std::sqrt((y.array() - y_mean_).square().mean());
            if (!(y_scale_ > 1e-12)) {
                y_scale_ = 1.0;
            }
            const Eigen::VectorXd Y_std = (y.array() - y_mean_) / y_scale_;

            kernel_ = params_.enable_kernel_multistart
                ? detail::ComputeOptimalKernelMultiStart(X, Y_std, params_.jitter)
                : detail::ComputeOptimalKernel(X, Y_std, params_.jitter);

            Eigen::MatrixXd K = kernel_.Covariance(X, X);
            double jitter = params_.jitter;
            K.diagonal().array() += jitter;
            llt_.compute(K);

            // Duplicate observations make K singular, grow the nugget until it factorises
            for (int attempt = 0; llt_.info() != Eigen::Success; ++attempt) {
                if (attempt == 6) {
                    throw Error("GaussianProcessSurrogate: covariance matrix is not positive definite");
                }
                K.diagonal().array() += 9.0 * jitter;
                jitter *= 10.0;
                spdlog::warn("GP fit: Cholesky failed, retrying with jitter {}", jitter);
                llt_.compute(K);
            }

            alpha_ = llt_.solve(Y_std);
            X_ = X;
            fitted_ = true;
        }

        [[nodiscard]] Prediction Predict(const Eigen::MatrixXd& X) const {
            if (!fitted_) {
                throw NotFittedError("GaussianProcessSurrogate::Predict called before Fit");
            }
            if (X.rows() != X_.rows()) {
                throw InvalidPointError("GaussianProcessSurrogate::Predict got points with " +
                    std::to_string(X.rows()) + " coordinates, model was fitted on " + std::to_string(X_.rows()));
            }

            // n_train x n_candidates
            const Eigen::MatrixXd k_star = kernel_.Covariance(X_, X);
            const Eigen::MatrixXd v = llt_.matrixL().solve(k_star);

            Prediction prediction;
            prediction.mean = (k_star.transpose() * alpha_).array() * y_scale_ + y_mean_;

            const Eigen::ArrayXd variance =
                (kernel_.get_variance() - v.colwise().squaredNorm().transpose().array()).max(0.0);
            prediction.std = variance.sqrt() * y_scale_;

            return prediction;
        }

        [[nodiscard]] bool is_fitted() const { return fitted_; }

        [[nodiscard]] Eigen::Index num_observations() const { return X_.cols(); }

        [[nodiscard]] const detail::Matern52Kernel& kernel() const { return kernel_; }

    private:
        GaussianProcessParameters params_;
        detail::Matern52Kernel kernel_{1.0, 0.25};
        Eigen::LLT<Eigen::MatrixXd> llt_;
        Eigen::MatrixXd X_;
        Eigen::VectorXd alpha_;
        double y_mean_ = 0.0;
        double y_scale_ = 1.0;
        bool fitted_ = false;
    };

    static_assert(is_surrogate_v<GaussianProcessSurrogate>);

};
#endif // SMBOPP_GP_SURROGATE_HPP
