// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_SURROGATE_HPP
#define SMBOPP_SURROGATE_HPP
#pragma once

#include <type_traits>
#include <utility>
#include <Eigen/Dense>

namespace smbopp {

    // Posterior mean and standard deviation, one entry per predicted point.
    struct Prediction {
        Eigen::VectorXd mean;
        Eigen::VectorXd std;
    };

    // A surrogate is any copyable type with
    //
    //   void Fit(const Eigen::MatrixXd& X, const Eigen::VectorXd& y);
    //   Prediction Predict(const Eigen::MatrixXd& X) const;
    //
    // where X holds one encoded point per column. Fit replaces the whole
    // model state. Predict before the first Fit throws NotFittedError and
    // std is never negative.
    template<typename S, typename = void>
    struct is_surrogate : std::false_type {};

    template<typename S>
    struct is_surrogate<S, std::void_t<
        decltype(std::declval<S&>().Fit(std::declval<const Eigen::MatrixXd&>(), std::declval<const Eigen::VectorXd&>())),
        decltype(std::declval<const S&>().Predict(std::declval<const Eigen::MatrixXd&>()))>>
        : std::bool_constant<
            std::is_convertible_v<decltype(std::declval<const S&>().Predict(std::declval<const Eigen::MatrixXd&>())), Prediction>
            && std::is_copy_constructible_v<S>> {};

    template<typename S>
    inline constexpr bool is_surrogate_v = is_surrogate<S>::value;

};
#endif // SMBOPP_SURROGATE_HPP
