// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_SPACE_HPP
#define SMBOPP_SPACE_HPP
#pragma once

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <Eigen/Dense>
#include "errors.hpp"

namespace smbopp {

    // A native value: double for Real dimensions, long long for Integer
    // dimensions and the label for Categorical dimensions.
    using Value = std::variant<double, long long, std::string>;
    using Point = std::vector<Value>;

    // Identity is a bijection on valid points. Normalize rescales numeric
    // dimensions, so a Real value may come back one rounding step away.
    enum class Encoding {
        Identity,  // numeric dimensions keep their native value
        Normalize  // numeric dimensions mapped to [0, 1], log-prior ones through log space
    };

    class ParameterSpace {
    public:

        enum class Type {
            Real,
            RealLog,
            Integer,
            Categorical
        };

        struct Parameter {
            Type type;
            double min;
            double max;
            // Exact bounds of an Integer dimension, min/max hold their nearest doubles
            long long int_min;
            long long int_max;
            std::vector<std::string> categories;

            static Parameter MakeReal(const double min, const double max) { return {Type::Real, min, max, 0, 0, {}}; }
            static Parameter MakeRealLog(const double min, const double max) { return {Type::RealLog, min, max, 0, 0, {}}; }
            static Parameter MakeInt(const long long min, const long long max) {
                return {Type::Integer, static_cast<double>(min), static_cast<double>(max), min, max, {}};
            }
            static Parameter MakeCategorical(std::vector<std::string> categories) {
                return {Type::Categorical, 0.0, 0.0, 0, 0, std::move(categories)};
            }

            [[nodiscard]] size_t encoded_size() const {
                return type == Type::Categorical ? categories.size() : 1;
            }
        };

        ParameterSpace() = default;

        explicit ParameterSpace(const Encoding encoding) : encoding_(encoding) {}

        void AddRealParameter(const double min, const double max) { add_parameter(Parameter::MakeReal(min, max)); }
        void AddLogRealParameter(const double min, const double max) { add_parameter(Parameter::MakeRealLog(min, max)); }
        void AddIntegerParameter(const long long min, const long long max) { add_parameter(Parameter::MakeInt(min, max)); }
        void AddCategoricalParameter(std::vector<std::string> categories) {
            add_parameter(Parameter::MakeCategorical(std::move(categories)));
        }

        [[nodiscard]] size_t num_parameters() const { return parameters_.size(); }

        [[nodiscard]] size_t num_encoded_params() const { return encoded_params_; }

        [[nodiscard]] const std::vector<Parameter>& parameters() const { return parameters_; }

        [[nodiscard]] Encoding encoding() const { return encoding_; }

        [[nodiscard]] bool contains(const Point& point) const {
            if (point.size() != parameters_.size()) {
                return false;
            }
            for (size_t i = 0; i < parameters_.size(); ++i) {
                if (!value_in_domain(parameters_[i], point[i])) {
                    return false;
                }
            }
            return true;
        }

        // Native point -> encoded point
        [[nodiscard]] Eigen::VectorXd transform(const Point& point) const {
            if (point.size() != parameters_.size()) {
                throw InvalidPointError("point has " + std::to_string(point.size()) +
                    " values but the space has " + std::to_string(parameters_.size()) + " dimensions");
            }

            Eigen::VectorXd encoded(encoded_params_);
            Eigen::Index enc_idx = 0;

            for (size_t i = 0; i < parameters_.size(); ++i) {
                const Parameter& p = parameters_[i];
                if (!value_in_domain(p, point[i])) {
                    throw InvalidPointError("value of dimension " + std::to_string(i) + " is outside its domain");
                }

                switch (p.type) {
                    case Type::Real:
                    case Type::RealLog:
                        encoded(enc_idx++) = encode_numeric(p, std::get<double>(point[i]));
                        break;

                    case Type::Integer:
                        encoded(enc_idx++) = encode_numeric(p, static_cast<double>(std::get<long long>(point[i])));
                        break;

                    case Type::Categorical: {
                        const auto& label = std::get<std::string>(point[i]);
                        const auto it = std::find(p.categories.begin(), p.categories.end(), label);
                        const auto k = static_cast<Eigen::Index>(p.categories.size());
                        encoded.segment(enc_idx, k).setZero();
                        encoded(enc_idx + (it - p.categories.begin())) = 1.0;
                        enc_idx += k;
                        break;
                    }
                }
            }

            return encoded;
        }

        // One column per point
        [[nodiscard]] Eigen::MatrixXd transform(const std::vector<Point>& points) const {
            Eigen::MatrixXd encoded(encoded_params_, static_cast<Eigen::Index>(points.size()));
            for (size_t c = 0; c < points.size(); ++c) {
                encoded.col(static_cast<Eigen::Index>(c)) = transform(points[c]);
            }
            return encoded;
        }

        // Encoded point -> native point. Numeric coordinates are clipped to
        // their bounds, integers rounded and categoricals decoded by argmax.
        template<typename Derived>
        [[nodiscard]] Point inverse_transform(const Eigen::MatrixBase<Derived>& encoded) const {
            EIGEN_STATIC_ASSERT_VECTOR_ONLY(Derived);

            if (static_cast<size_t>(encoded.size()) != encoded_params_) {
                throw InvalidPointError("encoded point has " + std::to_string(encoded.size()) +
                    " coordinates but the space encodes to " + std::to_string(encoded_params_));
            }
            if (!encoded.allFinite()) {
                throw InvalidPointError("encoded point has non-finite coordinates");
            }

            Point result;
            result.reserve(parameters_.size());

            Eigen::Index enc_idx = 0;

            for (const auto& p : parameters_) {
                switch (p.type) {
                    case Type::Real:
                    case Type::RealLog:
                        result.emplace_back(decode_numeric(p, encoded(enc_idx)));
                        enc_idx++;
                        break;

                    case Type::Integer:
                        result.emplace_back(decode_integer(p, encoded(enc_idx)));
                        enc_idx++;
                        break;


                    case Type::Categorical: {
                        const auto k = static_cast<Eigen::Index>(p.categories.size());
                        Eigen::Index best_idx = 0;
                        for (Eigen::Index j = 1; j < k; ++j) {
                            if (encoded(enc_idx + j) > encoded(enc_idx + best_idx)) {
                                best_idx = j;
                            }
                        }
                        result.emplace_back(p.categories[static_cast<size_t>(best_idx)]);
                        enc_idx += k;
                        break;
                    }
                }
            }

            return result;
        }

        // Draws n points independently per dimension: uniform for Real and
        // Integer, uniform in log space for RealLog, uniform over the labels
        // for Categorical.
        template<typename URNG>
        [[nodiscard]] std::vector<Point> Sample(const size_t n, URNG& rng) const {
            std::vector<Point> points;
            points.reserve(n);

            for (size_t s = 0; s < n; ++s) {
                Point point;
                point.reserve(parameters_.size());

                for (const auto& p : parameters_) {
                    switch (p.type) {
                        case Type::Real: {
                            std::uniform_real_distribution<double> dist(p.min, p.max);
                            point.emplace_back(dist(rng));
                            break;
                        }

                        case Type::RealLog: {
                            std::uniform_real_distribution<double> dist(std::log(p.min), std::log(p.max));
                            point.emplace_back(std::clamp(std::exp(dist(rng)), p.min, p.max));
                            break;
                        }

                        case Type::Integer: {
                            std::uniform_int_distribution<long long> dist(p.int_min, p.int_max);
                            point.emplace_back(dist(rng));
                            break;
                        }

                        case Type::Categorical: {
                            std::uniform_int_distribution<size_t> dist(0, p.categories.size() - 1);
                            point.emplace_back(p.categories[dist(rng)]);
                            break;
                        }
                    }
                }

                points.push_back(std::move(point));
            }

            return points;
        }

        // Lower and upper bound of every encoded coordinate
        [[nodiscard]] std::pair<Eigen::VectorXd, Eigen::VectorXd> bounds() const {
            Eigen::VectorXd lower(encoded_params_);
            Eigen::VectorXd upper(encoded_params_);
            Eigen::Index enc_idx = 0;

            for (const auto& p : parameters_) {
                if (p.type == Type::Categorical) {
                    const auto k = static_cast<Eigen::Index>(p.categories.size());
                    lower.segment(enc_idx, k).setZero();
                    upper.segment(enc_idx, k).setOnes();
                    enc_idx += k;
                }
                else {
                    lower(enc_idx) = encode_numeric(p, p.min);
                    upper(enc_idx) = encode_numeric(p, p.max);
                    enc_idx++;
                }
            }

            return {lower, upper};
        }

    private:
        void add_parameter(Parameter p) {
            const std::string idx = std::to_string(parameters_.size());

            if (p.type == Type::Categorical) {
                if (p.categories.empty()) {
                    throw ConfigurationError("categorical dimension " + idx + " has no categories");
                }
                std::vector<std::string> sorted = p.categories;
                std::sort(sorted.begin(), sorted.end());
                if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
                    throw ConfigurationError("categorical dimension " + idx + " has duplicate categories");
                }
            }
            else if (p.type == Type::Integer) {
                if (!(p.int_min < p.int_max)) {
                    throw ConfigurationError("dimension " + idx + " needs low < high");
                }
            }
            else {
                if (!std::isfinite(p.min) || !std::isfinite(p.max) || !(p.min < p.max)) {
                    throw ConfigurationError("dimension " + idx + " needs finite bounds with low < high");
                }
                if (p.type == Type::RealLog && p.min <= 0.0) {
                    throw ConfigurationError("log-uniform dimension " + idx + " needs a positive lower bound");
                }
            }

            encoded_params_ += p.encoded_size();
            parameters_.push_back(std::move(p));
        }

        static bool value_in_domain(const Parameter& p, const Value& v) {
            switch (p.type) {
                case Type::Real:
                case Type::RealLog: {
                    const double* x = std::get_if<double>(&v);
                    return x != nullptr && std::isfinite(*x) && *x >= p.min && *x <= p.max;
                }

                case Type::Integer: {
                    const long long* x = std::get_if<long long>(&v);
                    return x != nullptr && *x >= p.int_min && *x <= p.int_max;
                }

                case Type::Categorical: {
                    const std::string* x = std::get_if<std::string>(&v);
                    return x != nullptr && std::find(p.categories.begin(), p.categories.end(), *x) != p.categories.end();
                }
            }
            return false;
        }

        [[nodiscard]] double encode_numeric(const Parameter& p, const double x) const {
            if (encoding_ == Encoding::Identity) {
                return x;
            }
            if (p.type == Type::RealLog) {
                return (std::log(x) - std::log(p.min)) / (std::log(p.max) - std::log(p.min));
            }
            return (x - p.min) / (p.max - p.min);
        }

        [[nodiscard]] double decode_numeric(const Parameter& p, const double e) const {
            double x;
            if (encoding_ == Encoding::Identity) {
                x = e;
            }
            else if (p.type == Type::RealLog) {
                x = std::exp(std::log(p.min) + e * (std::log(p.max) - std::log(p.min)));
            }
            else {
                x = p.min + e * (p.max - p.min);
            }
            return std::clamp(x, p.min, p.max);
        }

        // Rounds in double, clamps against the exact long long bounds
        [[nodiscard]] long long decode_integer(const Parameter& p, const double e) const {
            const double x = std::round(encoding_ == Encoding::Identity ? e : p.min + e * (p.max - p.min));
            if (!(x > static_cast<double>(p.int_min))) {
                return p.int_min;
            }
            if (!(x < static_cast<double>(p.int_max))) {
                return p.int_max;
            }
            return static_cast<long long>(x);
        }

        std::vector<Parameter> parameters_;
        size_t encoded_params_ = 0;
        Encoding encoding_ = Encoding::Identity;
    };

};
#endif // SMBOPP_SPACE_HPP
