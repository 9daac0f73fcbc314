// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_ERRORS_HPP
#define SMBOPP_ERRORS_HPP
#pragma once

#include <stdexcept>
#include <string>

namespace smbopp {

    // Base of every error raised by smbopp. Exceptions thrown by the
    // objective itself are never wrapped.
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& what) : std::runtime_error(what) {}
    };

    // Invalid budget/phase-count relationships, malformed seed sets or
    // malformed dimension declarations. Raised before any evaluation.
    class ConfigurationError : public Error {
    public:
        explicit ConfigurationError(const std::string& what) : Error(what) {}
    };

    // A point that does not belong to the space it is encoded or decoded against.
    class InvalidPointError : public Error {
    public:
        explicit InvalidPointError(const std::string& what) : Error(what) {}
    };

    class NotFittedError : public Error {
    public:
        explicit NotFittedError(const std::string& what) : Error(what) {}
    };

    // The objective returned NaN or +/-Inf.
    class InvalidObjectiveValueError : public Error {
    public:
        explicit InvalidObjectiveValueError(const std::string& what) : Error(what) {}
    };

    // A surrogate broke the prediction contract (negative or non-finite std,
    // non-finite mean, or a batch of the wrong size).
    class InvalidPredictionError : public Error {
    public:
        explicit InvalidPredictionError(const std::string& what) : Error(what) {}
    };

};
#endif // SMBOPP_ERRORS_HPP
