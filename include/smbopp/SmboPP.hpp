// Copyright (c) 2026 Jayawardane
// SPDX-License-Identifier: MIT
//
// This file is part of smbopp.
// See the LICENSE file in the project root for full license information.

#ifndef SMBOPP_HPP
#define SMBOPP_HPP
#pragma once

#include "smbopp/detail/errors.hpp"
#include "smbopp/detail/space.hpp"
#include "smbopp/detail/surrogate.hpp"
#include "smbopp/detail/acquisition.hpp"
#include "smbopp/detail/candidate_sampler.hpp"
#include "smbopp/detail/options.hpp"
#include "smbopp/detail/result.hpp"
#include "smbopp/detail/smbo.hpp"
#include "smbopp/detail/gp_surrogate.hpp"

#endif // SMBOPP_HPP
