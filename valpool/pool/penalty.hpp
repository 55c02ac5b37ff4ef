// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.


#pragma once

#include <valpool/pool/config.hpp>

#include <cstdint>

VALPOOL_POOL_NAMESPACE_BEGIN

struct PenaltyPeriods
{
    uint64_t non_penalty_period;
    uint64_t penalty_period;

    constexpr uint64_t round_duration() const noexcept
    {
        return non_penalty_period + penalty_period;
    }
};

// Seconds of penalized delay for a checkpoint accepted at `actual` whose
// expected deadline was `deadline`. Always within [0, penalty_period].
constexpr uint64_t compute_penalty(
    PenaltyPeriods const &periods, uint64_t const deadline,
    uint64_t const actual) noexcept
{
    uint64_t const round = periods.round_duration();

    uint64_t elapsed = actual > deadline ? actual - deadline : 0;
    // a submission after the public round opened is measured from its start
    if (elapsed > round) {
        elapsed -= round;
    }
    if (elapsed > round) {
        elapsed = round;
    }

    return elapsed > periods.non_penalty_period
               ? elapsed - periods.non_penalty_period
               : 0;
}

static_assert(compute_penalty({10, 20}, 100, 90) == 0);
static_assert(compute_penalty({10, 20}, 100, 110) == 0);
static_assert(compute_penalty({10, 20}, 100, 115) == 5);
static_assert(compute_penalty({10, 20}, 100, 130) == 20);
static_assert(compute_penalty({10, 20}, 100, 145) == 5);
static_assert(compute_penalty({10, 20}, 100, 1000) == 20);

VALPOOL_POOL_NAMESPACE_END
