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


#include <valpool/core/likely.h>
#include <valpool/pool/pool_config.hpp>
#include <valpool/pool/pool_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <limits>

VALPOOL_POOL_NAMESPACE_BEGIN

Result<void> validate_config(PoolConfig const &config)
{
    if (VALPOOL_UNLIKELY(config.min_bond_amount == 0)) {
        LOG_ERROR("ValidatorPool: minimum bond amount must be non-zero");
        return PoolError::InvalidConfig;
    }
    if (VALPOOL_UNLIKELY(
            config.non_penalty_period == 0 || config.penalty_period == 0)) {
        LOG_ERROR(
            "ValidatorPool: non-penalty period {} and penalty period {} must "
            "be non-zero",
            config.non_penalty_period,
            config.penalty_period);
        return PoolError::InvalidConfig;
    }
    if (VALPOOL_UNLIKELY(
            config.penalty_period > std::numeric_limits<uint64_t>::max() -
                                        config.non_penalty_period)) {
        LOG_ERROR("ValidatorPool: round duration overflows");
        return PoolError::InvalidConfig;
    }
    if (VALPOOL_UNLIKELY(
            config.finalization_period < config.round_duration())) {
        LOG_ERROR(
            "ValidatorPool: finalization period {} is shorter than one "
            "round {}",
            config.finalization_period,
            config.round_duration());
        return PoolError::InvalidConfig;
    }
    return outcome::success();
}

VALPOOL_POOL_NAMESPACE_END
