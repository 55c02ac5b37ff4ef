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

#include <valpool/core/address.hpp>
#include <valpool/core/int.hpp>
#include <valpool/core/result.hpp>
#include <valpool/pool/config.hpp>
#include <valpool/pool/constants.hpp>

#include <cstdint>

VALPOOL_POOL_NAMESPACE_BEGIN

// Fixed at construction of a ValidatorPool
struct PoolConfig
{
    uint256_t min_bond_amount{DEFAULT_MIN_BOND_AMOUNT};
    uint64_t non_penalty_period{DEFAULT_NON_PENALTY_PERIOD};
    uint64_t penalty_period{DEFAULT_PENALTY_PERIOD};
    uint64_t finalization_period{DEFAULT_FINALIZATION_PERIOD};
    Address public_round_address{VALIDATOR_PUBLIC_ROUND_ADDRESS};

    // collaborators
    Address checkpoint_oracle{};
    Address dispute_game{};
    Address reward_vault{};
    uint64_t reward_gas_limit{DEFAULT_REWARD_GAS_LIMIT};

    uint64_t round_duration() const noexcept
    {
        return non_penalty_period + penalty_period;
    }
};

Result<void> validate_config(PoolConfig const &);

VALPOOL_POOL_NAMESPACE_END
