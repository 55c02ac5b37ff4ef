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
#include <valpool/pool/config.hpp>

#include <cstdint>

#include <intx/intx.hpp>

VALPOOL_POOL_NAMESPACE_BEGIN

using namespace intx::literals;

inline constexpr uint256_t ETHER{1000000000000000000_u256};

// emitter of the pool's events
inline constexpr Address VALIDATOR_POOL_CA{0x2000};

inline constexpr uint256_t DEFAULT_MIN_BOND_AMOUNT{ETHER / 5};

// seconds
inline constexpr uint64_t DEFAULT_NON_PENALTY_PERIOD{10 * 60};
inline constexpr uint64_t DEFAULT_PENALTY_PERIOD{20 * 60};
inline constexpr uint64_t DEFAULT_FINALIZATION_PERIOD{7 * 24 * 60 * 60};

inline constexpr uint64_t DEFAULT_REWARD_GAS_LIMIT{100'000};

// Reported by the legacy address form of the rotation when nobody is on turn
inline constexpr Address VALIDATOR_PUBLIC_ROUND_ADDRESS{};

static_assert(
    DEFAULT_FINALIZATION_PERIOD >=
    DEFAULT_NON_PENALTY_PERIOD + DEFAULT_PENALTY_PERIOD);

VALPOOL_POOL_NAMESPACE_END
