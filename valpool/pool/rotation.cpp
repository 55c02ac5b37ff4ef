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


#include <valpool/pool/rotation.hpp>

#include <cstdint>
#include <limits>
#include <span>
#include <variant>

VALPOOL_POOL_NAMESPACE_BEGIN

Turn select_validator(
    std::span<Address const> const validators, uint64_t const cursor,
    uint64_t const deadline, uint64_t const round_duration,
    uint64_t const now)
{
    if (validators.empty()) {
        return PublicRound{};
    }

    // saturate, a deadline this far out is never missed
    uint64_t const window_end =
        deadline > std::numeric_limits<uint64_t>::max() - round_duration
            ? std::numeric_limits<uint64_t>::max()
            : deadline + round_duration;
    if (now > window_end) {
        return PublicRound{};
    }

    return AssignedValidator{validators[cursor % validators.size()]};
}

uint64_t
advance_cursor(uint64_t const cursor, uint64_t const validator_count) noexcept
{
    if (validator_count == 0) {
        return 0;
    }
    return (cursor + 1) % validator_count;
}

uint64_t
hold_cursor(uint64_t const cursor, uint64_t const validator_count) noexcept
{
    if (validator_count == 0) {
        return 0;
    }
    return cursor % validator_count;
}

Address to_address(Turn const &turn, Address const &public_round_address)
{
    if (auto const *const assigned = std::get_if<AssignedValidator>(&turn)) {
        return assigned->validator;
    }
    return public_round_address;
}

VALPOOL_POOL_NAMESPACE_END
