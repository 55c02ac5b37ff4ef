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
#include <valpool/pool/config.hpp>

#include <cstdint>
#include <span>
#include <variant>

VALPOOL_POOL_NAMESPACE_BEGIN

struct AssignedValidator
{
    Address validator;

    friend bool
    operator==(AssignedValidator const &, AssignedValidator const &) = default;
};

// Nobody is on turn, any address may submit
struct PublicRound
{
    friend bool operator==(PublicRound const &, PublicRound const &) = default;
};

using Turn = std::variant<AssignedValidator, PublicRound>;

/**
 * Who is responsible for the checkpoint whose expected deadline is
 * `deadline`. The validator at `cursor` (mod the set size) is on turn until
 * a full round has passed beyond the deadline. An empty set always yields a
 * public round.
 */
Turn select_validator(
    std::span<Address const> validators, uint64_t cursor, uint64_t deadline,
    uint64_t round_duration, uint64_t now);

uint64_t advance_cursor(uint64_t cursor, uint64_t validator_count) noexcept;

/**
 * Cursor after the validator on turn left the set. Removal moves the last
 * member into the vacated slot, so that slot is the next turn.
 */
uint64_t hold_cursor(uint64_t cursor, uint64_t validator_count) noexcept;

Address to_address(Turn const &, Address const &public_round_address);

inline bool is_public_round(Turn const &turn) noexcept
{
    return std::holds_alternative<PublicRound>(turn);
}

VALPOOL_POOL_NAMESPACE_END
