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
#include <valpool/core/bytes.hpp>
#include <valpool/pool/config.hpp>

#include <cstdint>
#include <optional>

VALPOOL_POOL_NAMESPACE_BEGIN

struct Checkpoint
{
    bytes32_t output_root{};
    Address submitter{};
    uint64_t block_number{0};
    uint64_t timestamp{0}; // when the checkpoint was accepted

    friend bool operator==(Checkpoint const &, Checkpoint const &) = default;
};

// The contract that accepts checkpoints and calls back into the pool
struct CheckpointOracle
{
    virtual ~CheckpointOracle() = default;

    virtual uint64_t next_expected_block_number() const = 0;
    virtual std::optional<Checkpoint> get_checkpoint(uint64_t index) const = 0;

    // timestamp by which the checkpoint for block_number should be submitted
    virtual uint64_t expected_deadline(uint64_t block_number) const = 0;
};

VALPOOL_POOL_NAMESPACE_END
