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
#include <valpool/core/assert.h>
#include <valpool/core/byte_string.hpp>
#include <valpool/core/bytes.hpp>
#include <valpool/core/int.hpp>
#include <valpool/pool/account_balances.hpp>
#include <valpool/pool/checkpoint_oracle.hpp>
#include <valpool/pool/cross_domain_messenger.hpp>
#include <valpool/test/config.hpp>

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

VALPOOL_TEST_NAMESPACE_BEGIN

// Checkpoints every `submission_interval` L2 blocks, one L2 block every
// `l2_block_time` seconds starting at `genesis_time`.
class FakeCheckpointOracle final : public pool::CheckpointOracle
{
    uint64_t genesis_time_;
    uint64_t l2_block_time_;
    uint64_t submission_interval_;
    std::vector<pool::Checkpoint> checkpoints_{};

public:
    FakeCheckpointOracle(
        uint64_t const genesis_time, uint64_t const l2_block_time,
        uint64_t const submission_interval)
        : genesis_time_{genesis_time}
        , l2_block_time_{l2_block_time}
        , submission_interval_{submission_interval}
    {
    }

    uint64_t next_expected_block_number() const override
    {
        return (checkpoints_.size() + 1) * submission_interval_;
    }

    std::optional<pool::Checkpoint>
    get_checkpoint(uint64_t const index) const override
    {
        if (index >= checkpoints_.size()) {
            return std::nullopt;
        }
        return checkpoints_[index];
    }

    uint64_t expected_deadline(uint64_t const block_number) const override
    {
        return genesis_time_ + block_number * l2_block_time_;
    }

    // deadline of the next checkpoint
    uint64_t next_deadline() const
    {
        return expected_deadline(next_expected_block_number());
    }

    uint64_t accept(Address const &submitter, uint64_t const timestamp)
    {
        uint64_t const index = checkpoints_.size();
        checkpoints_.push_back(pool::Checkpoint{
            .output_root = bytes32_t{index + 1},
            .submitter = submitter,
            .block_number = next_expected_block_number(),
            .timestamp = timestamp});
        return index;
    }
};

struct SentMessage
{
    Address target;
    uint64_t gas_limit;
    byte_string data;
};

class RecordingMessenger final : public pool::CrossDomainMessenger
{
public:
    std::vector<SentMessage> sent{};

    void send_message(
        Address const &target, uint64_t const gas_limit,
        byte_string_view const data) override
    {
        sent.push_back(SentMessage{
            .target = target,
            .gas_limit = gas_limit,
            .data = byte_string{data}});
    }
};

class InMemoryAccounts final : public pool::AccountBalances
{
    std::unordered_map<Address, uint256_t> balances_{};

public:
    uint256_t get_balance(Address const &address) const override
    {
        auto const it = balances_.find(address);
        return it == balances_.end() ? uint256_t{0} : it->second;
    }

    void
    add_to_balance(Address const &address, uint256_t const &delta) override
    {
        balances_[address] += delta;
    }

    void subtract_from_balance(
        Address const &address, uint256_t const &delta) override
    {
        auto &balance = balances_[address];
        VALPOOL_ASSERT(balance >= delta);
        balance -= delta;
    }
};

VALPOOL_TEST_NAMESPACE_END
