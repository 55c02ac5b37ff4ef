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

#include <valpool/contract/events.hpp>
#include <valpool/core/int.hpp>
#include <valpool/core/version_stack.hpp>
#include <valpool/pool/bond_registry.hpp>
#include <valpool/pool/config.hpp>
#include <valpool/pool/reward_notifier.hpp>
#include <valpool/pool/validator_ledger.hpp>

#include <cstdint>
#include <vector>

VALPOOL_POOL_NAMESPACE_BEGIN

// Everything the pool mutates. Changes made after push() are either merged
// into the enclosing checkpoint by pop_accept() or discarded by
// pop_reject().
class PoolState
{
    VersionStack<ValidatorLedger> ledger_;
    VersionStack<BondRegistry> bonds_{BondRegistry{}};
    VersionStack<uint64_t> cursor_{0};
    VersionStack<std::vector<Log>> logs_{{}};
    VersionStack<std::vector<RewardMessage>> outbox_{{}};

    unsigned version_{0};

public:
    explicit PoolState(uint256_t const &min_bond_amount);

    PoolState(PoolState &&) = default;
    PoolState(PoolState const &) = delete;
    PoolState &operator=(PoolState &&) = delete;
    PoolState &operator=(PoolState const &) = delete;

    void push();
    void pop_accept();
    void pop_reject();

    unsigned version() const noexcept
    {
        return version_;
    }

    ValidatorLedger const &ledger() const;
    ValidatorLedger &ledger();

    BondRegistry const &bonds() const;
    BondRegistry &bonds();

    uint64_t cursor() const;
    void set_cursor(uint64_t);

    std::vector<Log> const &logs() const;
    void store_log(Log const &);

    std::vector<RewardMessage> const &outbox() const;
    void queue_reward(RewardMessage const &);

    // only outside of any checkpoint
    std::vector<RewardMessage> take_outbox();
};

VALPOOL_POOL_NAMESPACE_END
