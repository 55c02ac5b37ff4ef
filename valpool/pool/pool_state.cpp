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


#include <valpool/core/assert.h>
#include <valpool/pool/pool_state.hpp>

#include <utility>

VALPOOL_POOL_NAMESPACE_BEGIN

PoolState::PoolState(uint256_t const &min_bond_amount)
    : ledger_{ValidatorLedger{min_bond_amount}}
{
}

void PoolState::push()
{
    ++version_;
}

void PoolState::pop_accept()
{
    VALPOOL_ASSERT(version_);

    ledger_.pop_accept(version_);
    bonds_.pop_accept(version_);
    cursor_.pop_accept(version_);
    logs_.pop_accept(version_);
    outbox_.pop_accept(version_);

    --version_;
}

void PoolState::pop_reject()
{
    VALPOOL_ASSERT(version_);

    ledger_.pop_reject(version_);
    bonds_.pop_reject(version_);
    cursor_.pop_reject(version_);
    logs_.pop_reject(version_);
    outbox_.pop_reject(version_);

    --version_;
}

ValidatorLedger const &PoolState::ledger() const
{
    return ledger_.recent();
}

ValidatorLedger &PoolState::ledger()
{
    return ledger_.current(version_);
}

BondRegistry const &PoolState::bonds() const
{
    return bonds_.recent();
}

BondRegistry &PoolState::bonds()
{
    return bonds_.current(version_);
}

uint64_t PoolState::cursor() const
{
    return cursor_.recent();
}

void PoolState::set_cursor(uint64_t const cursor)
{
    cursor_.current(version_) = cursor;
}

std::vector<Log> const &PoolState::logs() const
{
    return logs_.recent();
}

void PoolState::store_log(Log const &log)
{
    logs_.current(version_).push_back(log);
}

std::vector<RewardMessage> const &PoolState::outbox() const
{
    return outbox_.recent();
}

void PoolState::queue_reward(RewardMessage const &msg)
{
    outbox_.current(version_).push_back(msg);
}

std::vector<RewardMessage> PoolState::take_outbox()
{
    VALPOOL_ASSERT(version_ == 0);
    return std::exchange(outbox_.current(version_), {});
}

VALPOOL_POOL_NAMESPACE_END
