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


#include <valpool/contract/checked_math.hpp>
#include <valpool/core/assert.h>
#include <valpool/core/likely.h>
#include <valpool/pool/pool_error.hpp>
#include <valpool/pool/validator_ledger.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

VALPOOL_POOL_NAMESPACE_BEGIN

ValidatorLedger::ValidatorLedger(uint256_t const &min_bond_amount)
    : min_bond_amount_{min_bond_amount}
{
}

Result<void>
ValidatorLedger::credit(Address const &address, uint256_t const &amount)
{
    auto const before = balance_of(address);
    BOOST_OUTCOME_TRY(auto const after, checked_add(before, amount));
    if (after == 0) {
        return outcome::success();
    }
    balances_[address] = after;

    // joins the set only when crossing the threshold
    if (before < min_bond_amount_ && after >= min_bond_amount_) {
        add_validator(address);
    }
    return outcome::success();
}

Result<void>
ValidatorLedger::debit(Address const &address, uint256_t const &amount)
{
    auto const before = balance_of(address);
    if (VALPOOL_UNLIKELY(before < amount)) {
        return PoolError::InsufficientFunds;
    }
    BOOST_OUTCOME_TRY(auto const after, checked_sub(before, amount));
    if (after == 0) {
        balances_.erase(address);
    }
    else {
        balances_[address] = after;
    }

    if (before >= min_bond_amount_ && after < min_bond_amount_) {
        remove_validator(address);
    }
    return outcome::success();
}

uint256_t ValidatorLedger::balance_of(Address const &address) const
{
    auto const it = balances_.find(address);
    return it == balances_.end() ? uint256_t{0} : it->second;
}

bool ValidatorLedger::is_validator(Address const &address) const
{
    return positions_.contains(address);
}

size_t ValidatorLedger::validator_count() const noexcept
{
    return validators_.size();
}

Address const &ValidatorLedger::validator_at(size_t const i) const
{
    VALPOOL_ASSERT(i < validators_.size());
    return validators_[i];
}

void ValidatorLedger::add_validator(Address const &address)
{
    VALPOOL_ASSERT(!positions_.contains(address));
    positions_.emplace(address, validators_.size());
    validators_.push_back(address);
    VALPOOL_ASSERT(positions_.size() == validators_.size());
}

void ValidatorLedger::remove_validator(Address const &address)
{
    auto const it = positions_.find(address);
    VALPOOL_ASSERT(it != positions_.end());

    // swap with the last member, then drop the tail
    size_t const pos = it->second;
    Address const &last = validators_.back();
    if (last != address) {
        validators_[pos] = last;
        positions_[last] = pos;
    }
    validators_.pop_back();
    positions_.erase(it);
    VALPOOL_ASSERT(
        positions_.size() == validators_.size(), "validator set out of sync");
}

VALPOOL_POOL_NAMESPACE_END
