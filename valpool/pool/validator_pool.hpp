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
#include <valpool/core/address.hpp>
#include <valpool/core/int.hpp>
#include <valpool/core/result.hpp>
#include <valpool/pool/bond_registry.hpp>
#include <valpool/pool/config.hpp>
#include <valpool/pool/pool_config.hpp>
#include <valpool/pool/pool_state.hpp>
#include <valpool/pool/reward_notifier.hpp>
#include <valpool/pool/rotation.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

VALPOOL_POOL_NAMESPACE_BEGIN

struct AccountBalances;
struct CheckpointOracle;
struct CrossDomainMessenger;

/**
 * Stake bonding and validator rotation. Every mutating call is applied
 * atomically: on failure the ledger, the bonds, the rotation cursor, the
 * event log and the pending reward notifications are left untouched.
 * Reward notifications reach the messenger only once the outermost call
 * has committed.
 *
 * Callers serialize access. `now` is the caller's view of the current L1
 * timestamp.
 */
class ValidatorPool
{
    PoolConfig config_;
    CheckpointOracle &oracle_;
    AccountBalances &accounts_;
    RewardNotifier notifier_;
    PoolState state_;

    ValidatorPool(
        PoolConfig const &, CheckpointOracle &, CrossDomainMessenger &,
        AccountBalances &);

public:
    static Result<ValidatorPool> create(
        PoolConfig const &, CheckpointOracle &, CrossDomainMessenger &,
        AccountBalances &);

    ValidatorPool(ValidatorPool &&) = default;

    ////////////
    // Ledger //
    ////////////

    Result<void> deposit(Address const &, uint256_t const &amount);
    Result<void> withdraw(Address const &, uint256_t const &amount);

    uint256_t balance_of(Address const &) const;
    bool is_validator(Address const &) const;
    size_t validator_count() const;

    //////////////
    // Rotation //
    //////////////

    Turn next_validator(uint64_t now) const;

    // the public round address when nobody is on turn
    Address next_validator_address(uint64_t now) const;

    bool may_submit(Address const &, uint64_t now) const;

    ///////////
    // Bonds //
    ///////////

    // Called by the checkpoint oracle once it accepted checkpoint `index`
    Result<void> create_bond(
        Address const &sender, uint64_t index, uint256_t const &amount,
        uint64_t expires_at, uint64_t now);

    // Releases the oldest bond
    Result<void> unbond(uint64_t now);

    // Called by the dispute game, `challenger` matches the bond at `index`
    Result<void> increase_bond(
        Address const &sender, Address const &challenger, uint64_t index,
        uint64_t now);

    Result<Bond> get_bond(uint64_t index) const;
    Result<uint64_t> next_unbond_index() const;

    std::vector<Log> const &logs() const;

    PoolConfig const &config() const noexcept
    {
        return config_;
    }

    PoolState const &state() const noexcept
    {
        return state_;
    }

private:
    template <class F>
    Result<void> atomically(F &&);

    Result<void> release(uint64_t index, uint64_t now);
    void flush_outbox();

    void emit_bonded_event(
        Address const &submitter, uint64_t index, uint256_t const &amount,
        uint64_t expires_at);
    void emit_unbonded_event(
        uint64_t index, Address const &submitter, uint256_t const &amount);
    void emit_bond_increased_event(
        Address const &challenger, uint64_t index, uint256_t const &added);
};

VALPOOL_POOL_NAMESPACE_END
