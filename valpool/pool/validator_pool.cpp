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


#include <valpool/contract/abi_encode.hpp>
#include <valpool/contract/abi_signatures.hpp>
#include <valpool/contract/big_endian.hpp>
#include <valpool/contract/checked_math.hpp>
#include <valpool/contract/events.hpp>
#include <valpool/core/fmt/address_fmt.hpp> // NOLINT
#include <valpool/core/fmt/int_fmt.hpp> // NOLINT
#include <valpool/core/likely.h>
#include <valpool/pool/account_balances.hpp>
#include <valpool/pool/checkpoint_oracle.hpp>
#include <valpool/pool/constants.hpp>
#include <valpool/pool/penalty.hpp>
#include <valpool/pool/pool_error.hpp>
#include <valpool/pool/validator_pool.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <utility>
#include <variant>

VALPOOL_POOL_NAMESPACE_BEGIN

ValidatorPool::ValidatorPool(
    PoolConfig const &config, CheckpointOracle &oracle,
    CrossDomainMessenger &messenger, AccountBalances &accounts)
    : config_{config}
    , oracle_{oracle}
    , accounts_{accounts}
    , notifier_{messenger, config.reward_vault, config.reward_gas_limit}
    , state_{config.min_bond_amount}
{
}

Result<ValidatorPool> ValidatorPool::create(
    PoolConfig const &config, CheckpointOracle &oracle,
    CrossDomainMessenger &messenger, AccountBalances &accounts)
{
    BOOST_OUTCOME_TRY(validate_config(config));
    return ValidatorPool{config, oracle, messenger, accounts};
}

template <class F>
Result<void> ValidatorPool::atomically(F &&f)
{
    state_.push();
    auto res = std::forward<F>(f)();
    if (res.has_error()) {
        state_.pop_reject();
    }
    else {
        state_.pop_accept();
    }
    if (state_.version() == 0) {
        flush_outbox();
    }
    return res;
}

void ValidatorPool::flush_outbox()
{
    for (auto const &msg : state_.take_outbox()) {
        notifier_.notify(msg);
    }
}

////////////
// Ledger //
////////////

Result<void>
ValidatorPool::deposit(Address const &address, uint256_t const &amount)
{
    return atomically([&]() -> Result<void> {
        if (VALPOOL_UNLIKELY(accounts_.get_balance(address) < amount)) {
            return PoolError::InsufficientFunds;
        }
        BOOST_OUTCOME_TRY(state_.ledger().credit(address, amount));
        accounts_.subtract_from_balance(address, amount);

        LOG_INFO(
            "ValidatorPool: deposit {} from {}, balance {}",
            amount,
            address,
            state_.ledger().balance_of(address));
        return outcome::success();
    });
}

Result<void>
ValidatorPool::withdraw(Address const &address, uint256_t const &amount)
{
    return atomically([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(state_.ledger().debit(address, amount));
        accounts_.add_to_balance(address, amount);

        LOG_INFO(
            "ValidatorPool: withdraw {} to {}, balance {}",
            amount,
            address,
            state_.ledger().balance_of(address));
        return outcome::success();
    });
}

uint256_t ValidatorPool::balance_of(Address const &address) const
{
    return state_.ledger().balance_of(address);
}

bool ValidatorPool::is_validator(Address const &address) const
{
    return state_.ledger().is_validator(address);
}

size_t ValidatorPool::validator_count() const
{
    return state_.ledger().validator_count();
}

//////////////
// Rotation //
//////////////

Turn ValidatorPool::next_validator(uint64_t const now) const
{
    uint64_t const deadline =
        oracle_.expected_deadline(oracle_.next_expected_block_number());
    return select_validator(
        state_.ledger().validators(),
        state_.cursor(),
        deadline,
        config_.round_duration(),
        now);
}

Address ValidatorPool::next_validator_address(uint64_t const now) const
{
    return to_address(next_validator(now), config_.public_round_address);
}

bool ValidatorPool::may_submit(Address const &address, uint64_t const now) const
{
    auto const turn = next_validator(now);
    if (is_public_round(turn)) {
        return true;
    }
    return std::get<AssignedValidator>(turn).validator == address;
}

///////////
// Bonds //
///////////

Result<void> ValidatorPool::create_bond(
    Address const &sender, uint64_t const index, uint256_t const &amount,
    uint64_t const expires_at, uint64_t const now)
{
    if (VALPOOL_UNLIKELY(sender != config_.checkpoint_oracle)) {
        return PoolError::Unauthorized;
    }
    if (VALPOOL_UNLIKELY(amount == 0 || amount < config_.min_bond_amount)) {
        return PoolError::ZeroOrBelowMinimum;
    }
    if (VALPOOL_UNLIKELY(state_.bonds().contains(index))) {
        return PoolError::BondAlreadyExists;
    }
    auto const checkpoint = oracle_.get_checkpoint(index);
    if (VALPOOL_UNLIKELY(!checkpoint.has_value())) {
        return PoolError::UnknownCheckpoint;
    }
    Address const &submitter = checkpoint->submitter;

    return atomically([&]() -> Result<void> {
        // keeps at most one expired bond waiting
        if (auto const oldest = state_.bonds().oldest_index();
            oldest.has_value()) {
            BOOST_OUTCOME_TRY(auto const bond, state_.bonds().get(*oldest));
            if (now >= bond.expires_at) {
                BOOST_OUTCOME_TRY(release(*oldest, now));
            }
        }

        auto const &ledger = std::as_const(state_).ledger();
        bool const on_turn =
            ledger.validator_count() > 0 &&
            ledger.validator_at(state_.cursor() % ledger.validator_count()) ==
                submitter;

        BOOST_OUTCOME_TRY(state_.ledger().debit(submitter, amount));
        BOOST_OUTCOME_TRY(state_.bonds().insert(
            index,
            Bond{
                .amount = amount,
                .expires_at = expires_at,
                .submitter = submitter}));
        emit_bonded_event(submitter, index, amount, expires_at);

        auto const &after = std::as_const(state_).ledger();
        uint64_t const count = after.validator_count();
        if (on_turn && !after.is_validator(submitter)) {
            state_.set_cursor(hold_cursor(state_.cursor(), count));
        }
        else {
            state_.set_cursor(advance_cursor(state_.cursor(), count));
        }

        LOG_INFO(
            "ValidatorPool: bonded {} for checkpoint {} by {}, expires at {}",
            amount,
            index,
            submitter,
            expires_at);
        return outcome::success();
    });
}

Result<void> ValidatorPool::release(uint64_t const index, uint64_t const now)
{
    BOOST_OUTCOME_TRY(auto const bond, state_.bonds().get(index));
    if (VALPOOL_UNLIKELY(now < bond.expires_at)) {
        return PoolError::NotYetExpired;
    }
    auto const checkpoint = oracle_.get_checkpoint(index);
    if (VALPOOL_UNLIKELY(!checkpoint.has_value())) {
        LOG_ERROR(
            "ValidatorPool: bonded checkpoint {} unknown to the oracle",
            index);
        return PoolError::UnknownCheckpoint;
    }

    uint64_t const deadline =
        oracle_.expected_deadline(checkpoint->block_number);
    uint64_t const penalty = compute_penalty(
        PenaltyPeriods{
            .non_penalty_period = config_.non_penalty_period,
            .penalty_period = config_.penalty_period},
        deadline,
        checkpoint->timestamp);

    // the principal is returned in full, the penalty only scales the reward
    BOOST_OUTCOME_TRY(state_.ledger().credit(bond.submitter, bond.amount));
    BOOST_OUTCOME_TRY(state_.bonds().remove(index));
    state_.queue_reward(RewardMessage{
        .beneficiary = bond.submitter,
        .block_number = checkpoint->block_number,
        .penalty = penalty,
        .penalty_period = config_.penalty_period});
    emit_unbonded_event(index, bond.submitter, bond.amount);

    LOG_INFO(
        "ValidatorPool: released {} for checkpoint {} to {}, penalty {}",
        bond.amount,
        index,
        bond.submitter,
        penalty);
    return outcome::success();
}

Result<void> ValidatorPool::unbond(uint64_t const now)
{
    auto const oldest = state_.bonds().oldest_index();
    if (VALPOOL_UNLIKELY(!oldest.has_value())) {
        return PoolError::NoSuchBond;
    }
    return atomically([&] { return release(*oldest, now); });
}

Result<void> ValidatorPool::increase_bond(
    Address const &sender, Address const &challenger, uint64_t const index,
    uint64_t const now)
{
    if (VALPOOL_UNLIKELY(sender != config_.dispute_game)) {
        return PoolError::Unauthorized;
    }

    return atomically([&]() -> Result<void> {
        Bond *const bond = state_.bonds().find(index);
        if (VALPOOL_UNLIKELY(bond == nullptr)) {
            return PoolError::NoSuchBond;
        }
        if (VALPOOL_UNLIKELY(now > bond->expires_at)) {
            return PoolError::BondFinalized;
        }

        uint256_t const added = bond->amount;
        BOOST_OUTCOME_TRY(auto const doubled, checked_add(added, added));
        BOOST_OUTCOME_TRY(state_.ledger().debit(challenger, added));
        bond->amount = doubled;
        emit_bond_increased_event(challenger, index, added);

        LOG_INFO(
            "ValidatorPool: {} increased bond for checkpoint {} to {}",
            challenger,
            index,
            doubled);
        return outcome::success();
    });
}

Result<Bond> ValidatorPool::get_bond(uint64_t const index) const
{
    return state_.bonds().get(index);
}

Result<uint64_t> ValidatorPool::next_unbond_index() const
{
    auto const oldest = state_.bonds().oldest_index();
    if (VALPOOL_UNLIKELY(!oldest.has_value())) {
        return PoolError::NoSuchBond;
    }
    return *oldest;
}

std::vector<Log> const &ValidatorPool::logs() const
{
    return state_.logs();
}

////////////
// Events //
////////////

void ValidatorPool::emit_bonded_event(
    Address const &submitter, uint64_t const index, uint256_t const &amount,
    uint64_t const expires_at)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Bonded(address,uint256,uint256,uint64)");
    static_assert(
        signature ==
        0x7f3f998dfce95d11af592e3e5df237d3b773249a246166f926c8dd93e366b01c_bytes32);

    auto const event = EventBuilder(VALIDATOR_POOL_CA, signature)
                           .add_topic(abi_encode_address(submitter))
                           .add_topic(abi_encode_uint(u256_be{index}))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .add_data(abi_encode_uint(u64_be{expires_at}))
                           .build();
    state_.store_log(event);
}

void ValidatorPool::emit_unbonded_event(
    uint64_t const index, Address const &submitter, uint256_t const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Unbonded(uint256,address,uint256)");
    static_assert(
        signature ==
        0x7b05ceb891b98d7a8ba163d1a114e07bf16746448634b7b59f0fd91407befbe9_bytes32);

    auto const event = EventBuilder(VALIDATOR_POOL_CA, signature)
                           .add_topic(abi_encode_uint(u256_be{index}))
                           .add_topic(abi_encode_address(submitter))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    state_.store_log(event);
}

void ValidatorPool::emit_bond_increased_event(
    Address const &challenger, uint64_t const index, uint256_t const &added)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("BondIncreased(address,uint256,uint256)");
    static_assert(
        signature ==
        0x0755eb40fa73f421d18e7f95144942e58320aeabd2c49a9589a40eeb44ab3396_bytes32);

    auto const event = EventBuilder(VALIDATOR_POOL_CA, signature)
                           .add_topic(abi_encode_address(challenger))
                           .add_topic(abi_encode_uint(u256_be{index}))
                           .add_data(abi_encode_uint(u256_be{added}))
                           .build();
    state_.store_log(event);
}

VALPOOL_POOL_NAMESPACE_END
