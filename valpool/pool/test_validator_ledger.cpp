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
#include <valpool/core/address.hpp>
#include <valpool/core/int.hpp>
#include <valpool/pool/pool_error.hpp>
#include <valpool/pool/validator_ledger.hpp>

#include <gtest/gtest.h>

#include <intx/intx.hpp>

#include <algorithm>
#include <initializer_list>
#include <vector>

using namespace valpool;
using namespace valpool::pool;

namespace
{
    constexpr uint256_t MIN_BOND{100};

    constexpr Address A{0xa};
    constexpr Address B{0xb};
    constexpr Address C{0xc};

    void expect_eligibility(ValidatorLedger const &ledger)
    {
        for (auto const &addr : {A, B, C}) {
            EXPECT_EQ(
                ledger.is_validator(addr),
                ledger.balance_of(addr) >= MIN_BOND);
        }
        EXPECT_EQ(ledger.validators().size(), ledger.validator_count());
    }
}

struct Ledger : public ::testing::Test
{
    ValidatorLedger ledger{MIN_BOND};
};

TEST_F(Ledger, credit_below_threshold)
{
    EXPECT_FALSE(ledger.credit(A, 99).has_error());
    EXPECT_EQ(ledger.balance_of(A), 99);
    EXPECT_FALSE(ledger.is_validator(A));
    EXPECT_EQ(ledger.validator_count(), 0);
    expect_eligibility(ledger);
}

TEST_F(Ledger, credit_crosses_threshold)
{
    EXPECT_FALSE(ledger.credit(A, 60).has_error());
    EXPECT_FALSE(ledger.credit(A, 40).has_error());
    EXPECT_TRUE(ledger.is_validator(A));
    EXPECT_EQ(ledger.validator_count(), 1);
    EXPECT_EQ(ledger.validator_at(0), A);

    // already a member
    EXPECT_FALSE(ledger.credit(A, 500).has_error());
    EXPECT_EQ(ledger.validator_count(), 1);
    expect_eligibility(ledger);
}

TEST_F(Ledger, debit_insufficient)
{
    EXPECT_FALSE(ledger.credit(A, 100).has_error());
    auto const res = ledger.debit(A, 101);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), PoolError::InsufficientFunds);
    EXPECT_EQ(ledger.balance_of(A), 100);
    EXPECT_TRUE(ledger.is_validator(A));

    EXPECT_EQ(ledger.debit(B, 1).assume_error(), PoolError::InsufficientFunds);
}

TEST_F(Ledger, debit_keeps_membership_above_threshold)
{
    EXPECT_FALSE(ledger.credit(A, 250).has_error());
    EXPECT_FALSE(ledger.debit(A, 150).has_error());
    EXPECT_EQ(ledger.balance_of(A), 100);
    EXPECT_TRUE(ledger.is_validator(A));

    EXPECT_FALSE(ledger.debit(A, 1).has_error());
    EXPECT_FALSE(ledger.is_validator(A));
    EXPECT_EQ(ledger.validator_count(), 0);
    expect_eligibility(ledger);
}

TEST_F(Ledger, removal_swaps_with_last)
{
    for (auto const &addr : {A, B, C}) {
        EXPECT_FALSE(ledger.credit(addr, MIN_BOND).has_error());
    }
    ASSERT_EQ(ledger.validator_count(), 3);

    EXPECT_FALSE(ledger.debit(A, MIN_BOND).has_error());
    ASSERT_EQ(ledger.validator_count(), 2);
    EXPECT_EQ(ledger.validator_at(0), C);
    EXPECT_EQ(ledger.validator_at(1), B);

    // removing the tail leaves the rest in place
    EXPECT_FALSE(ledger.debit(B, MIN_BOND).has_error());
    ASSERT_EQ(ledger.validator_count(), 1);
    EXPECT_EQ(ledger.validator_at(0), C);
    expect_eligibility(ledger);
}

TEST_F(Ledger, requalified_validator_is_appended)
{
    for (auto const &addr : {A, B, C}) {
        EXPECT_FALSE(ledger.credit(addr, MIN_BOND).has_error());
    }
    EXPECT_FALSE(ledger.debit(B, 1).has_error());
    EXPECT_FALSE(ledger.credit(B, 1).has_error());

    std::vector<Address> const expected{A, C, B};
    EXPECT_TRUE(std::ranges::equal(ledger.validators(), expected));
    expect_eligibility(ledger);
}

TEST_F(Ledger, credit_overflow)
{
    EXPECT_FALSE(ledger.credit(A, UINT256_MAX).has_error());
    auto const res = ledger.credit(A, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
    EXPECT_EQ(ledger.balance_of(A), UINT256_MAX);
}

TEST_F(Ledger, round_trip)
{
    EXPECT_FALSE(ledger.credit(A, 30).has_error());
    EXPECT_FALSE(ledger.credit(A, 70).has_error());
    EXPECT_TRUE(ledger.is_validator(A));
    EXPECT_FALSE(ledger.debit(A, 70).has_error());
    EXPECT_EQ(ledger.balance_of(A), 30);
    EXPECT_FALSE(ledger.is_validator(A));
    expect_eligibility(ledger);
}
