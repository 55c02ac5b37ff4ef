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


#include <valpool/core/address.hpp>
#include <valpool/pool/bond_registry.hpp>
#include <valpool/pool/pool_error.hpp>

#include <gtest/gtest.h>

using namespace valpool;
using namespace valpool::pool;

namespace
{
    constexpr Address V{0x1};
    constexpr Address W{0x2};
}

TEST(BondRegistry, insert_and_get)
{
    BondRegistry bonds;
    EXPECT_EQ(bonds.get(0).assume_error(), PoolError::NoSuchBond);

    Bond const bond{.amount = 100, .expires_at = 500, .submitter = V};
    EXPECT_FALSE(bonds.insert(0, bond).has_error());
    ASSERT_TRUE(bonds.get(0).has_value());
    EXPECT_EQ(bonds.get(0).value(), bond);
    EXPECT_TRUE(bonds.contains(0));
    EXPECT_EQ(bonds.size(), 1);
}

TEST(BondRegistry, no_double_bond)
{
    BondRegistry bonds;
    EXPECT_FALSE(
        bonds.insert(3, Bond{.amount = 100, .expires_at = 1, .submitter = V})
            .has_error());
    auto const res =
        bonds.insert(3, Bond{.amount = 200, .expires_at = 2, .submitter = W});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), PoolError::BondAlreadyExists);
    EXPECT_EQ(bonds.get(3).value().amount, 100);
}

TEST(BondRegistry, oldest_first)
{
    BondRegistry bonds;
    EXPECT_FALSE(bonds.oldest_index().has_value());

    for (uint64_t const index : {7u, 2u, 5u}) {
        EXPECT_FALSE(
            bonds
                .insert(
                    index,
                    Bond{.amount = 100, .expires_at = index, .submitter = V})
                .has_error());
    }
    EXPECT_EQ(bonds.oldest_index(), 2);

    EXPECT_EQ(bonds.remove(2).value().expires_at, 2);
    EXPECT_EQ(bonds.oldest_index(), 5);
    EXPECT_EQ(bonds.remove(2).assume_error(), PoolError::NoSuchBond);
}

TEST(BondRegistry, find_is_mutable)
{
    BondRegistry bonds;
    EXPECT_EQ(bonds.find(0), nullptr);
    EXPECT_FALSE(
        bonds.insert(0, Bond{.amount = 100, .expires_at = 1, .submitter = V})
            .has_error());

    Bond *const bond = bonds.find(0);
    ASSERT_NE(bond, nullptr);
    bond->amount = 200;
    EXPECT_EQ(bonds.get(0).value().amount, 200);
}
