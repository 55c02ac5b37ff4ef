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
#include <valpool/core/int.hpp>

#include <gtest/gtest.h>

using namespace valpool;

TEST(CheckedMath, add)
{
    auto const res = checked_add(2, 3);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 5);

    EXPECT_EQ(checked_add(UINT256_MAX, 0).value(), UINT256_MAX);
}

TEST(CheckedMath, add_overflow)
{
    auto const res = checked_add(UINT256_MAX, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
}

TEST(CheckedMath, sub)
{
    EXPECT_EQ(checked_sub(5, 3).value(), 2);
    EXPECT_EQ(checked_sub(5, 5).value(), 0);
}

TEST(CheckedMath, sub_underflow)
{
    auto const res = checked_sub(3, 5);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Underflow);
}
