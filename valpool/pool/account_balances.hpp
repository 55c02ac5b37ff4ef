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
#include <valpool/core/int.hpp>
#include <valpool/pool/config.hpp>

VALPOOL_POOL_NAMESPACE_BEGIN

// Native balances that deposits draw from and withdrawals pay into
struct AccountBalances
{
    virtual ~AccountBalances() = default;

    virtual uint256_t get_balance(Address const &) const = 0;
    virtual void add_to_balance(Address const &, uint256_t const &delta) = 0;
    virtual void
    subtract_from_balance(Address const &, uint256_t const &delta) = 0;
};

VALPOOL_POOL_NAMESPACE_END
