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
#include <valpool/core/result.hpp>
#include <valpool/pool/config.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

VALPOOL_POOL_NAMESPACE_BEGIN

// Unbonded stake per address. An address is a validator exactly when its
// balance is at least the minimum bond amount.
class ValidatorLedger
{
    uint256_t min_bond_amount_;
    std::unordered_map<Address, uint256_t> balances_{};

    // ordered validator set and the position of each member in it
    std::vector<Address> validators_{};
    std::unordered_map<Address, size_t> positions_{};

public:
    explicit ValidatorLedger(uint256_t const &min_bond_amount);

    Result<void> credit(Address const &, uint256_t const &amount);
    Result<void> debit(Address const &, uint256_t const &amount);

    uint256_t balance_of(Address const &) const;
    bool is_validator(Address const &) const;
    size_t validator_count() const noexcept;
    Address const &validator_at(size_t) const;

    std::span<Address const> validators() const noexcept
    {
        return validators_;
    }

    uint256_t const &min_bond_amount() const noexcept
    {
        return min_bond_amount_;
    }

private:
    void add_validator(Address const &);
    void remove_validator(Address const &);
};

VALPOOL_POOL_NAMESPACE_END
