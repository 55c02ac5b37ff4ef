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


#include <valpool/core/likely.h>
#include <valpool/pool/bond_registry.hpp>
#include <valpool/pool/pool_error.hpp>

#include <boost/outcome/success_failure.hpp>

VALPOOL_POOL_NAMESPACE_BEGIN

Result<void> BondRegistry::insert(uint64_t const index, Bond const &bond)
{
    auto const [it, inserted] = bonds_.try_emplace(index, bond);
    if (VALPOOL_UNLIKELY(!inserted)) {
        return PoolError::BondAlreadyExists;
    }
    return outcome::success();
}

Result<Bond> BondRegistry::get(uint64_t const index) const
{
    auto const it = bonds_.find(index);
    if (VALPOOL_UNLIKELY(it == bonds_.end())) {
        return PoolError::NoSuchBond;
    }
    return it->second;
}

Result<Bond> BondRegistry::remove(uint64_t const index)
{
    auto const it = bonds_.find(index);
    if (VALPOOL_UNLIKELY(it == bonds_.end())) {
        return PoolError::NoSuchBond;
    }
    Bond const bond = it->second;
    bonds_.erase(it);
    return bond;
}

Bond *BondRegistry::find(uint64_t const index)
{
    auto const it = bonds_.find(index);
    return it == bonds_.end() ? nullptr : &it->second;
}

bool BondRegistry::contains(uint64_t const index) const
{
    return bonds_.contains(index);
}

std::optional<uint64_t> BondRegistry::oldest_index() const
{
    if (bonds_.empty()) {
        return std::nullopt;
    }
    return bonds_.begin()->first;
}

VALPOOL_POOL_NAMESPACE_END
