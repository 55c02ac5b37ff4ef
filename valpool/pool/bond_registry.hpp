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
#include <map>
#include <optional>

VALPOOL_POOL_NAMESPACE_BEGIN

struct Bond
{
    uint256_t amount{0};
    uint64_t expires_at{0};
    Address submitter{};

    friend bool operator==(Bond const &, Bond const &) = default;
};

// Outstanding bonds keyed by checkpoint index. Iteration order is the
// release order, so the oldest bond is always first.
class BondRegistry
{
    std::map<uint64_t, Bond> bonds_{};

public:
    Result<void> insert(uint64_t index, Bond const &);
    Result<Bond> get(uint64_t index) const;
    Result<Bond> remove(uint64_t index);

    // null when absent
    Bond *find(uint64_t index);

    bool contains(uint64_t index) const;
    std::optional<uint64_t> oldest_index() const;

    size_t size() const noexcept
    {
        return bonds_.size();
    }
};

VALPOOL_POOL_NAMESPACE_END
