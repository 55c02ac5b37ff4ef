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
#include <valpool/core/byte_string.hpp>
#include <valpool/pool/config.hpp>

#include <cstdint>

VALPOOL_POOL_NAMESPACE_BEGIN

struct CrossDomainMessenger;

struct RewardMessage
{
    Address beneficiary{};
    uint64_t block_number{0};
    uint64_t penalty{0};
    uint64_t penalty_period{0};

    friend bool
    operator==(RewardMessage const &, RewardMessage const &) = default;
};

// calldata for reward(address,uint256,uint256,uint256) on the reward vault
byte_string encode_reward_call(RewardMessage const &);

class RewardNotifier
{
    CrossDomainMessenger &messenger_;
    Address reward_vault_;
    uint64_t gas_limit_;

public:
    RewardNotifier(
        CrossDomainMessenger &, Address const &reward_vault,
        uint64_t gas_limit);

    void notify(RewardMessage const &);
};

VALPOOL_POOL_NAMESPACE_END
