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
#include <valpool/core/fmt/address_fmt.hpp> // NOLINT
#include <valpool/pool/cross_domain_messenger.hpp>
#include <valpool/pool/reward_notifier.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <utility>

VALPOOL_POOL_NAMESPACE_BEGIN

byte_string encode_reward_call(RewardMessage const &msg)
{
    constexpr uint32_t selector =
        abi_encode_selector("reward(address,uint256,uint256,uint256)");
    static_assert(selector == 0xc5a3487c);

    AbiCallEncoder encoder{selector};
    encoder.add_address(msg.beneficiary)
        .add_uint(u256_be{msg.block_number})
        .add_uint(u256_be{msg.penalty})
        .add_uint(u256_be{msg.penalty_period});
    return std::move(encoder).encode_final();
}

RewardNotifier::RewardNotifier(
    CrossDomainMessenger &messenger, Address const &reward_vault,
    uint64_t const gas_limit)
    : messenger_{messenger}
    , reward_vault_{reward_vault}
    , gas_limit_{gas_limit}
{
}

void RewardNotifier::notify(RewardMessage const &msg)
{
    LOG_INFO(
        "RewardNotifier: beneficiary {} block {} penalty {}/{}",
        msg.beneficiary,
        msg.block_number,
        msg.penalty,
        msg.penalty_period);
    messenger_.send_message(
        reward_vault_, gas_limit_, encode_reward_call(msg));
}

VALPOOL_POOL_NAMESPACE_END
