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
#include <valpool/contract/big_endian.hpp>
#include <valpool/core/address.hpp>
#include <valpool/core/byte_string.hpp>
#include <valpool/core/bytes.hpp>
#include <valpool/pool/reward_notifier.hpp>

#include <valpool/test/fakes.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace valpool;
using namespace valpool::pool;
using namespace valpool::test;

namespace
{
    constexpr Address VAULT{0x4200000000000000000000000000000000000008_address};
    constexpr Address BENEFICIARY{0xbeef};

    constexpr RewardMessage MSG{
        .beneficiary = BENEFICIARY,
        .block_number = 1800,
        .penalty = 25,
        .penalty_period = 1200};
}

TEST(RewardNotifier, encode_reward_call)
{
    auto const data = encode_reward_call(MSG);
    ASSERT_EQ(data.size(), 4 + 4 * 32);

    EXPECT_EQ(data[0], 0xc5);
    EXPECT_EQ(data[1], 0xa3);
    EXPECT_EQ(data[2], 0x48);
    EXPECT_EQ(data[3], 0x7c);

    byte_string expected{0xc5, 0xa3, 0x48, 0x7c};
    expected += abi_encode_address(BENEFICIARY);
    expected += abi_encode_uint(u256_be{1800});
    expected += abi_encode_uint(u256_be{25});
    expected += abi_encode_uint(u256_be{1200});
    EXPECT_EQ(data, expected);

    // the address is left padded
    EXPECT_EQ(data[4 + 31], 0xef);
    EXPECT_EQ(data[4 + 30], 0xbe);
    EXPECT_EQ(data[4 + 11], 0x00);
}

TEST(RewardNotifier, notify_sends_to_vault)
{
    RecordingMessenger messenger;
    RewardNotifier notifier{messenger, VAULT, 77'000};

    notifier.notify(MSG);
    notifier.notify(RewardMessage{
        .beneficiary = BENEFICIARY,
        .block_number = 3600,
        .penalty = 0,
        .penalty_period = 1200});

    ASSERT_EQ(messenger.sent.size(), 2);
    EXPECT_EQ(messenger.sent[0].target, VAULT);
    EXPECT_EQ(messenger.sent[0].gas_limit, 77'000);
    EXPECT_EQ(messenger.sent[0].data, encode_reward_call(MSG));
    EXPECT_EQ(messenger.sent[1].data.size(), 4 + 4 * 32);
}
