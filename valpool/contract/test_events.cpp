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
#include <valpool/contract/events.hpp>
#include <valpool/core/address.hpp>
#include <valpool/core/byte_string.hpp>
#include <valpool/core/bytes.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace valpool;
using namespace intx::literals;

TEST(Events, build_bonded_event)
{
    // event Bonded(address indexed, uint256 indexed, uint256, uint64)
    constexpr auto signature =
        0x7f3f998dfce95d11af592e3e5df237d3b773249a246166f926c8dd93e366b01c_bytes32;
    auto const indexed_submitter = Address{0xdeadbeef};
    u256_be const indexed_index = 100;
    u256_be const data_amount = 1000000_u256;
    u64_be const data_expires_at = 5;

    constexpr auto expected_topic1 =
        0x00000000000000000000000000000000000000000000000000000000deadbeef_bytes32;
    constexpr auto expected_topic2 =
        0x0000000000000000000000000000000000000000000000000000000000000064_bytes32;
    byte_string const expected_data =
        evmc::from_hex(
            "0x00000000000000000000000000000000000000000000000000000000000f4240"
            "0000000000000000000000000000000000000000000000000000000000000005")
            .value();

    auto const event = EventBuilder(Address{0x2000}, signature)
                           .add_topic(abi_encode_address(indexed_submitter))
                           .add_topic(abi_encode_uint(indexed_index))
                           .add_data(abi_encode_uint(data_amount))
                           .add_data(abi_encode_uint(data_expires_at))
                           .build();
    EXPECT_EQ(event.address, Address{0x2000});
    ASSERT_EQ(event.topics.size(), 3);
    EXPECT_EQ(event.topics[0], signature);
    EXPECT_EQ(event.topics[1], expected_topic1);
    EXPECT_EQ(event.topics[2], expected_topic2);
    EXPECT_EQ(event.data, expected_data);
}

TEST(Events, signature_only)
{
    constexpr auto signature = bytes32_t{0x42};
    auto const event = EventBuilder(Address{}, signature).build();
    ASSERT_EQ(event.topics.size(), 1);
    EXPECT_EQ(event.topics[0], signature);
    EXPECT_TRUE(event.data.empty());
}
