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

#include <valpool/contract/big_endian.hpp>
#include <valpool/core/address.hpp>
#include <valpool/core/byte_string.hpp>
#include <valpool/core/bytes.hpp>
#include <valpool/core/config.hpp>
#include <valpool/core/unaligned.hpp>

#include <cstdint>
#include <utility>

VALPOOL_NAMESPACE_BEGIN

constexpr bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    unaligned_store(&output.bytes[12], address);
    return output;
}

template <BigEndianType I>
constexpr bytes32_t abi_encode_uint(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    unaligned_store(&output.bytes[offset], i);
    return output;
}

// Calldata for a call with only static arguments: a four byte selector
// followed by one 32 byte word per argument.
class AbiCallEncoder
{
    byte_string output_;

public:
    explicit AbiCallEncoder(uint32_t const selector)
    {
        append_selector(selector);
    }

    AbiCallEncoder &add_address(Address const &address)
    {
        output_ += abi_encode_address(address);
        return *this;
    }

    template <BigEndianType I>
    AbiCallEncoder &add_uint(I const &i)
    {
        output_ += abi_encode_uint(i);
        return *this;
    }

    byte_string encode_final() &&
    {
        return std::move(output_);
    }

private:
    void append_selector(uint32_t const selector)
    {
        output_.push_back(static_cast<unsigned char>(selector >> 24));
        output_.push_back(static_cast<unsigned char>(selector >> 16));
        output_.push_back(static_cast<unsigned char>(selector >> 8));
        output_.push_back(static_cast<unsigned char>(selector));
    }
};

VALPOOL_NAMESPACE_END
