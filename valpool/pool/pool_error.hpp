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

#include <valpool/pool/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

VALPOOL_POOL_NAMESPACE_BEGIN

enum class PoolError
{
    Success = 0,
    Unauthorized,
    InsufficientFunds,
    ZeroOrBelowMinimum,
    BondAlreadyExists,
    NoSuchBond,
    NotYetExpired,
    BondFinalized,
    UnknownCheckpoint,
    InvalidConfig,
};

VALPOOL_POOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<valpool::pool::PoolError>
    : quick_status_code_from_enum_defaults<valpool::pool::PoolError>
{
    static constexpr auto const domain_name = "Validator Pool Error";
    static constexpr auto const domain_uuid =
        "a3e9c5b2-71d4-4f08-9b6e-2c8f14d0e7a9";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
