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

#include <valpool/core/assert.h>
#include <valpool/core/config.hpp>

#include <cstddef>
#include <utility>
#include <vector>

VALPOOL_NAMESPACE_BEGIN

// A value with one copy per open checkpoint. A copy is taken the first time
// the value is mutated at a newer version than the one on top.
template <class T>
class VersionStack
{
    std::vector<std::pair<unsigned, T>> stack_{};

public:
    explicit VersionStack(T value, unsigned const version = 0)
    {
        stack_.emplace_back(version, std::move(value));
    }

    VersionStack(VersionStack &&) = default;
    VersionStack(VersionStack const &) = delete;
    VersionStack &operator=(VersionStack &&) = default;
    VersionStack &operator=(VersionStack const &) = delete;

    size_t depth() const noexcept
    {
        return stack_.size();
    }

    T const &recent() const
    {
        VALPOOL_ASSERT(!stack_.empty());
        return stack_.back().second;
    }

    T &current(unsigned const version)
    {
        VALPOOL_ASSERT(!stack_.empty());
        if (version > stack_.back().first) {
            T copy = stack_.back().second;
            stack_.emplace_back(version, std::move(copy));
        }
        return stack_.back().second;
    }

    void pop_accept(unsigned const version)
    {
        VALPOOL_ASSERT(version);
        VALPOOL_ASSERT(!stack_.empty());
        if (stack_.back().first != version) {
            return;
        }
        auto const size = stack_.size();
        if (size > 1 && stack_[size - 2].first + 1 == version) {
            stack_[size - 2].second = std::move(stack_.back().second);
            stack_.pop_back();
        }
        else {
            stack_.back().first = version - 1;
        }
    }

    void pop_reject(unsigned const version)
    {
        VALPOOL_ASSERT(version);
        VALPOOL_ASSERT(!stack_.empty());
        if (stack_.back().first == version) {
            stack_.pop_back();
        }
        // the base version is never rejected
        VALPOOL_ASSERT(!stack_.empty());
    }
};

VALPOOL_NAMESPACE_END
