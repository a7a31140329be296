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

#include <rollup/core/assert.h>
#include <rollup/core/byte_string.hpp>
#include <rollup/core/config.hpp>
#include <rollup/core/int.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <algorithm>

ROLLUP_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

// right-aligned, as a big-endian number would be
inline bytes32_t to_bytes(byte_string_view const data)
{
    ROLLUP_ASSERT(data.size() <= sizeof(bytes32_t));
    bytes32_t byte{};
    std::copy_n(
        data.begin(),
        data.size(),
        byte.bytes + sizeof(bytes32_t) - data.size());
    return byte;
}

inline bytes32_t to_bytes(uint256_t const &n) noexcept
{
    return intx::be::store<bytes32_t>(n);
}

inline uint256_t to_uint256(bytes32_t const &b) noexcept
{
    return intx::be::load<uint256_t>(b);
}

ROLLUP_NAMESPACE_END
