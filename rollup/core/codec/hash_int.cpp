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

#include <rollup/core/codec/binary_codec.hpp>
#include <rollup/core/codec/hash_int.hpp>

#include <intx/intx.hpp>

#include <cstring>

ROLLUP_ANONYMOUS_NAMESPACE_BEGIN

uint256_t magnitude(int64_t const value) noexcept
{
    // negating in unsigned arithmetic keeps INT64_MIN well defined
    uint64_t const u = static_cast<uint64_t>(value);
    return value < 0 ? uint256_t{~u + 1} : uint256_t{u};
}

ROLLUP_ANONYMOUS_NAMESPACE_END

ROLLUP_NAMESPACE_BEGIN

bytes32_t address_to_hash(Address const &address)
{
    bytes32_t hash{};
    std::memcpy(
        hash.bytes + ADDRESS_PADDING, address.bytes, sizeof(address.bytes));
    return hash;
}

bytes32_t uint_to_hash(uint64_t const value)
{
    return to_bytes(uint256_t{value});
}

bytes32_t int_to_hash(int64_t const value)
{
    return to_bytes(magnitude(value));
}

bytes32_t hash_plus_int(bytes32_t const &hash, int64_t const delta)
{
    uint256_t const x = to_uint256(hash);
    uint256_t const d = magnitude(delta);
    if (delta >= 0) {
        // wraps modulo 2^256, the same as keeping the low 32 bytes
        return to_bytes(x + d);
    }
    return to_bytes(x >= d ? x - d : d - x);
}

ROLLUP_NAMESPACE_END
