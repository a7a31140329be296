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

#include <rollup/core/assert.h>
#include <rollup/core/bytes.hpp>
#include <rollup/core/codec/binary_codec.hpp>
#include <rollup/execution/l2/address_alias.hpp>

#include <intx/intx.hpp>

#include <cstring>

ROLLUP_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint256_t ADDRESS_SPACE = uint256_t{1} << (8 * sizeof(Address));

uint256_t address_to_uint256(Address const &address)
{
    bytes32_t word{};
    std::memcpy(
        word.bytes + ADDRESS_PADDING, address.bytes, sizeof(address.bytes));
    return to_uint256(word);
}

// The sum is serialised to a full 32-byte word before the low 20 bytes are
// taken, so a value with leading zero bytes (e.g. the zero address) keeps
// its width and anything above bit 160 is dropped.
Address add_mod_address_space(Address const &address, uint256_t const &offset)
{
    uint256_t const sum = address_to_uint256(address) + offset;
    ROLLUP_DEBUG_ASSERT(sum < (ADDRESS_SPACE << 1));
    bytes32_t const word = to_bytes(sum);
    Address result{};
    std::memcpy(
        result.bytes, word.bytes + ADDRESS_PADDING, sizeof(result.bytes));
    return result;
}

ROLLUP_ANONYMOUS_NAMESPACE_END

ROLLUP_NAMESPACE_BEGIN

AddressAliasOffsets make_address_alias_offsets()
{
    uint256_t const offset = address_to_uint256(ADDRESS_ALIAS_OFFSET);
    ROLLUP_ASSERT(offset != 0 && offset < ADDRESS_SPACE);
    return AddressAliasOffsets{
        .offset = offset, .inverse_offset = ADDRESS_SPACE - offset};
}

Address remap_l1_address(
    AddressAliasOffsets const &offsets, Address const &l1_address)
{
    return add_mod_address_space(l1_address, offsets.offset);
}

Address inverse_remap_l1_address(
    AddressAliasOffsets const &offsets, Address const &l2_address)
{
    return add_mod_address_space(l2_address, offsets.inverse_offset);
}

ROLLUP_NAMESPACE_END
