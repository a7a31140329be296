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

#include <rollup/core/address.hpp>
#include <rollup/core/config.hpp>
#include <rollup/core/int.hpp>

#include <evmc/evmc.hpp>

ROLLUP_NAMESPACE_BEGIN

// Added to an L1 address when it acts as a caller inside L2, so that it can
// never collide with an L2-native address.
inline constexpr Address ADDRESS_ALIAS_OFFSET =
    evmc::literals::parse<evmc::address>(
        "0x1111000000000000000000000000000000001111");

// The aliasing transform works modulo 2^160
struct AddressAliasOffsets
{
    uint256_t offset;
    uint256_t inverse_offset; // 2^160 - offset
};

AddressAliasOffsets make_address_alias_offsets();

// (a + offset) mod 2^160
Address remap_l1_address(AddressAliasOffsets const &, Address const &);

// (a + inverse_offset) mod 2^160, the inverse of remap_l1_address
Address inverse_remap_l1_address(AddressAliasOffsets const &, Address const &);

ROLLUP_NAMESPACE_END
