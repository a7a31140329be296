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
#include <rollup/core/bytes.hpp>
#include <rollup/core/config.hpp>

#include <cstdint>

ROLLUP_NAMESPACE_BEGIN

// Conversions between 64-bit integers and 32-byte big-endian words.
//
// The signed variants store the *magnitude* of the result: int_to_hash(-5)
// equals uint_to_hash(5), and hash_plus_int(h, d) is |h + d| reduced modulo
// 2^256. Sign information is lost; this is not two's complement.

bytes32_t address_to_hash(Address const &);

bytes32_t uint_to_hash(uint64_t);

bytes32_t int_to_hash(int64_t);

bytes32_t hash_plus_int(bytes32_t const &, int64_t);

ROLLUP_NAMESPACE_END
