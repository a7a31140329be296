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

#include <rollup/core/byte_string.hpp>
#include <rollup/core/bytes.hpp>
#include <rollup/core/config.hpp>
#include <rollup/core/result.hpp>
#include <rollup/execution/abi/abi_type.hpp>

#include <span>
#include <vector>

ROLLUP_NAMESPACE_BEGIN

// Decodes a single 32-byte word holding a static value. Integers and bools
// must be canonically padded (EventDecodeError::ValueOutOfRange otherwise);
// the high bytes of an address and the low bytes of a bytesN are ignored.
Result<AbiValue> abi_decode_word(AbiType const &, bytes32_t const &);

// An indexed field. Dynamic types are not recoverable from a topic, so their
// value is the topic hash itself. A bool topic is true iff its last byte is
// 1; the other bytes are not checked.
Result<AbiValue> abi_decode_topic(AbiType const &, bytes32_t const &);

// Decodes a tuple of values in head/tail layout, as found in a log's data:
// one 32-byte head word per value; a bytes/string head word is the offset of
// a length word followed by the payload.
Result<std::vector<AbiValue>>
abi_decode_arguments(std::span<AbiType const>, byte_string_view data);

ROLLUP_NAMESPACE_END
