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
#include <rollup/core/byte_string.hpp>
#include <rollup/core/bytes.hpp>
#include <rollup/core/config.hpp>
#include <rollup/core/io/stream.hpp>
#include <rollup/core/result.hpp>

#include <cstdint>

ROLLUP_NAMESPACE_BEGIN

// Fixed-width big-endian encoding of chain values over a byte stream.
//
//   Field kind               | Width  | Layout
//   -------------------------|--------|-----------------------------------
//   hash                     | 32     | raw bytes
//   address                  | 20     | raw bytes
//   address (256-bit padded) | 32     | 12 zero bytes, then 20 address bytes
//   uint64                   | 8      | big-endian
//   byte string              | 8 + n  | uint64 length n, then n raw bytes
//
// Every read consumes exactly its width and fails with
// StreamError::ShortRead if the stream ends first. Every write fails with
// StreamError::WriteFailure if the stream rejects it.

inline constexpr size_t ADDRESS_PADDING = sizeof(bytes32_t) - sizeof(Address);

Result<bytes32_t> read_hash(ByteReader &);
Result<void> write_hash(bytes32_t const &, ByteWriter &);

Result<Address> read_address(ByteReader &);
Result<void> write_address(Address const &, ByteWriter &);

// The padding is not checked on read; writers always zero it
Result<Address> read_address_padded256(ByteReader &);
Result<void> write_address_padded256(Address const &, ByteWriter &);

Result<uint64_t> read_uint64(ByteReader &);
Result<void> write_uint64(uint64_t, ByteWriter &);

// Fails with StreamError::SizeExceeded, having consumed only the length
// prefix, if the declared length is greater than max_bytes_to_read
Result<byte_string> read_byte_string(ByteReader &, uint64_t max_bytes_to_read);
Result<void> write_byte_string(byte_string_view, ByteWriter &);

ROLLUP_NAMESPACE_END
