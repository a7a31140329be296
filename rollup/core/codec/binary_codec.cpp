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
#include <rollup/core/io/stream_error.hpp>
#include <rollup/core/likely.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <cstring>

ROLLUP_NAMESPACE_BEGIN

Result<bytes32_t> read_hash(ByteReader &reader)
{
    bytes32_t hash{};
    BOOST_OUTCOME_TRY(reader.read_full(hash.bytes, sizeof(hash.bytes)));
    return hash;
}

Result<void> write_hash(bytes32_t const &hash, ByteWriter &writer)
{
    return writer.write({hash.bytes, sizeof(hash.bytes)});
}

Result<Address> read_address(ByteReader &reader)
{
    Address address{};
    BOOST_OUTCOME_TRY(reader.read_full(address.bytes, sizeof(address.bytes)));
    return address;
}

Result<void> write_address(Address const &address, ByteWriter &writer)
{
    return writer.write({address.bytes, sizeof(address.bytes)});
}

Result<Address> read_address_padded256(ByteReader &reader)
{
    BOOST_OUTCOME_TRY(auto const word, read_hash(reader));
    Address address{};
    std::memcpy(
        address.bytes, word.bytes + ADDRESS_PADDING, sizeof(address.bytes));
    return address;
}

Result<void> write_address_padded256(Address const &address, ByteWriter &writer)
{
    static constexpr unsigned char padding[ADDRESS_PADDING]{};
    BOOST_OUTCOME_TRY(writer.write({padding, sizeof(padding)}));
    return write_address(address, writer);
}

Result<uint64_t> read_uint64(ByteReader &reader)
{
    unsigned char buf[sizeof(uint64_t)];
    BOOST_OUTCOME_TRY(reader.read_full(buf, sizeof(buf)));
    return intx::be::unsafe::load<uint64_t>(buf);
}

Result<void> write_uint64(uint64_t const value, ByteWriter &writer)
{
    unsigned char buf[sizeof(uint64_t)];
    intx::be::unsafe::store(buf, value);
    return writer.write({buf, sizeof(buf)});
}

Result<byte_string>
read_byte_string(ByteReader &reader, uint64_t const max_bytes_to_read)
{
    BOOST_OUTCOME_TRY(auto const size, read_uint64(reader));
    if (ROLLUP_UNLIKELY(size > max_bytes_to_read)) {
        return StreamError::SizeExceeded;
    }
    byte_string buf(static_cast<size_t>(size), 0);
    BOOST_OUTCOME_TRY(reader.read_full(buf.data(), buf.size()));
    return buf;
}

Result<void> write_byte_string(byte_string_view const value, ByteWriter &writer)
{
    BOOST_OUTCOME_TRY(write_uint64(value.size(), writer));
    return writer.write(value);
}

ROLLUP_NAMESPACE_END
