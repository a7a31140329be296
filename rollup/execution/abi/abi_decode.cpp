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

#include <rollup/core/likely.h>
#include <rollup/execution/abi/abi_decode.hpp>
#include <rollup/execution/abi/abi_error.hpp>

#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <cstring>
#include <string>
#include <utility>

ROLLUP_ANONYMOUS_NAMESPACE_BEGIN

constexpr size_t WORD_SIZE = sizeof(bytes32_t);

bytes32_t load_word(byte_string_view const data, size_t const offset)
{
    bytes32_t word;
    std::memcpy(word.bytes, data.data() + offset, WORD_SIZE);
    return word;
}

Result<AbiValue> decode_uint(unsigned const bits, uint256_t const &value)
{
    if (bits < 256 && (value >> bits) != 0) {
        return EventDecodeError::ValueOutOfRange;
    }
    return AbiValue{value};
}

// the bits above the declared width must be copies of the sign bit
Result<AbiValue> decode_int(unsigned const bits, uint256_t const &value)
{
    if (bits < 256) {
        bool const negative = ((value >> (bits - 1)) & 1) != 0;
        uint256_t const high = value >> bits;
        uint256_t const expected =
            negative ? (~uint256_t{0} >> bits) : uint256_t{0};
        if (high != expected) {
            return EventDecodeError::ValueOutOfRange;
        }
    }
    return AbiValue{value};
}

// offset and length are untrusted 256-bit values
Result<byte_string_view>
decode_dynamic(byte_string_view const data, bytes32_t const &head)
{
    uint256_t const offset = to_uint256(head);
    if (ROLLUP_UNLIKELY(offset > data.size() - WORD_SIZE)) {
        return EventDecodeError::OffsetOutOfBounds;
    }
    size_t const start = static_cast<size_t>(offset) + WORD_SIZE;
    uint256_t const length = to_uint256(load_word(data, start - WORD_SIZE));
    if (ROLLUP_UNLIKELY(length > data.size() - start)) {
        return EventDecodeError::InputTooShort;
    }
    return data.substr(start, static_cast<size_t>(length));
}

ROLLUP_ANONYMOUS_NAMESPACE_END

ROLLUP_NAMESPACE_BEGIN

Result<AbiValue> abi_decode_word(AbiType const &type, bytes32_t const &word)
{
    using Kind = AbiType::Kind;

    switch (type.kind) {
    case Kind::Uint:
        return decode_uint(type.size, to_uint256(word));
    case Kind::Int:
        return decode_int(type.size, to_uint256(word));
    case Kind::Address: {
        Address address;
        std::memcpy(
            address.bytes,
            word.bytes + WORD_SIZE - sizeof(Address),
            sizeof(Address));
        return AbiValue{address};
    }
    case Kind::Bool: {
        uint256_t const value = to_uint256(word);
        if (ROLLUP_UNLIKELY(value > 1)) {
            return EventDecodeError::ValueOutOfRange;
        }
        return AbiValue{value == 1};
    }
    case Kind::FixedBytes: {
        bytes32_t value{};
        std::memcpy(value.bytes, word.bytes, type.size);
        return AbiValue{value};
    }
    case Kind::Bytes:
    case Kind::String:
        break;
    }
    return EventDecodeError::TypeMismatch;
}

Result<AbiValue> abi_decode_topic(AbiType const &type, bytes32_t const &topic)
{
    if (type.is_dynamic()) {
        return AbiValue{topic};
    }
    if (type.kind == AbiType::Kind::Bool) {
        return AbiValue{topic.bytes[WORD_SIZE - 1] == 1};
    }
    return abi_decode_word(type, topic);
}

Result<std::vector<AbiValue>> abi_decode_arguments(
    std::span<AbiType const> const types, byte_string_view const data)
{
    if (ROLLUP_UNLIKELY(data.empty() && !types.empty())) {
        return EventDecodeError::EmptyData;
    }

    std::vector<AbiValue> values;
    values.reserve(types.size());
    for (size_t i = 0; i < types.size(); ++i) {
        size_t const head_offset = i * WORD_SIZE;
        if (ROLLUP_UNLIKELY(head_offset + WORD_SIZE > data.size())) {
            return EventDecodeError::InputTooShort;
        }
        bytes32_t const head = load_word(data, head_offset);
        AbiType const &type = types[i];

        if (type.kind == AbiType::Kind::Bytes) {
            BOOST_OUTCOME_TRY(auto const payload, decode_dynamic(data, head));
            values.emplace_back(byte_string{payload});
        }
        else if (type.kind == AbiType::Kind::String) {
            BOOST_OUTCOME_TRY(auto const payload, decode_dynamic(data, head));
            values.emplace_back(std::string{
                reinterpret_cast<char const *>(payload.data()),
                payload.size()});
        }
        else {
            BOOST_OUTCOME_TRY(auto value, abi_decode_word(type, head));
            values.emplace_back(std::move(value));
        }
    }
    return values;
}

ROLLUP_NAMESPACE_END
