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

#include <rollup/core/address.hpp>
#include <rollup/core/byte_string.hpp>
#include <rollup/core/bytes.hpp>
#include <rollup/core/int.hpp>
#include <rollup/execution/abi/abi_decode.hpp>
#include <rollup/execution/abi/abi_error.hpp>
#include <rollup/execution/abi/abi_type.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

using namespace rollup;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    using Kind = AbiType::Kind;

    constexpr AbiType uint64_type{Kind::Uint, 64};
    constexpr AbiType uint256_type{Kind::Uint, 256};
    constexpr AbiType int8_type{Kind::Int, 8};
    constexpr AbiType address_type{Kind::Address};
    constexpr AbiType bool_type{Kind::Bool};
    constexpr AbiType bytes4_type{Kind::FixedBytes, 4};
    constexpr AbiType bytes_type{Kind::Bytes};
    constexpr AbiType string_type{Kind::String};

    byte_string word(uint256_t const &n)
    {
        bytes32_t const b = to_bytes(n);
        return byte_string{b.bytes, sizeof(b.bytes)};
    }

    byte_string padded(byte_string const &payload)
    {
        byte_string out = payload;
        out.resize((payload.size() + 31) / 32 * 32, 0);
        return out;
    }
}

TEST(AbiDecodeWord, uint_range)
{
    auto const ok = abi_decode_word(uint64_type, to_bytes(uint256_t{42}));
    ASSERT_TRUE(ok);
    EXPECT_EQ(std::get<uint256_t>(ok.value()), 42);

    auto const max = abi_decode_word(
        uint64_type, to_bytes(uint256_t{0xffffffffffffffff}));
    ASSERT_TRUE(max);

    auto const over =
        abi_decode_word(uint64_type, to_bytes(uint256_t{1} << 64));
    ASSERT_TRUE(over.has_error());
    EXPECT_EQ(over.error(), EventDecodeError::ValueOutOfRange);

    auto const full = abi_decode_word(uint256_type, to_bytes(~uint256_t{0}));
    ASSERT_TRUE(full);
    EXPECT_EQ(std::get<uint256_t>(full.value()), ~uint256_t{0});
}

TEST(AbiDecodeWord, int_sign_extension)
{
    // -1 as int8 is 0xff..ff
    auto const minus_one = abi_decode_word(int8_type, to_bytes(~uint256_t{0}));
    ASSERT_TRUE(minus_one);
    EXPECT_EQ(std::get<uint256_t>(minus_one.value()), ~uint256_t{0});

    auto const positive = abi_decode_word(int8_type, to_bytes(uint256_t{127}));
    ASSERT_TRUE(positive);

    // 0x80 without sign extension is out of range for int8
    auto const unextended =
        abi_decode_word(int8_type, to_bytes(uint256_t{0x80}));
    ASSERT_TRUE(unextended.has_error());
    EXPECT_EQ(unextended.error(), EventDecodeError::ValueOutOfRange);

    auto const overflow = abi_decode_word(int8_type, to_bytes(uint256_t{256}));
    ASSERT_TRUE(overflow.has_error());
    EXPECT_EQ(overflow.error(), EventDecodeError::ValueOutOfRange);
}

TEST(AbiDecodeWord, address_takes_low_bytes)
{
    auto const word =
        0xffffffffffffffffffffffff5a1f9c8e3b7d2a6f4e0c1b9a8d7e6f5a4b3c2d1e_bytes32;
    auto const res = abi_decode_word(address_type, word);
    ASSERT_TRUE(res);
    EXPECT_EQ(
        std::get<Address>(res.value()),
        0x5a1f9c8e3b7d2a6f4e0c1b9a8d7e6f5a4b3c2d1e_address);
}

TEST(AbiDecodeWord, bool_values)
{
    EXPECT_EQ(
        std::get<bool>(abi_decode_word(bool_type, bytes32_t{}).value()),
        false);
    EXPECT_EQ(
        std::get<bool>(abi_decode_word(bool_type, bytes32_t{1}).value()),
        true);
    auto const res = abi_decode_word(bool_type, bytes32_t{2});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), EventDecodeError::ValueOutOfRange);
}

TEST(AbiDecodeWord, fixed_bytes_left_aligned)
{
    auto const word =
        0xdeadbeef00000000000000000000000000000000000000000000000000001234_bytes32;
    auto const res = abi_decode_word(bytes4_type, word);
    ASSERT_TRUE(res);
    EXPECT_EQ(
        std::get<bytes32_t>(res.value()),
        0xdeadbeef00000000000000000000000000000000000000000000000000000000_bytes32);
}

TEST(AbiDecodeWord, dynamic_type_is_mismatch)
{
    auto const res = abi_decode_word(bytes_type, bytes32_t{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), EventDecodeError::TypeMismatch);
}

TEST(AbiDecodeTopic, dynamic_type_is_hash)
{
    auto const topic =
        0x9b4e1c6a2d3f5e7081726354a5b6c7d8e9f00112233445566778899aabbccdd0_bytes32;
    auto const res = abi_decode_topic(string_type, topic);
    ASSERT_TRUE(res);
    EXPECT_EQ(std::get<bytes32_t>(res.value()), topic);
}

TEST(AbiDecodeTopic, bool_reads_last_byte)
{
    auto const one = abi_decode_topic(
        bool_type,
        0xff00000000000000000000000000000000000000000000000000000000000001_bytes32);
    ASSERT_TRUE(one);
    EXPECT_TRUE(std::get<bool>(one.value()));

    auto const two = abi_decode_topic(bool_type, bytes32_t{2});
    ASSERT_TRUE(two);
    EXPECT_FALSE(std::get<bool>(two.value()));

    auto const high = abi_decode_topic(bool_type, bytes32_t{0x100});
    ASSERT_TRUE(high);
    EXPECT_FALSE(std::get<bool>(high.value()));
}

TEST(AbiDecodeTopic, uint_keeps_range_check)
{
    auto const res =
        abi_decode_topic(uint64_type, to_bytes(uint256_t{1} << 64));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), EventDecodeError::ValueOutOfRange);
}

TEST(AbiDecodeArguments, static_values)
{
    std::vector<AbiType> const types{uint64_type, address_type, bool_type};
    byte_string const data = word(7) +
                             word(0x1111000000000000000000000000000000001111_u256) +
                             word(1);
    auto const res = abi_decode_arguments(types, data);
    ASSERT_TRUE(res);
    auto const &values = res.value();
    ASSERT_EQ(values.size(), 3);
    EXPECT_EQ(std::get<uint256_t>(values[0]), 7);
    EXPECT_EQ(
        std::get<Address>(values[1]),
        0x1111000000000000000000000000000000001111_address);
    EXPECT_TRUE(std::get<bool>(values[2]));
}

TEST(AbiDecodeArguments, dynamic_values)
{
    std::string const text = "retryable ticket";
    byte_string const blob{0x01, 0x02, 0x03};
    std::vector<AbiType> const types{bytes_type, uint64_type, string_type};

    // heads: offset(bytes), 5, offset(string); tails follow
    byte_string const data =
        word(3 * 32) + word(5) + word(5 * 32) + word(blob.size()) +
        padded(blob) + word(text.size()) +
        padded(byte_string{to_byte_string_view(text)});

    auto const res = abi_decode_arguments(types, data);
    ASSERT_TRUE(res);
    auto const &values = res.value();
    ASSERT_EQ(values.size(), 3);
    EXPECT_EQ(std::get<byte_string>(values[0]), blob);
    EXPECT_EQ(std::get<uint256_t>(values[1]), 5);
    EXPECT_EQ(std::get<std::string>(values[2]), text);
}

TEST(AbiDecodeArguments, empty_dynamic_value)
{
    std::vector<AbiType> const types{string_type};
    auto const res = abi_decode_arguments(types, word(32) + word(0));
    ASSERT_TRUE(res);
    EXPECT_TRUE(std::get<std::string>(res.value()[0]).empty());
}

TEST(AbiDecodeArguments, no_types_no_data)
{
    auto const res = abi_decode_arguments({}, {});
    ASSERT_TRUE(res);
    EXPECT_TRUE(res.value().empty());
}

TEST(AbiDecodeArguments, empty_data)
{
    std::vector<AbiType> const types{uint64_type};
    auto const res = abi_decode_arguments(types, {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), EventDecodeError::EmptyData);
}

TEST(AbiDecodeArguments, truncated_head)
{
    std::vector<AbiType> const types{uint64_type, uint64_type};
    byte_string const data = word(1) + word(2).substr(0, 31);
    auto const res = abi_decode_arguments(types, data);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), EventDecodeError::InputTooShort);
}

TEST(AbiDecodeArguments, offset_out_of_bounds)
{
    std::vector<AbiType> const types{bytes_type};
    for (uint256_t const offset :
         {uint256_t{32}, uint256_t{1000}, uint256_t{1} << 255}) {
        auto const res = abi_decode_arguments(types, word(offset));
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), EventDecodeError::OffsetOutOfBounds);
    }
}

TEST(AbiDecodeArguments, length_past_end)
{
    std::vector<AbiType> const types{bytes_type};
    for (uint256_t const length : {uint256_t{33}, ~uint256_t{0}}) {
        byte_string const data = word(32) + word(length) + word(0);
        auto const res = abi_decode_arguments(types, data);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), EventDecodeError::InputTooShort);
    }
}
