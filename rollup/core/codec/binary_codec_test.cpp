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
#include <rollup/core/codec/binary_codec.hpp>
#include <rollup/core/io/stream.hpp>
#include <rollup/core/io/stream_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace rollup;
using namespace evmc::literals;

namespace
{
    constexpr auto hash_a =
        0x9b4e1c6a2d3f5e7081726354a5b6c7d8e9f00112233445566778899aabbccdd0_bytes32;
    constexpr auto address_a = 0x5a1f9c8e3b7d2a6f4e0c1b9a8d7e6f5a4b3c2d1e_address;

    // accepts the first `budget` bytes, then fails every write
    class FailingWriter final : public ByteWriter
    {
        size_t budget_;

    public:
        explicit FailingWriter(size_t budget)
            : budget_{budget}
        {
        }

        Result<void> write(byte_string_view data) override
        {
            if (data.size() > budget_) {
                return StreamError::WriteFailure;
            }
            budget_ -= data.size();
            return outcome::success();
        }
    };

    template <typename F>
    byte_string encode(F &&f)
    {
        ByteStringWriter writer;
        auto const res = f(writer);
        EXPECT_TRUE(res);
        return writer.release();
    }

    // Every proper prefix of `enc` must fail to decode with ShortRead
    template <typename F>
    void expect_truncation_fails(byte_string const &enc, F &&decode)
    {
        for (size_t len = 0; len < enc.size(); ++len) {
            ByteStringReader reader{byte_string_view{enc}.substr(0, len)};
            auto const res = decode(reader);
            ASSERT_TRUE(res.has_error()) << "prefix length " << len;
            EXPECT_EQ(res.error(), StreamError::ShortRead);
        }
    }
}

TEST(BinaryCodec, hash)
{
    auto const enc = encode([](ByteWriter &w) { return write_hash(hash_a, w); });
    ASSERT_EQ(enc.size(), 32);
    EXPECT_EQ(enc, byte_string(hash_a.bytes, 32));

    ByteStringReader reader{enc};
    auto const res = read_hash(reader);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value(), hash_a);
    EXPECT_EQ(reader.remaining(), 0);

    expect_truncation_fails(enc, [](ByteReader &r) { return read_hash(r); });
}

TEST(BinaryCodec, address)
{
    auto const enc =
        encode([](ByteWriter &w) { return write_address(address_a, w); });
    ASSERT_EQ(enc.size(), 20);
    EXPECT_EQ(enc, byte_string(address_a.bytes, 20));

    ByteStringReader reader{enc};
    auto const res = read_address(reader);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value(), address_a);

    expect_truncation_fails(
        enc, [](ByteReader &r) { return read_address(r); });
}

TEST(BinaryCodec, address_padded256)
{
    auto const enc = encode(
        [](ByteWriter &w) { return write_address_padded256(address_a, w); });
    ASSERT_EQ(enc.size(), 32);
    EXPECT_EQ(enc.substr(0, 12), byte_string(12, 0));
    EXPECT_EQ(enc.substr(12), byte_string(address_a.bytes, 20));

    ByteStringReader reader{enc};
    auto const res = read_address_padded256(reader);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value(), address_a);

    expect_truncation_fails(
        enc, [](ByteReader &r) { return read_address_padded256(r); });
}

TEST(BinaryCodec, address_padded256_ignores_high_bytes)
{
    byte_string enc(12, 0xff);
    enc += byte_string(address_a.bytes, 20);

    ByteStringReader reader{enc};
    auto const res = read_address_padded256(reader);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value(), address_a);
}

TEST(BinaryCodec, uint64)
{
    auto const enc = encode(
        [](ByteWriter &w) { return write_uint64(0x0102030405060708, w); });
    EXPECT_EQ(
        enc, (byte_string{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08}));

    for (uint64_t const v :
         {uint64_t{0},
          uint64_t{1},
          uint64_t{0xff},
          uint64_t{0x100},
          std::numeric_limits<uint64_t>::max()}) {
        auto const e =
            encode([v](ByteWriter &w) { return write_uint64(v, w); });
        ByteStringReader reader{e};
        auto const res = read_uint64(reader);
        ASSERT_TRUE(res);
        EXPECT_EQ(res.value(), v);
    }

    expect_truncation_fails(
        enc, [](ByteReader &r) { return read_uint64(r); });
}

TEST(BinaryCodec, byte_string_empty)
{
    auto const enc = encode(
        [](ByteWriter &w) { return write_byte_string(byte_string{}, w); });
    EXPECT_EQ(enc, byte_string(8, 0));

    ByteStringReader reader{enc};
    auto const res = read_byte_string(reader, 0);
    ASSERT_TRUE(res);
    EXPECT_TRUE(res.value().empty());
}

TEST(BinaryCodec, byte_string_at_maximum)
{
    byte_string const payload(1024, 0x5c);
    auto const enc =
        encode([&](ByteWriter &w) { return write_byte_string(payload, w); });
    ASSERT_EQ(enc.size(), 8 + payload.size());
    EXPECT_EQ(
        enc.substr(0, 8),
        (byte_string{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x04, 0x00}));

    ByteStringReader reader{enc};
    auto const res = read_byte_string(reader, payload.size());
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value(), payload);
    EXPECT_EQ(reader.remaining(), 0);
}

TEST(BinaryCodec, byte_string_size_exceeded)
{
    byte_string const payload{0x01, 0x02, 0x03, 0x04};
    auto const enc =
        encode([&](ByteWriter &w) { return write_byte_string(payload, w); });

    ByteStringReader reader{enc};
    auto const res = read_byte_string(reader, payload.size() - 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StreamError::SizeExceeded);
    // only the length prefix was consumed
    EXPECT_EQ(reader.remaining(), payload.size());
}

TEST(BinaryCodec, byte_string_huge_declared_length)
{
    // no payload follows; must fail on the bound, not try to allocate
    byte_string const enc(8, 0xff);
    ByteStringReader reader{enc};
    auto const res = read_byte_string(reader, 1 << 20);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StreamError::SizeExceeded);
}

TEST(BinaryCodec, byte_string_truncated)
{
    byte_string const payload{0xca, 0xfe, 0xba, 0xbe};
    auto const enc =
        encode([&](ByteWriter &w) { return write_byte_string(payload, w); });

    expect_truncation_fails(
        enc, [](ByteReader &r) { return read_byte_string(r, 16); });
}

TEST(BinaryCodec, sequence_of_fields)
{
    ByteStringWriter writer;
    ASSERT_TRUE(write_uint64(42, writer));
    ASSERT_TRUE(write_address_padded256(address_a, writer));
    ASSERT_TRUE(write_byte_string(to_byte_string_view("retryable"), writer));
    ASSERT_TRUE(write_hash(hash_a, writer));

    ByteStringReader reader{writer.data()};
    EXPECT_EQ(read_uint64(reader).value(), 42);
    EXPECT_EQ(read_address_padded256(reader).value(), address_a);
    EXPECT_EQ(
        read_byte_string(reader, 64).value(),
        byte_string{to_byte_string_view("retryable")});
    EXPECT_EQ(read_hash(reader).value(), hash_a);
    EXPECT_EQ(reader.remaining(), 0);
}

TEST(BinaryCodec, write_failures_propagate)
{
    {
        FailingWriter writer{0};
        auto const res = write_hash(hash_a, writer);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), StreamError::WriteFailure);
    }
    {
        // padding accepted, address rejected
        FailingWriter writer{12};
        auto const res = write_address_padded256(address_a, writer);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), StreamError::WriteFailure);
    }
    {
        // length prefix accepted, payload rejected
        FailingWriter writer{8};
        auto const res =
            write_byte_string(to_byte_string_view("payload"), writer);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), StreamError::WriteFailure);
    }
    {
        FailingWriter writer{7};
        auto const res = write_uint64(7, writer);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), StreamError::WriteFailure);
    }
}
