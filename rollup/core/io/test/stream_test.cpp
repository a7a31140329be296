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

#include <rollup/core/byte_string.hpp>
#include <rollup/core/io/stream.hpp>
#include <rollup/core/io/stream_error.hpp>

#include <gtest/gtest.h>

#include <csignal>

#include <fcntl.h>
#include <unistd.h>

using namespace rollup;

namespace
{
    // hands out at most one byte per call, like a slow pipe
    class TrickleReader final : public ByteReader
    {
        ByteStringReader inner_;

    public:
        explicit TrickleReader(byte_string_view data)
            : inner_{data}
        {
        }

        Result<size_t> read_some(unsigned char *buf, size_t len) override
        {
            return inner_.read_some(buf, len == 0 ? 0 : 1);
        }
    };

    struct Pipe
    {
        int fds[2];

        Pipe()
        {
            EXPECT_EQ(::pipe(fds), 0);
        }

        ~Pipe()
        {
            for (int const fd : fds) {
                if (fd >= 0) {
                    ::close(fd);
                }
            }
        }

        void close_read_end()
        {
            ::close(fds[0]);
            fds[0] = -1;
        }

        void close_write_end()
        {
            ::close(fds[1]);
            fds[1] = -1;
        }
    };
}

TEST(ByteStringReader, read_full_exact)
{
    byte_string const data{0x01, 0x02, 0x03, 0x04};
    ByteStringReader reader{data};

    unsigned char buf[3]{};
    ASSERT_TRUE(reader.read_full(buf, sizeof(buf)));
    EXPECT_EQ(byte_string(buf, sizeof(buf)), (byte_string{0x01, 0x02, 0x03}));
    EXPECT_EQ(reader.remaining(), 1);
}

TEST(ByteStringReader, read_full_short)
{
    byte_string const data{0xaa, 0xbb};
    ByteStringReader reader{data};

    unsigned char buf[3]{};
    auto const res = reader.read_full(buf, sizeof(buf));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StreamError::ShortRead);
}

TEST(ByteStringReader, read_some_at_end)
{
    ByteStringReader reader{byte_string_view{}};
    unsigned char buf[1];
    auto const res = reader.read_some(buf, sizeof(buf));
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value(), 0);
}

TEST(ByteReader, read_full_loops_over_partial_reads)
{
    byte_string const data{0x10, 0x20, 0x30, 0x40, 0x50};
    TrickleReader reader{data};

    unsigned char buf[5]{};
    ASSERT_TRUE(reader.read_full(buf, sizeof(buf)));
    EXPECT_EQ(byte_string(buf, sizeof(buf)), data);

    auto const res = reader.read_full(buf, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StreamError::ShortRead);
}

TEST(ByteStringWriter, append_and_release)
{
    ByteStringWriter writer;
    ASSERT_TRUE(writer.write(byte_string{0x01}));
    ASSERT_TRUE(writer.write(byte_string{}));
    ASSERT_TRUE(writer.write(byte_string{0x02, 0x03}));
    EXPECT_EQ(writer.data(), (byte_string{0x01, 0x02, 0x03}));

    auto const released = writer.release();
    EXPECT_EQ(released, (byte_string{0x01, 0x02, 0x03}));
    EXPECT_TRUE(writer.data().empty());
}

TEST(FdStream, pipe_round_trip)
{
    Pipe p;
    FdWriter writer{p.fds[1]};
    FdReader reader{p.fds[0]};

    byte_string const data{0xde, 0xad, 0xbe, 0xef};
    ASSERT_TRUE(writer.write(data));
    p.close_write_end();

    unsigned char buf[4]{};
    ASSERT_TRUE(reader.read_full(buf, sizeof(buf)));
    EXPECT_EQ(byte_string(buf, sizeof(buf)), data);

    auto const res = reader.read_full(buf, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StreamError::ShortRead);
}

TEST(FdStream, write_to_closed_pipe)
{
    auto const previous = std::signal(SIGPIPE, SIG_IGN);

    Pipe p;
    p.close_read_end();
    FdWriter writer{p.fds[1]};

    auto const res = writer.write(byte_string{0x01, 0x02});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StreamError::WriteFailure);

    std::signal(SIGPIPE, previous);
}

TEST(FdStream, read_from_bad_descriptor)
{
    Pipe p;
    int const fd = p.fds[0];
    p.close_read_end();
    FdReader reader{fd};

    unsigned char buf[1];
    auto const res = reader.read_some(buf, sizeof(buf));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StreamError::ReadFailure);
}

TEST(FdStream, write_without_progress_terminates)
{
    int const fd = ::open("/dev/full", O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        GTEST_SKIP() << "/dev/full not available";
    }
    FdWriter writer{fd};

    auto const res = writer.write(byte_string(1 << 16, 0xab));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StreamError::WriteFailure);

    ::close(fd);
}
