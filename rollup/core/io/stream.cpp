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
#include <rollup/core/io/stream.hpp>
#include <rollup/core/io/stream_error.hpp>
#include <rollup/core/likely.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <unistd.h>

ROLLUP_NAMESPACE_BEGIN

Result<void> ByteReader::read_full(unsigned char *buf, size_t len)
{
    while (len > 0) {
        BOOST_OUTCOME_TRY(auto const n, read_some(buf, len));
        if (ROLLUP_UNLIKELY(n == 0)) {
            return StreamError::ShortRead;
        }
        ROLLUP_ASSERT(n <= len);
        buf += n;
        len -= n;
    }
    return outcome::success();
}

ByteStringReader::ByteStringReader(byte_string_view const data)
    : remaining_{data}
{
}

Result<size_t> ByteStringReader::read_some(unsigned char *buf, size_t len)
{
    size_t const n = std::min(len, remaining_.size());
    std::memcpy(buf, remaining_.data(), n);
    remaining_.remove_prefix(n);
    return n;
}

Result<void> ByteStringWriter::write(byte_string_view const data)
{
    buffer_ += data;
    return outcome::success();
}

byte_string ByteStringWriter::release() noexcept
{
    return std::exchange(buffer_, byte_string{});
}

FdReader::FdReader(int const fd)
    : fd_{fd}
{
    ROLLUP_ASSERT(fd_ >= 0);
}

Result<size_t> FdReader::read_some(unsigned char *buf, size_t len)
{
    while (true) {
        ssize_t const n = ::read(fd_, buf, len);
        if (ROLLUP_LIKELY(n >= 0)) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        LOG_ERROR("read from fd {} failed: {}", fd_, strerror(errno));
        return StreamError::ReadFailure;
    }
}

FdWriter::FdWriter(int const fd)
    : fd_{fd}
{
    ROLLUP_ASSERT(fd_ >= 0);
}

Result<void> FdWriter::write(byte_string_view data)
{
    while (!data.empty()) {
        ssize_t const n = ::write(fd_, data.data(), data.size());
        if (ROLLUP_UNLIKELY(n < 0)) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("write to fd {} failed: {}", fd_, strerror(errno));
            return StreamError::WriteFailure;
        }
        if (ROLLUP_UNLIKELY(n == 0)) {
            LOG_ERROR("write to fd {} made no progress", fd_);
            return StreamError::WriteFailure;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return outcome::success();
}

ROLLUP_NAMESPACE_END
