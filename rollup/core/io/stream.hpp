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
#include <rollup/core/config.hpp>
#include <rollup/core/result.hpp>

#include <cstddef>
#include <cstdint>

ROLLUP_NAMESPACE_BEGIN

// A source of bytes. Implementations provide read_some(); callers that need
// an exact number of bytes use read_full(), which fails with
// StreamError::ShortRead if the source ends early.
class ByteReader
{
public:
    virtual ~ByteReader() = default;

    // Reads up to len bytes into buf. Returns the number of bytes read, which
    // is zero only at end of stream (or when len is zero).
    virtual Result<size_t> read_some(unsigned char *buf, size_t len) = 0;

    Result<void> read_full(unsigned char *buf, size_t len);
};

// A sink of bytes. write() either accepts every byte or fails with
// StreamError::WriteFailure.
class ByteWriter
{
public:
    virtual ~ByteWriter() = default;

    virtual Result<void> write(byte_string_view) = 0;
};

class ByteStringReader final : public ByteReader
{
    byte_string_view remaining_;

public:
    explicit ByteStringReader(byte_string_view);

    Result<size_t> read_some(unsigned char *buf, size_t len) override;

    size_t remaining() const noexcept
    {
        return remaining_.size();
    }
};

class ByteStringWriter final : public ByteWriter
{
    byte_string buffer_;

public:
    Result<void> write(byte_string_view) override;

    byte_string const &data() const noexcept
    {
        return buffer_;
    }

    byte_string release() noexcept;
};

// Non-owning wrappers around a POSIX file descriptor (file, pipe, socket)
class FdReader final : public ByteReader
{
    int fd_;

public:
    explicit FdReader(int fd);

    Result<size_t> read_some(unsigned char *buf, size_t len) override;
};

class FdWriter final : public ByteWriter
{
    int fd_;

public:
    explicit FdWriter(int fd);

    Result<void> write(byte_string_view) override;
};

ROLLUP_NAMESPACE_END
