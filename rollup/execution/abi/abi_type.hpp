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
#include <rollup/core/int.hpp>
#include <rollup/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

ROLLUP_NAMESPACE_BEGIN

// Solidity elementary types that can appear in an event. Arrays, tuples and
// function types are not supported.
struct AbiType
{
    enum class Kind : uint8_t
    {
        Uint,
        Int,
        Address,
        Bool,
        FixedBytes,
        Bytes,
        String,
    };

    Kind kind;
    // width in bits for Uint/Int, in bytes for FixedBytes, zero otherwise
    uint16_t size{0};

    constexpr bool operator==(AbiType const &) const = default;

    constexpr bool is_dynamic() const noexcept
    {
        return kind == Kind::Bytes || kind == Kind::String;
    }

    // "uint256", "bytes32", ...; the form used in event signatures
    std::string canonical_name() const;
};

Result<AbiType> parse_abi_type(std::string_view);

// A decoded value. Signed integers keep their 256-bit two's complement word.
// bytesN is left-aligned in a bytes32_t, and an indexed bytes/string value is
// the keccak-256 hash from its topic.
using AbiValue =
    std::variant<bool, Address, uint256_t, bytes32_t, byte_string, std::string>;

ROLLUP_NAMESPACE_END
