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
#include <rollup/execution/abi/abi_error.hpp>
#include <rollup/execution/abi/abi_type.hpp>

#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

ROLLUP_ANONYMOUS_NAMESPACE_BEGIN

// Parses the decimal suffix of "uint256", "bytes4", ... Returns 0 if the
// suffix is not a plain decimal number.
unsigned parse_suffix(std::string_view const suffix)
{
    if (suffix.empty() || suffix.front() == '0') {
        return 0;
    }
    unsigned n = 0;
    auto const [ptr, ec] =
        std::from_chars(suffix.data(), suffix.data() + suffix.size(), n);
    if (ec != std::errc{} || ptr != suffix.data() + suffix.size()) {
        return 0;
    }
    return n;
}

Result<AbiType>
parse_integer_type(AbiType::Kind const kind, std::string_view const suffix)
{
    if (suffix.empty()) {
        return AbiType{.kind = kind, .size = 256};
    }
    unsigned const bits = parse_suffix(suffix);
    if (ROLLUP_UNLIKELY(bits == 0 || bits > 256 || bits % 8 != 0)) {
        return SchemaError::UnsupportedType;
    }
    return AbiType{.kind = kind, .size = static_cast<uint16_t>(bits)};
}

ROLLUP_ANONYMOUS_NAMESPACE_END

ROLLUP_NAMESPACE_BEGIN

std::string AbiType::canonical_name() const
{
    switch (kind) {
    case Kind::Uint:
        return "uint" + std::to_string(size);
    case Kind::Int:
        return "int" + std::to_string(size);
    case Kind::Address:
        return "address";
    case Kind::Bool:
        return "bool";
    case Kind::FixedBytes:
        return "bytes" + std::to_string(size);
    case Kind::Bytes:
        return "bytes";
    case Kind::String:
        return "string";
    }
    std::unreachable();
}

Result<AbiType> parse_abi_type(std::string_view const name)
{
    using namespace std::literals;

    if (name == "address"sv) {
        return AbiType{.kind = AbiType::Kind::Address};
    }
    if (name == "bool"sv) {
        return AbiType{.kind = AbiType::Kind::Bool};
    }
    if (name == "string"sv) {
        return AbiType{.kind = AbiType::Kind::String};
    }
    if (name == "bytes"sv) {
        return AbiType{.kind = AbiType::Kind::Bytes};
    }
    if (name.starts_with("uint"sv)) {
        return parse_integer_type(AbiType::Kind::Uint, name.substr(4));
    }
    if (name.starts_with("int"sv)) {
        return parse_integer_type(AbiType::Kind::Int, name.substr(3));
    }
    if (name.starts_with("bytes"sv)) {
        unsigned const n = parse_suffix(name.substr(5));
        if (ROLLUP_UNLIKELY(n == 0 || n > sizeof(bytes32_t))) {
            return SchemaError::UnsupportedType;
        }
        return AbiType{
            .kind = AbiType::Kind::FixedBytes,
            .size = static_cast<uint16_t>(n)};
    }
    return SchemaError::UnsupportedType;
}

ROLLUP_NAMESPACE_END
