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

#include <rollup/core/bytes.hpp>
#include <rollup/core/config.hpp>
#include <rollup/core/result.hpp>
#include <rollup/execution/abi/abi_type.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

ROLLUP_NAMESPACE_BEGIN

struct EventField
{
    std::string name;
    AbiType type;
    bool indexed;
};

struct EventSchema
{
    static constexpr size_t MAX_INDEXED = 3;
    static constexpr size_t MAX_INDEXED_ANONYMOUS = 4;

    std::string name;
    bool anonymous{false};
    std::vector<EventField> fields; // declared order

    // e.g. "Transfer(address,address,uint256)"
    std::string signature() const;

    // keccak256(signature()), the first topic of a non-anonymous event
    bytes32_t topic() const;
};

// Loads the event named `event_name` from a contract ABI in the standard JSON
// format: either the ABI array itself or an object with an "abi" member. The
// first event with that name is used.
Result<EventSchema>
parse_event_schema(std::string_view abi_json, std::string_view event_name);

ROLLUP_NAMESPACE_END
