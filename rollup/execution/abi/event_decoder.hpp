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

#include <rollup/core/config.hpp>
#include <rollup/core/int.hpp>
#include <rollup/core/likely.h>
#include <rollup/core/result.hpp>
#include <rollup/execution/abi/abi_error.hpp>
#include <rollup/execution/abi/abi_type.hpp>
#include <rollup/execution/abi/event_schema.hpp>
#include <rollup/execution/log.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

ROLLUP_NAMESPACE_BEGIN

struct DecodedEvent
{
    std::string name;
    std::vector<std::pair<std::string, AbiValue>> fields; // declared order

    AbiValue const *find(std::string_view) const noexcept;

    template <typename T>
    Result<T> get(std::string_view) const;
};

template <typename T>
Result<T> DecodedEvent::get(std::string_view const field_name) const
{
    AbiValue const *const value = find(field_name);
    if (ROLLUP_UNLIKELY(value == nullptr)) {
        return EventDecodeError::MissingField;
    }
    if constexpr (std::is_same_v<T, uint64_t>) {
        auto const *const n = std::get_if<uint256_t>(value);
        if (ROLLUP_UNLIKELY(n == nullptr)) {
            return EventDecodeError::TypeMismatch;
        }
        if (ROLLUP_UNLIKELY(*n > std::numeric_limits<uint64_t>::max())) {
            return EventDecodeError::ValueOutOfRange;
        }
        return static_cast<uint64_t>(*n);
    }
    else {
        auto const *const v = std::get_if<T>(value);
        if (ROLLUP_UNLIKELY(v == nullptr)) {
            return EventDecodeError::TypeMismatch;
        }
        return *v;
    }
}

// Decodes logs of one event. Built once from a schema; decode() is const and
// may be called concurrently.
class EventDecoder
{
    EventSchema schema_;
    bytes32_t topic_;
    std::vector<size_t> indexed_;
    std::vector<size_t> non_indexed_;
    std::vector<AbiType> non_indexed_types_;

public:
    explicit EventDecoder(EventSchema);

    EventSchema const &schema() const noexcept
    {
        return schema_;
    }

    // Whether the log's first topic is this event's signature hash. Always
    // false for anonymous events.
    bool matches(Log const &) const noexcept;

    // Non-indexed fields come from log.data; indexed fields, in declared
    // order, from log.topics starting at index 1 (0 for anonymous events).
    // The log must carry exactly one topic per indexed field after the
    // signature, otherwise EventDecodeError::TopicCountMismatch.
    Result<DecodedEvent> decode(Log const &) const;
};

ROLLUP_NAMESPACE_END
