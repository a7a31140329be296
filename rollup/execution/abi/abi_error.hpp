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

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

ROLLUP_NAMESPACE_BEGIN

// Failures while loading an event schema. These happen once, at startup.
enum class SchemaError
{
    Success = 0,
    MalformedJson,
    EventNotFound,
    MalformedEntry,
    UnsupportedType,
    TooManyIndexed,
    UnexpectedField,
};

// Failures while decoding one log against a loaded schema
enum class EventDecodeError
{
    Success = 0,
    EmptyData,
    InputTooShort,
    OffsetOutOfBounds,
    ValueOutOfRange,
    TopicCountMismatch,
    MissingField,
    TypeMismatch,
};

ROLLUP_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<rollup::SchemaError>
    : quick_status_code_from_enum_defaults<rollup::SchemaError>
{
    static constexpr auto const domain_name = "Schema Error";
    static constexpr auto const domain_uuid =
        "c3f1a7d2-8e64-4b09-b5a3-2d7e9f0c1a86";

    static std::initializer_list<mapping> const &value_mappings();
};

template <>
struct quick_status_code_from_enum<rollup::EventDecodeError>
    : quick_status_code_from_enum_defaults<rollup::EventDecodeError>
{
    static constexpr auto const domain_name = "Event Decode Error";
    static constexpr auto const domain_uuid =
        "8a2d6e14-3c7b-4f5a-9e08-b1c4d7f2a359";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
