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

#include <rollup/execution/abi/abi_error.hpp>

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

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<rollup::SchemaError>::mapping> const &
quick_status_code_from_enum<rollup::SchemaError>::value_mappings()
{
    using rollup::SchemaError;

    static std::initializer_list<mapping> const v = {
        {SchemaError::Success, "success", {errc::success}},
        {SchemaError::MalformedJson, "malformed abi json", {}},
        {SchemaError::EventNotFound, "event not found", {}},
        {SchemaError::MalformedEntry, "malformed abi entry", {}},
        {SchemaError::UnsupportedType, "unsupported abi type", {}},
        {SchemaError::TooManyIndexed, "too many indexed fields", {}},
        {SchemaError::UnexpectedField, "unexpected event field", {}},
    };

    return v;
}

std::initializer_list<
    quick_status_code_from_enum<rollup::EventDecodeError>::mapping> const &
quick_status_code_from_enum<rollup::EventDecodeError>::value_mappings()
{
    using rollup::EventDecodeError;

    static std::initializer_list<mapping> const v = {
        {EventDecodeError::Success, "success", {errc::success}},
        {EventDecodeError::EmptyData,
         "empty data while arguments are expected",
         {}},
        {EventDecodeError::InputTooShort, "input too short", {}},
        {EventDecodeError::OffsetOutOfBounds, "offset out of bounds", {}},
        {EventDecodeError::ValueOutOfRange, "value out of range", {}},
        {EventDecodeError::TopicCountMismatch, "topic count mismatch", {}},
        {EventDecodeError::MissingField, "missing field", {}},
        {EventDecodeError::TypeMismatch, "type mismatch", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
