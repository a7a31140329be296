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
#include <rollup/execution/abi/abi_decode.hpp>
#include <rollup/execution/abi/abi_error.hpp>
#include <rollup/execution/abi/event_decoder.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <optional>
#include <utility>

ROLLUP_NAMESPACE_BEGIN

AbiValue const *
DecodedEvent::find(std::string_view const field_name) const noexcept
{
    for (auto const &[name, value] : fields) {
        if (name == field_name) {
            return &value;
        }
    }
    return nullptr;
}

EventDecoder::EventDecoder(EventSchema schema)
    : schema_{std::move(schema)}
    , topic_{schema_.topic()}
{
    for (size_t i = 0; i < schema_.fields.size(); ++i) {
        EventField const &field = schema_.fields[i];
        if (field.indexed) {
            indexed_.push_back(i);
        }
        else {
            non_indexed_.push_back(i);
            non_indexed_types_.push_back(field.type);
        }
    }
    LOG_INFO(
        "bound decoder for {}: {} indexed, {} non-indexed fields",
        schema_.signature(),
        indexed_.size(),
        non_indexed_.size());
}

bool EventDecoder::matches(Log const &log) const noexcept
{
    return !schema_.anonymous && !log.topics.empty() &&
           log.topics.front() == topic_;
}

Result<DecodedEvent> EventDecoder::decode(Log const &log) const
{
    std::vector<std::optional<AbiValue>> values(schema_.fields.size());

    BOOST_OUTCOME_TRY(
        auto unpacked, abi_decode_arguments(non_indexed_types_, log.data));
    for (size_t i = 0; i < non_indexed_.size(); ++i) {
        values[non_indexed_[i]] = std::move(unpacked[i]);
    }

    size_t const first_topic = schema_.anonymous ? 0 : 1;
    if (ROLLUP_UNLIKELY(
            log.topics.size() != first_topic + indexed_.size())) {
        return EventDecodeError::TopicCountMismatch;
    }
    for (size_t i = 0; i < indexed_.size(); ++i) {
        size_t const field = indexed_[i];
        BOOST_OUTCOME_TRY(
            auto value,
            abi_decode_topic(
                schema_.fields[field].type, log.topics[first_topic + i]));
        values[field] = std::move(value);
    }

    DecodedEvent event{.name = schema_.name};
    event.fields.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        event.fields.emplace_back(
            schema_.fields[i].name, std::move(*values[i]));
    }
    return event;
}

ROLLUP_NAMESPACE_END
