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
#include <rollup/execution/abi/event_schema.hpp>

#include <boost/outcome/try.hpp>

#include <ethash/keccak.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <bit>
#include <optional>
#include <string>
#include <utility>

ROLLUP_ANONYMOUS_NAMESPACE_BEGIN

using json = nlohmann::json;

std::optional<std::string>
get_string(json const &object, char const *const key)
{
    auto const it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

json const *find_event(json const &abi, std::string_view const event_name)
{
    for (auto const &entry : abi) {
        if (!entry.is_object()) {
            continue;
        }
        if (get_string(entry, "type") == "event" &&
            get_string(entry, "name") == event_name) {
            return &entry;
        }
    }
    return nullptr;
}

Result<EventField> parse_field(json const &input)
{
    if (ROLLUP_UNLIKELY(!input.is_object())) {
        return SchemaError::MalformedEntry;
    }
    auto const type_name = get_string(input, "type");
    if (ROLLUP_UNLIKELY(!type_name.has_value())) {
        return SchemaError::MalformedEntry;
    }
    // unnamed fields are allowed
    auto name = get_string(input, "name").value_or("");

    bool indexed = false;
    if (auto const it = input.find("indexed"); it != input.end()) {
        if (ROLLUP_UNLIKELY(!it->is_boolean())) {
            return SchemaError::MalformedEntry;
        }
        indexed = it->get<bool>();
    }

    auto const type = parse_abi_type(*type_name);
    if (ROLLUP_UNLIKELY(type.has_error())) {
        LOG_WARNING(
            "field '{}' has unsupported abi type '{}'", name, *type_name);
        return SchemaError::UnsupportedType;
    }
    return EventField{
        .name = std::move(name), .type = type.value(), .indexed = indexed};
}

ROLLUP_ANONYMOUS_NAMESPACE_END

ROLLUP_NAMESPACE_BEGIN

std::string EventSchema::signature() const
{
    std::string sig = name;
    sig += '(';
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            sig += ',';
        }
        sig += fields[i].type.canonical_name();
    }
    sig += ')';
    return sig;
}

bytes32_t EventSchema::topic() const
{
    std::string const sig = signature();
    return std::bit_cast<bytes32_t>(ethash::keccak256(
        reinterpret_cast<uint8_t const *>(sig.data()), sig.size()));
}

Result<EventSchema> parse_event_schema(
    std::string_view const abi_json, std::string_view const event_name)
{
    json const doc = json::parse(abi_json, nullptr, false);
    if (ROLLUP_UNLIKELY(doc.is_discarded())) {
        LOG_WARNING("abi is not valid json");
        return SchemaError::MalformedJson;
    }

    json const *abi = &doc;
    if (doc.is_object()) {
        auto const it = doc.find("abi");
        if (it == doc.end()) {
            return SchemaError::MalformedJson;
        }
        abi = &*it;
    }
    if (ROLLUP_UNLIKELY(!abi->is_array())) {
        return SchemaError::MalformedJson;
    }

    json const *const entry = find_event(*abi, event_name);
    if (ROLLUP_UNLIKELY(entry == nullptr)) {
        LOG_WARNING("abi has no event named '{}'", event_name);
        return SchemaError::EventNotFound;
    }

    EventSchema schema{.name = std::string{event_name}};
    if (auto const it = entry->find("anonymous"); it != entry->end()) {
        if (ROLLUP_UNLIKELY(!it->is_boolean())) {
            return SchemaError::MalformedEntry;
        }
        schema.anonymous = it->get<bool>();
    }

    auto const inputs = entry->find("inputs");
    if (inputs != entry->end()) {
        if (ROLLUP_UNLIKELY(!inputs->is_array())) {
            return SchemaError::MalformedEntry;
        }
        for (auto const &input : *inputs) {
            BOOST_OUTCOME_TRY(auto field, parse_field(input));
            schema.fields.emplace_back(std::move(field));
        }
    }

    size_t indexed = 0;
    for (auto const &field : schema.fields) {
        indexed += field.indexed ? 1 : 0;
    }
    size_t const max_indexed = schema.anonymous
                                   ? EventSchema::MAX_INDEXED_ANONYMOUS
                                   : EventSchema::MAX_INDEXED;
    if (ROLLUP_UNLIKELY(indexed > max_indexed)) {
        LOG_WARNING(
            "event '{}' has {} indexed fields, at most {} allowed",
            event_name,
            indexed,
            max_indexed);
        return SchemaError::TooManyIndexed;
    }

    return schema;
}

ROLLUP_NAMESPACE_END
