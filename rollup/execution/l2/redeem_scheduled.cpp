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
#include <rollup/execution/abi/event_schema.hpp>
#include <rollup/execution/l2/redeem_scheduled.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <iterator>
#include <utility>

ROLLUP_ANONYMOUS_NAMESPACE_BEGIN

struct ExpectedField
{
    std::string_view name;
    AbiType type;
};

constexpr ExpectedField EXPECTED_FIELDS[] = {
    {"ticketId", {.kind = AbiType::Kind::FixedBytes, .size = 32}},
    {"retryTxHash", {.kind = AbiType::Kind::FixedBytes, .size = 32}},
    {"sequenceNum", {.kind = AbiType::Kind::Uint, .size = 64}},
    {"donatedGas", {.kind = AbiType::Kind::Uint, .size = 64}},
    {"gasDonor", {.kind = AbiType::Kind::Address}},
    {"maxRefund", {.kind = AbiType::Kind::Uint, .size = 256}},
    {"submissionFeeRefund", {.kind = AbiType::Kind::Uint, .size = 256}},
};

bool has_field(EventSchema const &schema, ExpectedField const &expected)
{
    return std::ranges::any_of(schema.fields, [&](EventField const &f) {
        return f.name == expected.name && f.type == expected.type;
    });
}

ROLLUP_ANONYMOUS_NAMESPACE_END

ROLLUP_NAMESPACE_BEGIN

RedeemScheduledParser::RedeemScheduledParser(EventDecoder decoder)
    : decoder_{std::move(decoder)}
{
}

Result<RedeemScheduledParser>
RedeemScheduledParser::create(std::string_view const abi_json)
{
    BOOST_OUTCOME_TRY(
        auto schema, parse_event_schema(abi_json, REDEEM_SCHEDULED_EVENT));
    for (auto const &expected : EXPECTED_FIELDS) {
        if (ROLLUP_UNLIKELY(!has_field(schema, expected))) {
            LOG_WARNING(
                "{} has no field '{} {}'",
                REDEEM_SCHEDULED_EVENT,
                expected.type.canonical_name(),
                expected.name);
            return SchemaError::UnexpectedField;
        }
    }
    if (ROLLUP_UNLIKELY(schema.fields.size() != std::size(EXPECTED_FIELDS))) {
        return SchemaError::UnexpectedField;
    }
    return RedeemScheduledParser{EventDecoder{std::move(schema)}};
}

Result<RedeemScheduledEvent>
RedeemScheduledParser::parse(Log const &log) const
{
    BOOST_OUTCOME_TRY(auto const event, decoder_.decode(log));

    RedeemScheduledEvent result;
    BOOST_OUTCOME_TRY(result.ticket_id, event.get<bytes32_t>("ticketId"));
    BOOST_OUTCOME_TRY(
        result.retry_tx_hash, event.get<bytes32_t>("retryTxHash"));
    BOOST_OUTCOME_TRY(result.sequence_num, event.get<uint64_t>("sequenceNum"));
    BOOST_OUTCOME_TRY(result.donated_gas, event.get<uint64_t>("donatedGas"));
    BOOST_OUTCOME_TRY(result.gas_donor, event.get<Address>("gasDonor"));
    BOOST_OUTCOME_TRY(result.max_refund, event.get<uint256_t>("maxRefund"));
    BOOST_OUTCOME_TRY(
        result.submission_fee_refund,
        event.get<uint256_t>("submissionFeeRefund"));
    return result;
}

ROLLUP_NAMESPACE_END
