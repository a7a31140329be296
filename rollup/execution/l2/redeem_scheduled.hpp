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
#include <rollup/core/bytes.hpp>
#include <rollup/core/config.hpp>
#include <rollup/core/int.hpp>
#include <rollup/core/result.hpp>
#include <rollup/execution/abi/event_decoder.hpp>
#include <rollup/execution/log.hpp>

#include <cstdint>
#include <string_view>

ROLLUP_NAMESPACE_BEGIN

// event RedeemScheduled(
//     bytes32 indexed ticketId,
//     bytes32 indexed retryTxHash,
//     uint64  indexed sequenceNum,
//     uint64          donatedGas,
//     address         gasDonor,
//     uint256         maxRefund,
//     uint256         submissionFeeRefund);
//
// Emitted by the retryable ticket precompile when a redeem is scheduled.
inline constexpr std::string_view REDEEM_SCHEDULED_EVENT = "RedeemScheduled";

struct RedeemScheduledEvent
{
    bytes32_t ticket_id{};
    bytes32_t retry_tx_hash{};
    uint64_t sequence_num{0};
    uint64_t donated_gas{0};
    Address gas_donor{};
    uint256_t max_refund{0};
    uint256_t submission_fee_refund{0};

    bool operator==(RedeemScheduledEvent const &) const = default;
};

class RedeemScheduledParser
{
    EventDecoder decoder_;

    explicit RedeemScheduledParser(EventDecoder);

public:
    // Fails with SchemaError if the ABI lacks the event or declares fields
    // with other names or types than the ones above
    static Result<RedeemScheduledParser> create(std::string_view abi_json);

    EventDecoder const &decoder() const noexcept
    {
        return decoder_;
    }

    Result<RedeemScheduledEvent> parse(Log const &) const;
};

ROLLUP_NAMESPACE_END
