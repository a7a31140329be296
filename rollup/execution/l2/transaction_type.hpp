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

#include <cstdint>

ROLLUP_NAMESPACE_BEGIN

// Typed-transaction tags (EIP-2718). The L2 tags share the tag space with
// Ethereum's and start at 0x64.
enum class TransactionType : uint8_t
{
    legacy = 0,
    eip2930 = 1,
    eip1559 = 2,
    eip4844 = 3,
    eip7702 = 4,
    arbitrum_deposit = 0x64,
    arbitrum_unsigned = 0x65,
    arbitrum_contract = 0x66,
    arbitrum_retry = 0x68,
    arbitrum_submit_retryable = 0x69,
    arbitrum_internal = 0x6a,
    arbitrum_legacy = 0x78,
};

// Whether the sender of a transaction with this tag is an L1 address that
// went through remap_l1_address(). Any tag not listed is false.
constexpr bool does_tx_type_alias(uint8_t const tx_type) noexcept
{
    switch (static_cast<TransactionType>(tx_type)) {
    case TransactionType::arbitrum_unsigned:
    case TransactionType::arbitrum_contract:
    case TransactionType::arbitrum_retry:
        return true;
    default:
        return false;
    }
}

constexpr bool does_tx_type_alias(TransactionType const tx_type) noexcept
{
    return does_tx_type_alias(static_cast<uint8_t>(tx_type));
}

ROLLUP_NAMESPACE_END
