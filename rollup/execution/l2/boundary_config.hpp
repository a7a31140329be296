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
#include <rollup/core/result.hpp>
#include <rollup/execution/l2/address_alias.hpp>
#include <rollup/execution/l2/redeem_scheduled.hpp>

#include <string_view>

ROLLUP_NAMESPACE_BEGIN

// Process-wide state for the L1/L2 boundary, built once at startup and
// read-only afterwards
struct BoundaryConfig
{
    AddressAliasOffsets alias_offsets;
    RedeemScheduledParser redeem_scheduled;
};

// abi_json is the ArbRetryableTx contract ABI. A failure here is a startup
// configuration error and the caller is expected to exit.
Result<BoundaryConfig> init_boundary_config(std::string_view abi_json);

ROLLUP_NAMESPACE_END
