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

#include <rollup/execution/l2/boundary_config.hpp>

#include <boost/outcome/try.hpp>

#include <evmc/hex.hpp>

#include <quill/Quill.h>

#include <utility>

ROLLUP_NAMESPACE_BEGIN

Result<BoundaryConfig> init_boundary_config(std::string_view const abi_json)
{
    BOOST_OUTCOME_TRY(
        auto redeem_scheduled, RedeemScheduledParser::create(abi_json));
    LOG_INFO(
        "boundary config ready: {} topic 0x{}",
        REDEEM_SCHEDULED_EVENT,
        evmc::hex(redeem_scheduled.decoder().schema().topic()));
    return BoundaryConfig{
        .alias_offsets = make_address_alias_offsets(),
        .redeem_scheduled = std::move(redeem_scheduled)};
}

ROLLUP_NAMESPACE_END
