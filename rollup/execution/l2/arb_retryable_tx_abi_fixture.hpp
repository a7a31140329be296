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

#include <string_view>

// Event section of the ArbRetryableTx precompile ABI (address 0x6e), used by
// the tests
inline constexpr std::string_view arb_retryable_tx_abi = R"([
  {
    "anonymous": false,
    "inputs": [
      {"indexed": true, "internalType": "bytes32", "name": "ticketId", "type": "bytes32"}
    ],
    "name": "Canceled",
    "type": "event"
  },
  {
    "anonymous": false,
    "inputs": [
      {"indexed": true, "internalType": "bytes32", "name": "ticketId", "type": "bytes32"},
      {"indexed": false, "internalType": "uint256", "name": "newTimeout", "type": "uint256"}
    ],
    "name": "LifetimeExtended",
    "type": "event"
  },
  {
    "anonymous": false,
    "inputs": [
      {"indexed": true, "internalType": "bytes32", "name": "ticketId", "type": "bytes32"},
      {"indexed": true, "internalType": "bytes32", "name": "retryTxHash", "type": "bytes32"},
      {"indexed": true, "internalType": "uint64", "name": "sequenceNum", "type": "uint64"},
      {"indexed": false, "internalType": "uint64", "name": "donatedGas", "type": "uint64"},
      {"indexed": false, "internalType": "address", "name": "gasDonor", "type": "address"},
      {"indexed": false, "internalType": "uint256", "name": "maxRefund", "type": "uint256"},
      {"indexed": false, "internalType": "uint256", "name": "submissionFeeRefund", "type": "uint256"}
    ],
    "name": "RedeemScheduled",
    "type": "event"
  },
  {
    "anonymous": false,
    "inputs": [
      {"indexed": true, "internalType": "bytes32", "name": "userTxHash", "type": "bytes32"}
    ],
    "name": "Redeemed",
    "type": "event"
  },
  {
    "anonymous": false,
    "inputs": [
      {"indexed": true, "internalType": "bytes32", "name": "ticketId", "type": "bytes32"}
    ],
    "name": "TicketCreated",
    "type": "event"
  },
  {
    "inputs": [
      {"internalType": "bytes32", "name": "ticketId", "type": "bytes32"}
    ],
    "name": "redeem",
    "outputs": [{"internalType": "bytes32", "name": "", "type": "bytes32"}],
    "stateMutability": "nonpayable",
    "type": "function"
  }
])";
