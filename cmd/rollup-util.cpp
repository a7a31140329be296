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

#include <rollup/core/address.hpp>
#include <rollup/core/byte_string.hpp>
#include <rollup/core/bytes.hpp>
#include <rollup/core/likely.h>
#include <rollup/core/log_level_map.hpp>
#include <rollup/core/terminate_handler.h>
#include <rollup/execution/l2/address_alias.hpp>
#include <rollup/execution/l2/boundary_config.hpp>
#include <rollup/execution/l2/redeem_scheduled.hpp>
#include <rollup/execution/l2/transaction_type.hpp>
#include <rollup/execution/log.hpp>

#include <CLI/CLI.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <err.h>
#include <sysexits.h>

using namespace rollup;
namespace fs = std::filesystem;

namespace
{
    Address parse_address(std::string const &s)
    {
        auto const address = evmc::from_hex<Address>(s);
        if (ROLLUP_UNLIKELY(!address.has_value())) {
            errx(EX_USAGE, "invalid address: %s", s.c_str());
        }
        return *address;
    }

    std::string read_file(fs::path const &path)
    {
        std::ifstream in{path};
        if (ROLLUP_UNLIKELY(!in)) {
            errx(EX_NOINPUT, "could not open %s", path.c_str());
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        return std::move(buf).str();
    }

    int alias_main(std::string const &input, bool const inverse)
    {
        auto const offsets = make_address_alias_offsets();
        Address const address = parse_address(input);
        Address const result = inverse
                                   ? inverse_remap_l1_address(offsets, address)
                                   : remap_l1_address(offsets, address);
        std::printf("0x%s\n", evmc::hex(result).c_str());
        return EXIT_SUCCESS;
    }

    int tx_aliases_main(unsigned const tx_type)
    {
        if (ROLLUP_UNLIKELY(tx_type > UINT8_MAX)) {
            errx(EX_USAGE, "transaction type %u is not a single byte", tx_type);
        }
        bool const aliases = does_tx_type_alias(static_cast<uint8_t>(tx_type));
        std::printf("%s\n", aliases ? "true" : "false");
        return aliases ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int decode_redeem_main(
        fs::path const &abi_path, std::vector<std::string> const &topics,
        std::string const &data)
    {
        auto const config = init_boundary_config(read_file(abi_path));
        if (ROLLUP_UNLIKELY(config.has_error())) {
            LOG_CRITICAL(
                "failed to load {} from {}: {}",
                REDEEM_SCHEDULED_EVENT,
                abi_path,
                config.assume_error().message().c_str());
            quill::flush();
            return EX_CONFIG;
        }

        Log log;
        for (auto const &topic : topics) {
            auto const t = evmc::from_hex<bytes32_t>(topic);
            if (ROLLUP_UNLIKELY(!t.has_value())) {
                errx(EX_USAGE, "invalid topic: %s", topic.c_str());
            }
            log.topics.push_back(*t);
        }
        auto const bytes = evmc::from_hex(data);
        if (ROLLUP_UNLIKELY(!bytes.has_value())) {
            errx(EX_USAGE, "invalid data: %s", data.c_str());
        }
        log.data = byte_string{bytes->data(), bytes->size()};

        auto const &parser = config.value().redeem_scheduled;
        if (!parser.decoder().matches(log)) {
            LOG_WARNING(
                "first topic is not the {} signature",
                REDEEM_SCHEDULED_EVENT);
        }
        auto const event = parser.parse(log);
        if (ROLLUP_UNLIKELY(event.has_error())) {
            LOG_ERROR(
                "could not decode {}: {}",
                REDEEM_SCHEDULED_EVENT,
                event.assume_error().message().c_str());
            quill::flush();
            return EX_DATAERR;
        }

        auto const &e = event.value();
        std::fputs(
            std::format(
                "ticketId            0x{}\n"
                "retryTxHash         0x{}\n"
                "sequenceNum         {}\n"
                "donatedGas          {}\n"
                "gasDonor            0x{}\n"
                "maxRefund           {}\n"
                "submissionFeeRefund {}\n",
                evmc::hex(e.ticket_id),
                evmc::hex(e.retry_tx_hash),
                e.sequence_num,
                e.donated_gas,
                evmc::hex(e.gas_donor),
                intx::to_string(e.max_refund),
                intx::to_string(e.submission_fee_refund))
                .c_str(),
            stdout);
        return EXIT_SUCCESS;
    }
}

int main(int const argc, char const *argv[])
{
    rollup_set_terminate_handler();

    CLI::App cli{"L1/L2 boundary tool"};
    cli.option_defaults()->always_capture_default();

    auto log_level = quill::LogLevel::Warning;
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    std::string address;
    CLI::App *const alias_command = cli.add_subcommand(
        "alias", "print the L2 alias of an L1 contract address");
    alias_command->add_option("address", address, "L1 address")->required();

    CLI::App *const unalias_command = cli.add_subcommand(
        "unalias", "print the L1 address behind an aliased L2 address");
    unalias_command->add_option("address", address, "L2 address")->required();

    unsigned tx_type = 0;
    CLI::App *const tx_aliases_command = cli.add_subcommand(
        "tx-aliases",
        "exit successfully iff the sender of this transaction type is "
        "aliased");
    tx_aliases_command
        ->add_option("type", tx_type, "transaction type byte, e.g. 0x68")
        ->required();

    fs::path abi_path;
    std::vector<std::string> topics;
    std::string data;
    CLI::App *const decode_command = cli.add_subcommand(
        "decode-redeem", "decode a RedeemScheduled log from the command line");
    decode_command
        ->add_option("--abi", abi_path, "ArbRetryableTx contract abi json")
        ->required()
        ->check(CLI::ExistingFile);
    decode_command->add_option("--topic", topics, "log topic, in order")
        ->required();
    decode_command->add_option("--data", data, "hex encoded log data");

    cli.require_subcommand(1, 1);
    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    if (alias_command->parsed()) {
        return alias_main(address, false);
    }
    if (unalias_command->parsed()) {
        return alias_main(address, true);
    }
    if (tx_aliases_command->parsed()) {
        return tx_aliases_main(tx_type);
    }
    return decode_redeem_main(abi_path, topics, data);
}
