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

#include <rollup/core/terminate_handler.h>

#include <cxxabi.h>
#include <exception>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <typeinfo>
#include <unistd.h>

extern char const *__progname; // NOLINT(bugprone-reserved-identifier)

namespace
{
    void write_stderr(char const *const msg, size_t const len) noexcept
    {
        if (write(STDERR_FILENO, msg, len) == -1) {
            // Suppress warning
        }
    }

    template <typename... Args>
    void format_stderr(char const *const fmt, Args... args) noexcept
    {
        char buffer[4096];
        int const written = snprintf(buffer, sizeof(buffer), fmt, args...);
        if (written > 0 && (size_t)written < sizeof(buffer)) {
            write_stderr(buffer, (size_t)written);
        }
    }

    void rollup_terminate_handler_impl() noexcept
    {
        format_stderr("%s: std::terminate() called\n", __progname);

        std::type_info *const exception_type =
            abi::__cxa_current_exception_type();
        if (exception_type == nullptr) {
            char const *msg = "No active exception detected\n";
            write_stderr(msg, strlen(msg));
            abort();
        }

        char const *const exception_name = exception_type->name();
        int status = 0;
        char *const demangled =
            abi::__cxa_demangle(exception_name, nullptr, nullptr, &status);
        format_stderr(
            "Uncaught exception of type %s\n",
            (status == 0 && demangled != nullptr) ? demangled : exception_name);
        free(demangled);

        try {
            std::rethrow_exception(std::current_exception());
        }
        catch (std::exception const &e) {
            format_stderr("what(): %s\n", e.what());
        }
        catch (...) {
            char const *msg = "what(): <not a std::exception>\n";
            write_stderr(msg, strlen(msg));
        }
        abort();
    }
}

extern "C" void rollup_set_terminate_handler()
{
    std::set_terminate(rollup_terminate_handler_impl);
}
