/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <cstdio>
#include <cstdlib>
#include <execinfo.h>
#include <unistd.h>

#include "log.h"

namespace ktab {

    /**
     * Reports an unrecoverable protocol violation and aborts.
     * The message goes through the logger at SEVERE (when enabled) and
     * always to stderr together with a backtrace, since the logger may
     * be the thing that is broken.
     */
    [[noreturn]] inline void panic(const char* msg, const char* file, int line) {
        severe() << "panic at " << file << ":" << line << ": " << msg;
        std::fprintf(stderr, "ktab panic at %s:%d: %s\n", file, line, msg);
        void* bt[32];
        int n = ::backtrace(bt, 32);
        ::backtrace_symbols_fd(bt, n, STDERR_FILENO);
        std::abort();
    }

} // namespace ktab

#define KTAB_PANIC(msg) ::ktab::panic((msg), __FILE__, __LINE__)

// Debug-only precondition check. Compiled out in release builds, where the
// condition is not evaluated at all.
#ifdef NDEBUG
#define KTAB_DEBUG_ASSERT(cond, msg) ((void)0)
#else
#define KTAB_DEBUG_ASSERT(cond, msg) \
    do { if (!(cond)) ::ktab::panic("assertion failed: " #cond ": " msg, __FILE__, __LINE__); } while (0)
#endif
