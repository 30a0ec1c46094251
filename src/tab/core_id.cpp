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

#include "core_id.h"
#include "../util/log.h"
#include "../util/panic.h"

#include <atomic>

namespace ktab {
    namespace tab {

        namespace {
            std::atomic<CoreIdFn> g_core_id_fn{nullptr};
            std::atomic<uint32_t> g_next_thread_core{0};

            uint32_t dummy_core_id() {
                return kDummyCoreId;
            }
        }

        uint32_t thread_local_core_id() {
            thread_local uint32_t id = g_next_thread_core.fetch_add(1, std::memory_order_relaxed);
            return id;
        }

        void install_core_id_fn(CoreIdFn fn) {
            KTAB_DEBUG_ASSERT(fn != nullptr, "core id function must not be null");
            CoreIdFn expected = nullptr;
            bool installed = g_core_id_fn.compare_exchange_strong(expected, fn, std::memory_order_acq_rel);
            KTAB_DEBUG_ASSERT(installed, "core id function installed twice");
            (void)installed;
            debug() << "core id function installed";
        }

        void install_dummy_core_id_fn() {
            install_core_id_fn(&dummy_core_id);
        }

        uint32_t current_core_id() {
            CoreIdFn fn = g_core_id_fn.load(std::memory_order_acquire);
            return fn ? fn() : thread_local_core_id();
        }

    } // namespace tab
} // namespace ktab
