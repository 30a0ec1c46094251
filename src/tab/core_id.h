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
#include <cstdint>

namespace ktab {
    namespace tab {

        using CoreIdFn = uint32_t (*)();

        // Returned by the dummy source installed during early boot
        constexpr uint32_t kDummyCoreId = 0xDEADDEAD;

        /**
         * Installs the function that identifies the executing core. Must
         * happen once, before any slot lock is taken; a second install is
         * a protocol violation in debug builds.
         *
         * Without an install the default source is used: every OS thread
         * is treated as its own core and receives a sequential id on first
         * use.
         */
        void install_core_id_fn(CoreIdFn fn);

        /** Installs a source that always reports kDummyCoreId. */
        void install_dummy_core_id_fn();

        /** Id of the executing core. Used only for lock affinity. */
        uint32_t current_core_id();

        /** The default per-thread source. */
        uint32_t thread_local_core_id();

    } // namespace tab
} // namespace ktab
