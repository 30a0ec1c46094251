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

#include "config.h"

namespace ktab {
    namespace tab {

        /**
         * Runtime policy of one GlobalTable.
         *
         * max_version_before_tombstone must be 2^k - 1 with 1 <= k <= 29;
         * it doubles as the mask applied to a slot's version when it is
         * freed. A slot whose version reaches it is retired for good unless
         * zombie_tombs is set, in which case the version wraps to zero.
         */
        struct TableConfig {
            uint64_t max_version_before_tombstone = version_policy::kDefaultMaxVersion;
            bool zombie_tombs = version_policy::kZombieTombs;

            /** Throws std::invalid_argument if the threshold is not usable. */
            void validate() const;

            /**
             * Defaults plus environment overrides. KTAB_DEBUG_TOMBS=1 lowers
             * the threshold to 255, honoured in debug builds only.
             */
            static TableConfig from_env();

            /** Small threshold for exercising tombstones. */
            static TableConfig debug_tombs() {
                TableConfig c;
                c.max_version_before_tombstone = version_policy::kDebugMaxVersionBeforeTombstone;
                return c;
            }
        };

    } // namespace tab
} // namespace ktab
