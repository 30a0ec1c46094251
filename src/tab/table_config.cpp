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

#include "table_config.h"
#include "../util/log.h"

#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace ktab {
    namespace tab {

        void TableConfig::validate() const {
            const uint64_t v = max_version_before_tombstone;
            if (v == 0 || v > version_policy::kMaxVersionBeforeTombstone) {
                throw std::invalid_argument("TableConfig: max_version_before_tombstone out of range: " +
                                            std::to_string(v));
            }
            if ((v & (v + 1)) != 0) {
                throw std::invalid_argument("TableConfig: max_version_before_tombstone must be 2^k - 1, got " +
                                            std::to_string(v));
            }
        }

        TableConfig TableConfig::from_env() {
            TableConfig c;
            const char* env = std::getenv(version_policy::kDebugTombsEnvVar);
            if (env && std::strcmp(env, "1") == 0) {
#ifndef NDEBUG
                c.max_version_before_tombstone = version_policy::kDebugMaxVersionBeforeTombstone;
                info() << version_policy::kDebugTombsEnvVar << " set, slots retire after "
                       << c.max_version_before_tombstone << " versions";
#else
                warn() << version_policy::kDebugTombsEnvVar << " ignored in release builds";
#endif
            }
            return c;
        }

    } // namespace tab
} // namespace ktab
