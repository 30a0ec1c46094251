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

#include "tab_tracker.h"
#include "../util/log.h"

#include <cstdio>
#include <string>

namespace ktab {
    namespace tab {

        namespace {
            // Ids read best in hex: the version sits in the low bits
            std::string hex_id(TabId id) {
                char buf[24];
                std::snprintf(buf, sizeof(buf), "0x%016llx", static_cast<unsigned long long>(id.raw()));
                return buf;
            }
        }

        void LoggingTabTracker::on_tab_add(TabId id, TabType ty) {
            trace() << "tab add " << hex_id(id) << " type " << tab_type_name(ty)
                    << " version " << id.version();
        }

        void LoggingTabTracker::on_tab_free(TabId id, bool tombstoned) {
            trace() << "tab free " << hex_id(id) << (tombstoned ? " (tombstoned)" : "");
        }

        void LoggingTabTracker::on_user_add(TabId id, uint64_t users_after) {
            trace() << "tab user add " << hex_id(id) << " users " << users_after;
        }

        void LoggingTabTracker::on_user_remove(TabId id, uint64_t users_after) {
            trace() << "tab user remove " << hex_id(id) << " users " << users_after;
        }

        void LoggingTabTracker::on_page_alloc(int level, const void* page) {
            trace() << "tab page alloc level " << level << " at " << page;
        }

        void LoggingTabTracker::on_page_already_allocated(int level) {
            trace() << "tab page already allocated at level " << level;
        }

        void LoggingTabTracker::on_lock_read_acquire(TabId id) {
            trace() << "tab read lock " << hex_id(id);
        }

        void LoggingTabTracker::on_lock_read_release(TabId id) {
            trace() << "tab read unlock " << hex_id(id);
        }

        void LoggingTabTracker::on_lock_write_acquire(TabId id) {
            trace() << "tab write lock " << hex_id(id);
        }

        void LoggingTabTracker::on_lock_write_release(TabId id) {
            trace() << "tab write unlock " << hex_id(id);
        }

    } // namespace tab
} // namespace ktab
