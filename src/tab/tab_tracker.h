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
#include <atomic>
#include <cstdint>

#include "tab_id.hpp"
#include "tab_type.h"

namespace ktab {
    namespace tab {

        /**
         * Observer of table events, for debugging the object graph. Every
         * hook defaults to a no-op; a table with no tracker installed skips
         * the calls entirely.
         *
         * Hooks run inline on the lock-free paths and must not call back
         * into the table.
         */
        class TabTracker {
        public:
            virtual ~TabTracker() = default;

            virtual void on_tab_add(TabId, TabType) {}
            virtual void on_tab_free(TabId, bool /*tombstoned*/) {}
            virtual void on_user_add(TabId, uint64_t /*users_after*/) {}
            virtual void on_user_remove(TabId, uint64_t /*users_after*/) {}

            // level: 0 = root entry, 3 = SlotList page
            virtual void on_page_alloc(int /*level*/, const void* /*page*/) {}
            virtual void on_page_already_allocated(int /*level*/) {}

            virtual void on_lock_read_acquire(TabId) {}
            virtual void on_lock_read_release(TabId) {}
            virtual void on_lock_write_acquire(TabId) {}
            virtual void on_lock_write_release(TabId) {}
        };

        /** Logs every event at trace level. */
        class LoggingTabTracker : public TabTracker {
        public:
            void on_tab_add(TabId id, TabType ty) override;
            void on_tab_free(TabId id, bool tombstoned) override;
            void on_user_add(TabId id, uint64_t users_after) override;
            void on_user_remove(TabId id, uint64_t users_after) override;
            void on_page_alloc(int level, const void* page) override;
            void on_page_already_allocated(int level) override;
            void on_lock_read_acquire(TabId id) override;
            void on_lock_read_release(TabId id) override;
            void on_lock_write_acquire(TabId id) override;
            void on_lock_write_release(TabId id) override;
        };

        /**
         * Counters kept by every table. Relaxed; values are only
         * approximately consistent with each other under concurrency.
         */
        struct TableStats {
            std::atomic<uint64_t> tabs_added{0};
            std::atomic<uint64_t> tabs_freed{0};
            std::atomic<uint64_t> tombs{0};
            std::atomic<uint64_t> free_list_pops{0};
            std::atomic<uint64_t> counter_mints{0};
            std::atomic<uint64_t> pages_allocated{0};
            std::atomic<uint64_t> page_races{0};
            std::atomic<uint64_t> alloc_failures{0};
            std::atomic<uint64_t> lookups{0};
            std::atomic<uint64_t> lookup_misses{0};

            static void bump(std::atomic<uint64_t>& c) {
                c.fetch_add(1, std::memory_order_relaxed);
            }
        };

    } // namespace tab
} // namespace ktab
