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
#include <optional>
#include <utility>

#include "../memmgr/page_frame_allocator.h"
#include "../memmgr/phys.h"
#include "config.h"
#include "encoded_ptr.hpp"
#include "slot.h"
#include "sub_table.hpp"
#include "tab_box.h"
#include "tab_id.hpp"
#include "tab_tracker.h"
#include "tab_type.h"
#include "table_config.h"

namespace ktab {
    namespace tab {

        class AnyTab;
        template <typename T> class Tab;

        /**
         * Process-wide registry mapping tab ids to kernel objects.
         *
         * Storage is a four level radix trie of pages taken from a page
         * frame allocator on demand. Slot addresses are minted by a counter
         * that only ever grows; freed slots are reused through a LIFO free
         * list whose head carries the full id (version included) so a
         * concurrent pop/push of the same slot cannot be mistaken for no
         * change.
         *
         * All bookkeeping is lock-free. The only operation that may block is
         * the page frame allocator itself.
         *
         * Pages are never given back, not even by the destructor; they
         * belong to the allocator's arena. A table must outlive every handle
         * into it.
         */
        class GlobalTable {
        public:
            struct Stats {
                uint64_t tabs_added = 0;
                uint64_t tabs_freed = 0;
                uint64_t tombs = 0;
                uint64_t free_list_pops = 0;
                uint64_t counter_mints = 0;
                uint64_t pages_allocated = 0;
                uint64_t page_races = 0;
                uint64_t alloc_failures = 0;
                uint64_t lookups = 0;
                uint64_t lookup_misses = 0;
            };

            /** Throws std::invalid_argument if `cfg` does not validate. */
            GlobalTable(memmgr::PageFrameAllocator& pfa,
                        const memmgr::PhysTranslator& xlat,
                        TableConfig cfg = TableConfig::from_env());

            GlobalTable(const GlobalTable&) = delete;
            GlobalTable& operator=(const GlobalTable&) = delete;

            /**
             * The kernel's table. Created on first use over the host physical
             * memory and never torn down.
             */
            static GlobalTable& get();

            /**
             * Stores `item` and returns the first handle to it. Empty if the
             * heap or the page frame allocator is exhausted, or if every slot
             * address has been used.
             */
            template <typename T>
            std::optional<Tab<T>> add(T item);

            /**
             * A new handle to the object `id` names, if it is still alive and
             * the slot has not been reused since `id` was issued.
             */
            std::optional<AnyTab> lookup_any(TabId id);
            std::optional<AnyTab> lookup_any(uint64_t raw_id);

            /** lookup_any restricted to objects of type T. */
            template <typename T>
            std::optional<Tab<T>> lookup(TabId id);
            template <typename T>
            std::optional<Tab<T>> lookup(uint64_t raw_id) {
                return lookup<T>(TabId::from_raw(raw_id));
            }

            /** The slot for `id`'s address, or nullptr if it was never minted. */
            Slot* try_get_slot(TabId id) const;

            /** The slot for `id`'s address, materializing pages as needed. */
            Slot* get_or_alloc_slot(TabId id);

            const TableConfig& config() const { return cfg_; }

            Stats get_stats() const;

            /** Installs a debug observer; nullptr removes it. Not owned. */
            void set_tracker(TabTracker* tracker) {
                tracker_.store(tracker, std::memory_order_release);
            }
            TabTracker* tracker() const {
                return tracker_.load(std::memory_order_acquire);
            }

            /** Number of slot addresses minted so far. */
            uint64_t minted() const {
                return counter_.load(std::memory_order_relaxed);
            }

        private:
            friend class AnyTab;
            template <typename> friend class Tab;

            struct Claimed {
                TabId id;
                Slot* slot;
            };

            std::optional<Claimed> claim_slot(TabBox* box, TabType ty);
            std::optional<Claimed> pop_free();
            std::optional<Claimed> mint();
            void push_free(TabId id, Slot* slot);

            // Handle reference counting
            void clone_user(TabId id, Slot* slot);
            void release_user(TabId id, Slot* slot);

            /** Last reference to `slot` is gone. */
            void free(TabId id, Slot* slot);

            memmgr::PageFrameAllocator& pfa_;
            const memmgr::PhysTranslator& xlat_;
            const TableConfig cfg_;

            std::atomic<uint64_t> counter_{0};
            std::atomic<uint64_t> last_free_{kNoFreeSlot};
            EncodedAtomicPtr<RootTable> root_;

            std::atomic<TabTracker*> tracker_{nullptr};
            mutable TableStats stats_;
            const PageEnv env_;
        };

    } // namespace tab
} // namespace ktab
