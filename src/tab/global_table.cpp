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

#include "global_table.h"
#include "tab.hpp"
#include "../memmgr/host_phys_memory.h"
#include "../util/log.h"
#include "../util/panic.h"

#include <mutex>

namespace ktab {
    namespace tab {

        namespace {
            TableConfig validated(TableConfig cfg) {
                cfg.validate();
                return cfg;
            }
        }

        GlobalTable::GlobalTable(memmgr::PageFrameAllocator& pfa,
                                 const memmgr::PhysTranslator& xlat,
                                 TableConfig cfg)
            : pfa_(pfa),
              xlat_(xlat),
              cfg_(validated(cfg)),
              env_{pfa_, xlat_, tracker_, stats_} {
            debug() << "tab table created, tombstone threshold " << cfg_.max_version_before_tombstone
                    << (cfg_.zombie_tombs ? " (zombie tombs)" : "");
        }

        GlobalTable& GlobalTable::get() {
            static GlobalTable* instance = nullptr;
            static std::once_flag init_flag;
            std::call_once(init_flag, []() {
                memmgr::HostPhysMemory& mem = memmgr::HostPhysMemory::instance();
                instance = new GlobalTable(mem.allocator(), mem.translator(), TableConfig::from_env());
            });
            return *instance;
        }

        Slot* GlobalTable::try_get_slot(TabId id) const {
            RootTable* root = root_.load().get();
            if (!root) return nullptr;
            L1Table* l1 = root->entries[id.l0_index()].load().get();
            if (!l1) return nullptr;
            L2Table* l2 = l1->entries[id.l1_index()].load().get();
            if (!l2) return nullptr;
            SlotList* list = l2->entries[id.l2_index()].load().get();
            if (!list) return nullptr;
            return &list->slots[id.leaf_index()];
        }

        Slot* GlobalTable::get_or_alloc_slot(TabId id) {
            // A Tomb at any level means the subtree was retired; treat it as
            // unavailable just like an allocation failure.
            std::optional<Encoded<RootTable>> root = root_.get_or_alloc_default(env_, kRootLevel);
            if (!root || !root->is_live()) return nullptr;

            std::optional<Encoded<L1Table>> l1 =
                root->get()->entries[id.l0_index()].get_or_alloc_default(env_, kL1Level);
            if (!l1 || !l1->is_live()) return nullptr;

            std::optional<Encoded<L2Table>> l2 =
                l1->get()->entries[id.l1_index()].get_or_alloc_default(env_, kL2Level);
            if (!l2 || !l2->is_live()) return nullptr;

            std::optional<Encoded<SlotList>> list =
                l2->get()->entries[id.l2_index()].get_or_alloc_default(env_, kSlotListLevel);
            if (!list || !list->is_live()) return nullptr;

            return &list->get()->slots[id.leaf_index()];
        }

        std::optional<GlobalTable::Claimed> GlobalTable::pop_free() {
            uint64_t head = last_free_.load(std::memory_order_acquire);
            while (head != kNoFreeSlot) {
                Slot* slot = try_get_slot(TabId::from_raw(head));
                KTAB_DEBUG_ASSERT(slot != nullptr, "free list names a slot that was never minted");
                const uint64_t next = slot->next_free();
                if (last_free_.compare_exchange_weak(head, next, std::memory_order_acquire,
                                                     std::memory_order_acquire)) {
                    TableStats::bump(stats_.free_list_pops);
                    return Claimed{TabId::from_raw(head), slot};
                }
            }
            return std::nullopt;
        }

        std::optional<GlobalTable::Claimed> GlobalTable::mint() {
            const uint64_t n = counter_.fetch_add(1, std::memory_order_relaxed);
            if (n >= id_layout::kMaxSlotAddresses) {
                warn() << "tab table: all " << id_layout::kMaxSlotAddresses << " slot addresses are in use";
                return std::nullopt;
            }
            TableStats::bump(stats_.counter_mints);

            const TabId id = TabId::from_parts(n, 0);
            Slot* slot = get_or_alloc_slot(id);
            if (!slot) {
                // The address is lost; see "bounded leak" in DESIGN.md
                warn() << "tab table: out of memory materializing slot " << n;
                return std::nullopt;
            }
            return Claimed{id, slot};
        }

        std::optional<GlobalTable::Claimed> GlobalTable::claim_slot(TabBox* box, TabType ty) {
            std::optional<Claimed> c = pop_free();
            if (!c) {
                c = mint();
                if (!c) return std::nullopt;
            }

            const uint64_t ver = c->slot->claim_unchecked(box, ty, cfg_);
            c->id = c->id.with_version(ver);
            c->slot->set_first_user();

            TableStats::bump(stats_.tabs_added);
            if (TabTracker* t = tracker()) t->on_tab_add(c->id, ty);
            return c;
        }

        void GlobalTable::push_free(TabId id, Slot* slot) {
            const uint64_t raw = id.raw();
            uint64_t head = last_free_.load(std::memory_order_relaxed);
            do {
                slot->set_next_free(head);
            } while (!last_free_.compare_exchange_weak(head, raw, std::memory_order_release,
                                                       std::memory_order_relaxed));
        }

        void GlobalTable::clone_user(TabId id, Slot* slot) {
            const uint64_t now = slot->add_user();
            if (TabTracker* t = tracker()) t->on_user_add(id, now);
        }

        void GlobalTable::release_user(TabId id, Slot* slot) {
            const uint64_t prev = slot->remove_user();
            KTAB_DEBUG_ASSERT(prev != 0, "tab user count underflow");
            if (TabTracker* t = tracker()) t->on_user_remove(id, prev - 1);
            if (prev == 1) {
                free(id, slot);
            }
        }

        void GlobalTable::free(TabId id, Slot* slot) {
            KTAB_DEBUG_ASSERT(slot->lock_word() == 0, "tab freed while its lock is held");

            // Destroying the payload may drop further handles and free
            // other slots; that is fine, this slot has no users left.
            TabBox* box = slot->take_payload();
            delete box;

            const bool tomb = slot->free_and_check_tomb(cfg_);
            TableStats::bump(stats_.tabs_freed);
            if (TabTracker* t = tracker()) t->on_tab_free(id, tomb);

            if (tomb) {
                // TODO: reclaim SlotList pages whose slots are all tombstoned
                TableStats::bump(stats_.tombs);
                debug() << "tab table: slot " << id.slot_address() << " retired after "
                        << id.version() << " versions";
                return;
            }

            push_free(id.with_version(slot->version()), slot);
        }

        std::optional<AnyTab> GlobalTable::lookup_any(TabId id) {
            TableStats::bump(stats_.lookups);
            if (!id.is_dynamic()) {
                TableStats::bump(stats_.lookup_misses);
                return std::nullopt;
            }

            Slot* slot = try_get_slot(id);
            if (!slot || !slot->try_add_user()) {
                TableStats::bump(stats_.lookup_misses);
                return std::nullopt;
            }

            // The reference belongs to the slot's current occupant, so it is
            // taken and released under the occupant's id on every miss below
            const TabId current = id.with_version(slot->version());
            AnyTab tab(this, current, slot);
            if (TabTracker* t = tracker()) t->on_user_add(current, slot->users());

            if (slot->ty() == TabType::Free || current != id) {
                TableStats::bump(stats_.lookup_misses);
                return std::nullopt;
            }
            return std::optional<AnyTab>(std::move(tab));
        }

        std::optional<AnyTab> GlobalTable::lookup_any(uint64_t raw_id) {
            return lookup_any(TabId::from_raw(raw_id));
        }

        GlobalTable::Stats GlobalTable::get_stats() const {
            Stats s;
            s.tabs_added = stats_.tabs_added.load(std::memory_order_relaxed);
            s.tabs_freed = stats_.tabs_freed.load(std::memory_order_relaxed);
            s.tombs = stats_.tombs.load(std::memory_order_relaxed);
            s.free_list_pops = stats_.free_list_pops.load(std::memory_order_relaxed);
            s.counter_mints = stats_.counter_mints.load(std::memory_order_relaxed);
            s.pages_allocated = stats_.pages_allocated.load(std::memory_order_relaxed);
            s.page_races = stats_.page_races.load(std::memory_order_relaxed);
            s.alloc_failures = stats_.alloc_failures.load(std::memory_order_relaxed);
            s.lookups = stats_.lookups.load(std::memory_order_relaxed);
            s.lookup_misses = stats_.lookup_misses.load(std::memory_order_relaxed);
            return s;
        }

    } // namespace tab
} // namespace ktab
