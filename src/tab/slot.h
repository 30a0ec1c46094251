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

#include "config.h"
#include "table_config.h"
#include "tab_type.h"

namespace ktab {
    namespace tab {

        class TabBox;

        /**
         * One storage cell of the table. Exactly 32 bytes; a SlotList page
         * holds 128 of them.
         *
         * The meaning of `data` is determined by the type field of `ver_ty`:
         *   - type != Free: data is the TabBox* of the occupant
         *   - type == Free: data is the raw id of the next free slot (or
         *     kNoFreeSlot), valid while the slot sits on the free list
         *
         * An all-zero Slot is a Free slot that has never been claimed
         * (version 0). A Free slot whose version equals the table's
         * tombstone threshold is a Tomb and is never listed again.
         *
         * Lock word: [63] writer held, [62:31] owning core, [30:0] count.
         * The count is the writer's recursion depth while the writer bit is
         * set and the number of readers otherwise.
         */
        class Slot {
        public:
            Slot() = default;
            Slot(const Slot&) = delete;
            Slot& operator=(const Slot&) = delete;

            // ---- occupancy -------------------------------------------------

            TabType ty() const {
                return type_of(ver_ty_.load(std::memory_order_acquire));
            }

            uint64_t version() const {
                return ver_ty_.load(std::memory_order_acquire) & slot_layout::kVersionMask;
            }

            /**
             * Installs `payload` under tag `ty` and returns the new version.
             * The slot must be Free and exclusively owned by the caller
             * (just popped from the free list or freshly minted).
             */
            uint64_t claim_unchecked(TabBox* payload, TabType ty, const TableConfig& cfg);

            /**
             * Marks the slot Free, keeping its version masked by the
             * tombstone threshold. Returns true if the slot is now a Tomb.
             * Called once the last user is gone and the payload was taken.
             */
            bool free_and_check_tomb(const TableConfig& cfg);

            /** Removes the payload pointer; the caller now owns the box. */
            TabBox* take_payload() {
                return reinterpret_cast<TabBox*>(data_.exchange(0, std::memory_order_acq_rel));
            }

            TabBox* payload() const {
                return reinterpret_cast<TabBox*>(data_.load(std::memory_order_acquire));
            }

            // Free list link, only meaningful while the slot is Free
            uint64_t next_free() const {
                return data_.load(std::memory_order_relaxed);
            }
            void set_next_free(uint64_t raw_id) {
                data_.store(raw_id, std::memory_order_relaxed);
            }

            // ---- users -----------------------------------------------------

            uint64_t users() const {
                return users_.load(std::memory_order_relaxed);
            }

            /** Sets the count of a just-claimed slot; nobody else can see it yet. */
            void set_first_user() {
                users_.store(1, std::memory_order_release);
            }

            /** Clone of a held reference. Returns the count after the add. */
            uint64_t add_user() {
                return users_.fetch_add(1, std::memory_order_relaxed) + 1;
            }

            /**
             * Takes a reference only while at least one other exists, so a
             * slot whose count already reached zero is never resurrected.
             */
            bool try_add_user();

            /** Returns the count before the decrement. */
            uint64_t remove_user() {
                return users_.fetch_sub(1, std::memory_order_acq_rel);
            }

            // ---- lock ------------------------------------------------------

            bool try_lock_read();
            void unlock_read();
            bool try_lock_write(uint32_t core);
            void unlock_write();

            /** Spins until a read lock is held. Aborts in debug builds if
                this core holds the write lock. */
            void lock_read(uint32_t core);
            void lock_write(uint32_t core);

            uint64_t lock_word() const {
                return lock_.load(std::memory_order_relaxed);
            }

            static TabType type_of(uint64_t ver_ty) {
                return static_cast<TabType>(ver_ty >> slot_layout::kTypeShift);
            }

        private:
            std::atomic<uint64_t> data_{0};
            std::atomic<uint64_t> ver_ty_{0};
            std::atomic<uint64_t> users_{0};
            std::atomic<uint64_t> lock_{0};
        };

        static_assert(sizeof(Slot) == geometry::kSlotSize, "Slot must be exactly 32 bytes");

        /** Leaf page of the trie. */
        struct SlotList {
            Slot slots[geometry::kSlotsPerList];
        };

        static_assert(sizeof(SlotList) == geometry::kPageSize, "SlotList must fill exactly one page");

        /** Shared lock on a slot, released on destruction. */
        class SlotReadGuard {
        public:
            explicit SlotReadGuard(Slot* slot) : slot_(slot) {}
            ~SlotReadGuard() { if (slot_) slot_->unlock_read(); }

            SlotReadGuard(SlotReadGuard&& o) noexcept : slot_(o.slot_) { o.slot_ = nullptr; }
            SlotReadGuard(const SlotReadGuard&) = delete;
            SlotReadGuard& operator=(const SlotReadGuard&) = delete;
            SlotReadGuard& operator=(SlotReadGuard&&) = delete;

            static SlotReadGuard acquire(Slot& slot, uint32_t core) {
                slot.lock_read(core);
                return SlotReadGuard(&slot);
            }

            static std::optional<SlotReadGuard> try_acquire(Slot& slot) {
                if (!slot.try_lock_read()) return std::nullopt;
                return std::optional<SlotReadGuard>(std::in_place, &slot);
            }

        private:
            Slot* slot_;
        };

        /** Exclusive, reentrant-per-core lock on a slot, released on destruction. */
        class SlotWriteGuard {
        public:
            explicit SlotWriteGuard(Slot* slot) : slot_(slot) {}
            ~SlotWriteGuard() { if (slot_) slot_->unlock_write(); }

            SlotWriteGuard(SlotWriteGuard&& o) noexcept : slot_(o.slot_) { o.slot_ = nullptr; }
            SlotWriteGuard(const SlotWriteGuard&) = delete;
            SlotWriteGuard& operator=(const SlotWriteGuard&) = delete;
            SlotWriteGuard& operator=(SlotWriteGuard&&) = delete;

            static SlotWriteGuard acquire(Slot& slot, uint32_t core) {
                slot.lock_write(core);
                return SlotWriteGuard(&slot);
            }

            static std::optional<SlotWriteGuard> try_acquire(Slot& slot, uint32_t core) {
                if (!slot.try_lock_write(core)) return std::nullopt;
                return std::optional<SlotWriteGuard>(std::in_place, &slot);
            }

        private:
            Slot* slot_;
        };

    } // namespace tab
} // namespace ktab
