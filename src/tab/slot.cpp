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

#include "slot.h"
#include "../util/panic.h"

#include <thread>

namespace ktab {
    namespace tab {

        uint64_t Slot::claim_unchecked(TabBox* payload, TabType ty, const TableConfig& cfg) {
            KTAB_DEBUG_ASSERT(ty != TabType::Free, "cannot claim a slot as Free");

            const uint64_t old = ver_ty_.load(std::memory_order_acquire);
            KTAB_DEBUG_ASSERT(type_of(old) == TabType::Free, "claimed a slot that is not free");
            KTAB_DEBUG_ASSERT(users_.load(std::memory_order_relaxed) == 0, "claimed a slot that still has users");

            const uint64_t mask = cfg.zombie_tombs ? cfg.max_version_before_tombstone
                                                   : slot_layout::kVersionMask;
            const uint64_t ver = ((old & slot_layout::kVersionMask) + 1) & mask;
            if (!cfg.zombie_tombs) {
                // Version 0 is reserved for "never claimed"
                KTAB_DEBUG_ASSERT(ver != 0, "slot version overflowed without zombie tombs");
            }

            // The payload must be visible before the type says it is there
            data_.store(reinterpret_cast<uint64_t>(payload), std::memory_order_release);
            ver_ty_.store(ver | (uint64_t(ty) << slot_layout::kTypeShift), std::memory_order_release);
            return ver;
        }

        bool Slot::free_and_check_tomb(const TableConfig& cfg) {
            const uint64_t old = ver_ty_.load(std::memory_order_acquire);
            KTAB_DEBUG_ASSERT(type_of(old) != TabType::Free, "double free of a slot");

            const uint64_t ver = old & cfg.max_version_before_tombstone;
            ver_ty_.store(ver | (uint64_t(TabType::Free) << slot_layout::kTypeShift),
                          std::memory_order_release);
            return !cfg.zombie_tombs && ver == cfg.max_version_before_tombstone;
        }

        bool Slot::try_add_user() {
            uint64_t n = users_.load(std::memory_order_relaxed);
            while (n != 0) {
                if (users_.compare_exchange_weak(n, n + 1, std::memory_order_acquire,
                                                 std::memory_order_relaxed)) {
                    return true;
                }
            }
            return false;
        }

        bool Slot::try_lock_read() {
            uint64_t cur = lock_.load(std::memory_order_relaxed);
            for (;;) {
                if (cur & slot_layout::kWriterBit) {
                    return false;
                }
                if ((cur & slot_layout::kCountMask) == slot_layout::kCountMask) {
                    return false;
                }
                if (lock_.compare_exchange_weak(cur, cur + 1, std::memory_order_acquire,
                                                std::memory_order_relaxed)) {
                    return true;
                }
            }
        }

        void Slot::unlock_read() {
            const uint64_t prev = lock_.fetch_sub(1, std::memory_order_release);
            KTAB_DEBUG_ASSERT((prev & slot_layout::kWriterBit) == 0 &&
                              (prev & slot_layout::kCountMask) != 0,
                              "read unlock without a read lock");
            (void)prev;
        }

        bool Slot::try_lock_write(uint32_t core) {
            const uint64_t core_bits = uint64_t(core) << slot_layout::kCoreShift;
            uint64_t cur = lock_.load(std::memory_order_relaxed);
            for (;;) {
                const uint64_t count = cur & slot_layout::kCountMask;
                if (cur & slot_layout::kWriterBit) {
                    if ((cur & ~slot_layout::kWriterBit & ~slot_layout::kCountMask) != core_bits) {
                        return false;    // held by another core
                    }
                } else if (count != 0) {
                    return false;        // readers present
                }
                if (count == slot_layout::kCountMask) {
                    return false;
                }
                const uint64_t next = slot_layout::kWriterBit | core_bits | (count + 1);
                if (lock_.compare_exchange_weak(cur, next, std::memory_order_acquire,
                                                std::memory_order_relaxed)) {
                    return true;
                }
            }
        }

        void Slot::unlock_write() {
            uint64_t cur = lock_.load(std::memory_order_relaxed);
            for (;;) {
                KTAB_DEBUG_ASSERT((cur & slot_layout::kWriterBit) != 0, "write unlock without a write lock");
                const uint64_t next = (cur & slot_layout::kCountMask) == 1 ? 0 : cur - 1;
                if (lock_.compare_exchange_weak(cur, next, std::memory_order_release,
                                                std::memory_order_relaxed)) {
                    return;
                }
            }
        }

        void Slot::lock_read(uint32_t core) {
#ifndef NDEBUG
            const uint64_t cur = lock_.load(std::memory_order_relaxed);
            if ((cur & slot_layout::kWriterBit) &&
                ((cur >> slot_layout::kCoreShift) & 0xFFFFFFFFull) == core) {
                KTAB_PANIC("read lock requested by the core holding the write lock (deadlock)");
            }
#else
            (void)core;
#endif
            while (!try_lock_read()) {
                std::this_thread::yield();
            }
        }

        void Slot::lock_write(uint32_t core) {
            while (!try_lock_write(core)) {
                std::this_thread::yield();
            }
        }

    } // namespace tab
} // namespace ktab
