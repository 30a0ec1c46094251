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
#include <new>
#include <optional>

#include "../memmgr/page_frame_allocator.h"
#include "../memmgr/phys.h"
#include "config.h"
#include "tab_tracker.h"

namespace ktab {
    namespace tab {

        /**
         * Everything the trie needs to materialize a page: where frames come
         * from, how to reach them, and who to tell.
         */
        struct PageEnv {
            memmgr::PageFrameAllocator& pfa;
            const memmgr::PhysTranslator& xlat;
            const std::atomic<TabTracker*>& tracker;
            TableStats& stats;

            TabTracker* observer() const {
                return tracker.load(std::memory_order_acquire);
            }
        };

        /** Decoded value of an EncodedAtomicPtr. */
        template <typename T>
        class Encoded {
        public:
            enum class State : uint8_t { Null, Tomb, Live };

            static Encoded null() { return Encoded(State::Null, nullptr); }
            static Encoded tomb() { return Encoded(State::Tomb, nullptr); }
            static Encoded live(T* p) { return Encoded(State::Live, p); }

            State state() const { return state_; }
            bool is_null() const { return state_ == State::Null; }
            bool is_tomb() const { return state_ == State::Tomb; }
            bool is_live() const { return state_ == State::Live; }

            /** The pointee; nullptr unless live. */
            T* get() const { return ptr_; }

        private:
            Encoded(State s, T* p) : state_(s), ptr_(p) {}

            State state_;
            T* ptr_;
        };

        /**
         * Atomic pointer to a page-sized T with three states: Null (never
         * allocated), Tomb (permanently retired) and Live.
         *
         * A zeroed word is Null, so a freshly allocated page of these is
         * valid as-is. The pointee, once live, is never freed.
         */
        template <typename T>
        class EncodedAtomicPtr {
            static_assert(sizeof(T) <= geometry::kPageSize, "pointee must fit in one page");

        public:
            static constexpr uint64_t kNull = 0;
            static constexpr uint64_t kTomb = ~uint64_t{0};

            EncodedAtomicPtr() = default;
            EncodedAtomicPtr(const EncodedAtomicPtr&) = delete;
            EncodedAtomicPtr& operator=(const EncodedAtomicPtr&) = delete;

            /** Current state. Never allocates. */
            Encoded<T> load() const {
                return decode(raw_.load(std::memory_order_acquire));
            }

            /**
             * Returns the live pointee, allocating and default-constructing
             * it if the pointer is still Null. A Tomb is returned as-is.
             *
             * If two cores race to allocate, the loser gives its page back
             * and adopts the winner's. Empty only when the page frame
             * allocator is out of memory.
             */
            std::optional<Encoded<T>> get_or_alloc_default(const PageEnv& env, int level) {
                uint64_t cur = raw_.load(std::memory_order_acquire);
                if (cur != kNull) {
                    if (cur != kTomb) {
                        if (TabTracker* t = env.observer()) t->on_page_already_allocated(level);
                    }
                    return decode(cur);
                }

                std::optional<memmgr::PhysAddr> frame = env.pfa.allocate();
                if (!frame) {
                    TableStats::bump(env.stats.alloc_failures);
                    return std::nullopt;
                }

                void* page = env.xlat.translate(*frame);
                T* fresh = new (page) T();

                uint64_t expected = kNull;
                if (raw_.compare_exchange_strong(expected, reinterpret_cast<uint64_t>(fresh),
                                                 std::memory_order_acq_rel,
                                                 std::memory_order_acquire)) {
                    TableStats::bump(env.stats.pages_allocated);
                    if (TabTracker* t = env.observer()) t->on_page_alloc(level, fresh);
                    return Encoded<T>::live(fresh);
                }

                // Lost the race
                fresh->~T();
                env.pfa.free(*frame);
                TableStats::bump(env.stats.page_races);
                if (TabTracker* t = env.observer()) t->on_page_already_allocated(level);
                return decode(expected);
            }

            /**
             * Retires a pointer that was never allocated. Returns false if
             * it is not Null.
             */
            bool retire() {
                uint64_t expected = kNull;
                return raw_.compare_exchange_strong(expected, kTomb, std::memory_order_acq_rel);
            }

        private:
            static Encoded<T> decode(uint64_t raw) {
                if (raw == kNull) return Encoded<T>::null();
                if (raw == kTomb) return Encoded<T>::tomb();
                return Encoded<T>::live(reinterpret_cast<T*>(raw));
            }

            std::atomic<uint64_t> raw_{kNull};
        };

        static_assert(sizeof(EncodedAtomicPtr<int>) == 8, "encoded pointers must be one word");

    } // namespace tab
} // namespace ktab
