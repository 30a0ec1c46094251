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
#include <optional>
#include <type_traits>
#include <utility>

#include "../util/log.h"
#include "../util/panic.h"
#include "core_id.h"
#include "global_table.h"
#include "slot.h"
#include "tab_box.h"
#include "tab_id.hpp"
#include "tab_tracker.h"
#include "tab_type.h"

namespace ktab {
    namespace tab {

        namespace detail {
            // Reports lock acquire/release to the table's tracker, if any
            class LockTrace {
            public:
                LockTrace(TabTracker* t, TabId id, bool write) : t_(t), id_(id), write_(write) {
                    if (t_) write_ ? t_->on_lock_write_acquire(id_) : t_->on_lock_read_acquire(id_);
                }
                ~LockTrace() {
                    if (t_) write_ ? t_->on_lock_write_release(id_) : t_->on_lock_read_release(id_);
                }
                LockTrace(const LockTrace&) = delete;
                LockTrace& operator=(const LockTrace&) = delete;

            private:
                TabTracker* t_;
                TabId id_;
                bool write_;
            };
        }

        /**
         * Type-erased handle holding one reference to a table slot. Copying
         * takes another reference, destruction drops it. A moved-from
         * handle is empty.
         */
        class AnyTab {
        public:
            AnyTab(const AnyTab& o) : table_(o.table_), id_(o.id_), slot_(o.slot_) {
                if (slot_) table_->clone_user(id_, slot_);
            }

            AnyTab(AnyTab&& o) noexcept : table_(o.table_), id_(o.id_), slot_(o.slot_) {
                o.slot_ = nullptr;
            }

            AnyTab& operator=(AnyTab o) noexcept {
                std::swap(table_, o.table_);
                std::swap(id_, o.id_);
                std::swap(slot_, o.slot_);
                return *this;
            }

            ~AnyTab() {
                if (slot_) table_->release_user(id_, slot_);
            }

            TabId id() const { return id_; }
            TabType ty() const {
                KTAB_DEBUG_ASSERT(slot_ != nullptr, "type of an empty tab");
                return slot_->ty();
            }
            uint64_t use_count() const { return slot_ ? slot_->users() : 0; }
            explicit operator bool() const { return slot_ != nullptr; }

            /**
             * Recovers the typed handle. On a match the reference moves into
             * the result and this handle becomes empty; on a mismatch this
             * handle is left untouched.
             */
            template <typename T>
            std::optional<Tab<T>> try_into() &&;

        private:
            friend class GlobalTable;
            template <typename> friend class Tab;

            // Adopts a reference the caller already took
            AnyTab(GlobalTable* table, TabId id, Slot* slot) : table_(table), id_(id), slot_(slot) {}

            GlobalTable* table_;
            TabId id_;
            Slot* slot_;
        };

        /**
         * Typed handle to a T stored in the table. The payload is reached
         * only through with() / with_mut(), which hold the slot's lock for
         * the duration of the call.
         */
        template <typename T>
        class Tab {
        public:
            Tab(const Tab& o) : table_(o.table_), id_(o.id_), slot_(o.slot_) {
                if (slot_) table_->clone_user(id_, slot_);
            }

            Tab(Tab&& o) noexcept : table_(o.table_), id_(o.id_), slot_(o.slot_) {
                o.slot_ = nullptr;
            }

            Tab& operator=(Tab o) noexcept {
                std::swap(table_, o.table_);
                std::swap(id_, o.id_);
                std::swap(slot_, o.slot_);
                return *this;
            }

            ~Tab() {
                if (slot_) table_->release_user(id_, slot_);
            }

            TabId id() const { return id_; }
            uint64_t use_count() const { return slot_ ? slot_->users() : 0; }
            explicit operator bool() const { return slot_ != nullptr; }

            /** Calls f(const T&) under the slot's read lock and returns its result. */
            template <typename F>
            auto with(F&& f) const -> decltype(std::forward<F>(f)(std::declval<const T&>())) {
                KTAB_DEBUG_ASSERT(slot_ != nullptr, "with() on an empty tab");
                SlotReadGuard guard = SlotReadGuard::acquire(*slot_, current_core_id());
                detail::LockTrace trace(table_->tracker(), id_, false);
                const T& value = unbox<T>(slot_->payload());
                return std::forward<F>(f)(value);
            }

            /**
             * Calls f(T&) under the slot's write lock and returns its result.
             * The same core may nest with_mut() calls on one tab.
             */
            template <typename F>
            auto with_mut(F&& f) const -> decltype(std::forward<F>(f)(std::declval<T&>())) {
                KTAB_DEBUG_ASSERT(slot_ != nullptr, "with_mut() on an empty tab");
                SlotWriteGuard guard = SlotWriteGuard::acquire(*slot_, current_core_id());
                detail::LockTrace trace(table_->tracker(), id_, true);
                T& value = unbox<T>(slot_->payload());
                return std::forward<F>(f)(value);
            }

            /** Type erasure; the reference moves into the result. */
            AnyTab into_any() && {
                AnyTab any(table_, id_, slot_);
                slot_ = nullptr;
                return any;
            }

        private:
            friend class GlobalTable;
            friend class AnyTab;

            // T may still be incomplete where Tab<T> is a member of T itself,
            // so the check lives here rather than at class scope
            Tab(GlobalTable* table, TabId id, Slot* slot) : table_(table), id_(id), slot_(slot) {
                static_assert(is_tabbed_v<T>, "T must declare a non-Free kTabType");
            }

            GlobalTable* table_;
            TabId id_;
            Slot* slot_;
        };

        template <typename T>
        std::optional<Tab<T>> AnyTab::try_into() && {
            static_assert(is_tabbed_v<T>, "T must declare a non-Free kTabType");
            if (!slot_ || slot_->ty() != T::kTabType) {
                return std::nullopt;
            }
            Tab<T> typed(table_, id_, slot_);
            slot_ = nullptr;
            return std::optional<Tab<T>>(std::move(typed));
        }

        template <typename T>
        std::optional<Tab<T>> GlobalTable::add(T item) {
            static_assert(is_tabbed_v<T>, "T must declare a non-Free kTabType");

            TypedTabBox<T>* box = make_box(std::move(item));
            if (!box) {
                TableStats::bump(stats_.alloc_failures);
                warn() << "tab table: out of memory boxing a " << tab_type_name(T::kTabType);
                return std::nullopt;
            }

            std::optional<Claimed> c = claim_slot(box, T::kTabType);
            if (!c) {
                delete box;
                return std::nullopt;
            }
            return std::optional<Tab<T>>(Tab<T>(this, c->id, c->slot));
        }

        template <typename T>
        std::optional<Tab<T>> GlobalTable::lookup(TabId id) {
            std::optional<AnyTab> any = lookup_any(id);
            if (!any) {
                return std::nullopt;
            }
            return std::move(*any).template try_into<T>();
        }

    } // namespace tab
} // namespace ktab
