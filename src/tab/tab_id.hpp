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
         * TabId is the opaque 64-bit identifier of an object in the global
         * table.
         *
         * Layout: [63] dynamic marker, [62:29] slot address, [28:0] version
         *
         * The dynamic marker is always set for table-issued ids so they are
         * never confused with static ids the kernel hands out itself. The
         * slot address is split 9/9/9/7 into the indices of the four trie
         * levels. The version is bumped every time the slot is reused, which
         * is what lets a stale id be told apart from the slot's current
         * occupant.
         */
        class alignas(8) TabId {
        public:
            static constexpr uint64_t INVALID_RAW = ~uint64_t{0};

            // Default all special members to keep the class trivial
            TabId() = default;
            ~TabId() = default;
            TabId(const TabId&) = default;
            TabId& operator=(const TabId&) = default;
            TabId(TabId&&) = default;
            TabId& operator=(TabId&&) = default;

            static constexpr TabId from_raw(uint64_t v) {
                TabId t{};
                t.v_ = v;
                return t;
            }

            static constexpr TabId invalid() {
                return from_raw(INVALID_RAW);
            }

            /**
             * Builds the id of the `counter`th slot address ever minted, at
             * the given version.
             */
            static constexpr TabId from_parts(uint64_t slot_counter, uint64_t version) {
                return from_raw(id_layout::kDynamicBit |
                                ((slot_counter << id_layout::kVersionBits) & id_layout::kSlotAddrMask) |
                                (version & id_layout::kVersionMask));
            }

            constexpr uint64_t raw() const {
                return v_;
            }

            constexpr bool is_dynamic() const {
                return (v_ & id_layout::kDynamicBit) != 0;
            }

            constexpr bool valid() const {
                return v_ != INVALID_RAW && is_dynamic();
            }

            /** The 34-bit slot address (the counter value it was minted from). */
            constexpr uint64_t slot_address() const {
                return (v_ & id_layout::kSlotAddrMask) >> id_layout::kVersionBits;
            }

            constexpr uint64_t version() const {
                return v_ & id_layout::kVersionMask;
            }

            /** Same slot address, different version. */
            constexpr TabId with_version(uint64_t version) const {
                return from_raw((v_ & ~id_layout::kVersionMask) | (version & id_layout::kVersionMask));
            }

            // Trie indices
            constexpr uint32_t l0_index() const {
                return uint32_t((v_ >> id_layout::kL0Shift) & id_layout::kLevelMask);
            }
            constexpr uint32_t l1_index() const {
                return uint32_t((v_ >> id_layout::kL1Shift) & id_layout::kLevelMask);
            }
            constexpr uint32_t l2_index() const {
                return uint32_t((v_ >> id_layout::kL2Shift) & id_layout::kLevelMask);
            }
            constexpr uint32_t leaf_index() const {
                return uint32_t((v_ >> id_layout::kLeafShift) & id_layout::kLeafMask);
            }

            constexpr bool operator==(const TabId& o) const {
                return v_ == o.v_;
            }

            constexpr bool operator!=(const TabId& o) const {
                return v_ != o.v_;
            }

        private:
            uint64_t v_;  // No default member initializer to keep trivial
        }; // TabId

        static_assert(alignof(TabId) == 8, "TabId must be 8-byte aligned");
        static_assert(sizeof(TabId) == 8, "TabId must be exactly 8 bytes");

    } // namespace tab
} // namespace ktab
