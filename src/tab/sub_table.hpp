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
#include "config.h"
#include "encoded_ptr.hpp"
#include "slot.h"

namespace ktab {
    namespace tab {

        /**
         * Intermediate trie page: 512 lazily populated child pointers,
         * exactly one page.
         */
        template <typename Child>
        struct SubTable {
            EncodedAtomicPtr<Child> entries[geometry::kSubTableEntries];
        };

        // Trie shape: root page -> L1 page -> L2 page -> SlotList
        using L2Table = SubTable<SlotList>;
        using L1Table = SubTable<L2Table>;
        using RootTable = SubTable<L1Table>;

        static_assert(sizeof(L2Table) == geometry::kPageSize, "sub-table must fill exactly one page");
        static_assert(sizeof(L1Table) == geometry::kPageSize, "sub-table must fill exactly one page");
        static_assert(sizeof(RootTable) == geometry::kPageSize, "sub-table must fill exactly one page");

        // Levels as reported to the tracker
        constexpr int kRootLevel = 0;
        constexpr int kL1Level = 1;
        constexpr int kL2Level = 2;
        constexpr int kSlotListLevel = 3;

    } // namespace tab
} // namespace ktab
